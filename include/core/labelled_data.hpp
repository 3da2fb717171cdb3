/**
 * @file labelled_data.hpp
 * @brief Eigen vectors and matrices carrying asset / view labels
 *
 * Every vector and matrix exchanged between the market data layer,
 * the view model and the solver is indexed by label. Alignment is
 * always explicit: labels are compared, or permuted onto another
 * ordering of the same set, and any difference raises
 * DimensionMismatch. Nothing is dropped, padded or filled.
 */

#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace black_litterman
{

    /**
     * @struct LabelledVector
     * @brief Named vector indexed by unique labels
     *
     * Usage Example:
     * @code
     * LabelledVector w("market", {"A", "B"}, values);
     * double a = w.at("A");
     * LabelledVector reordered = w.align_to({"B", "A"});
     * @endcode
     */
    struct LabelledVector
    {
        std::string name;                ///< Series name ("market", "black_litterman", ...)
        std::vector<std::string> labels; ///< Unique labels, one per entry
        Eigen::VectorXd values;          ///< Values aligned to labels

        LabelledVector() = default;

        /**
         * @brief Construct and validate
         * @throws DimensionMismatch if labels and values differ in size
         * @throws std::invalid_argument if labels are not unique
         */
        LabelledVector(std::string name,
                       std::vector<std::string> labels,
                       Eigen::VectorXd values);

        size_t size() const { return labels.size(); }
        bool empty() const { return labels.empty(); }

        /**
         * @brief Position of a label
         * @throws DimensionMismatch if the label is absent
         */
        size_t index_of(const std::string &label) const;

        bool contains(const std::string &label) const;

        /**
         * @brief Value for a label
         * @throws DimensionMismatch if the label is absent
         */
        double at(const std::string &label) const;

        double sum() const { return values.sum(); }

        /**
         * @brief Permute onto another ordering of the same label set
         * @param target_labels Desired order
         * @return Reordered copy, same name
         * @throws DimensionMismatch if the label sets differ
         */
        LabelledVector align_to(const std::vector<std::string> &target_labels) const;

        /**
         * @brief Copy with a different series name
         */
        LabelledVector renamed(const std::string &new_name) const;

        nlohmann::json to_json() const;
    };

    /**
     * @struct LabelledMatrix
     * @brief Matrix with labelled rows and columns
     */
    struct LabelledMatrix
    {
        std::vector<std::string> row_labels; ///< Unique row labels
        std::vector<std::string> col_labels; ///< Unique column labels
        Eigen::MatrixXd values;              ///< rows x cols

        LabelledMatrix() = default;

        /**
         * @brief Construct and validate
         * @throws DimensionMismatch if label counts do not match the matrix shape
         * @throws std::invalid_argument if labels are not unique
         */
        LabelledMatrix(std::vector<std::string> row_labels,
                       std::vector<std::string> col_labels,
                       Eigen::MatrixXd values);

        /**
         * @brief Square matrix sharing one label set on both axes
         */
        static LabelledMatrix square(const std::vector<std::string> &labels,
                                     const Eigen::MatrixXd &values);

        /**
         * @brief Diagonal matrix from a labelled vector
         */
        static LabelledMatrix diagonal(const LabelledVector &diagonal_values);

        size_t rows() const { return row_labels.size(); }
        size_t cols() const { return col_labels.size(); }

        /**
         * @brief Value by row and column label
         * @throws DimensionMismatch if either label is absent
         */
        double at(const std::string &row, const std::string &col) const;

        /**
         * @brief Permute rows and columns onto new orderings of the same sets
         * @throws DimensionMismatch if either label set differs
         */
        LabelledMatrix align_to(const std::vector<std::string> &target_rows,
                                const std::vector<std::string> &target_cols) const;

        nlohmann::json to_json() const;
    };

    /**
     * @brief Order-sensitive label equality
     */
    bool same_labels(const std::vector<std::string> &lhs, const std::vector<std::string> &rhs);

    /**
     * @brief Throw DimensionMismatch unless the two label sequences are identical
     * @param what Description used in the error message
     */
    void require_same_labels(const std::vector<std::string> &expected,
                             const std::vector<std::string> &actual,
                             const std::string &what);

    /**
     * @brief Permutation mapping target order onto source positions
     *
     * Result[i] is the position of target[i] in source.
     *
     * @throws DimensionMismatch if the two sequences are not the same set
     */
    std::vector<Eigen::Index> permutation_onto(const std::vector<std::string> &source,
                                               const std::vector<std::string> &target,
                                               const std::string &what);

} // namespace black_litterman
