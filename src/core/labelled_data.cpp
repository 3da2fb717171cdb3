/**
 * @file labelled_data.cpp
 * @brief Implementation of labelled vectors and matrices
 */

#include "core/labelled_data.hpp"
#include "core/errors.hpp"
#include <map>
#include <set>
#include <utility>

namespace black_litterman
{

    namespace
    {
        void require_unique(const std::vector<std::string> &labels, const std::string &what)
        {
            std::set<std::string> seen;
            for (const auto &label : labels)
            {
                if (!seen.insert(label).second)
                {
                    throw std::invalid_argument("Duplicate " + what + " label: " + label);
                }
            }
        }

        std::string join(const std::vector<std::string> &labels)
        {
            std::string out = "[";
            for (size_t i = 0; i < labels.size(); ++i)
            {
                if (i > 0)
                {
                    out += ", ";
                }
                out += labels[i];
            }
            return out + "]";
        }
    } // namespace

    // ============================================================================
    // Label helpers
    // ============================================================================

    bool same_labels(const std::vector<std::string> &lhs, const std::vector<std::string> &rhs)
    {
        return lhs == rhs;
    }

    void require_same_labels(const std::vector<std::string> &expected,
                             const std::vector<std::string> &actual,
                             const std::string &what)
    {
        if (!same_labels(expected, actual))
        {
            throw DimensionMismatch(what + ": expected " + join(expected) + ", got " + join(actual));
        }
    }

    std::vector<Eigen::Index> permutation_onto(const std::vector<std::string> &source,
                                               const std::vector<std::string> &target,
                                               const std::string &what)
    {
        if (source.size() != target.size())
        {
            throw DimensionMismatch(what + ": cannot align " + join(source) + " onto " + join(target));
        }

        std::map<std::string, Eigen::Index> position;
        for (size_t i = 0; i < source.size(); ++i)
        {
            position[source[i]] = static_cast<Eigen::Index>(i);
        }

        std::vector<Eigen::Index> permutation;
        permutation.reserve(target.size());
        for (const auto &label : target)
        {
            auto it = position.find(label);
            if (it == position.end())
            {
                throw DimensionMismatch(what + ": label '" + label + "' missing from " + join(source));
            }
            permutation.push_back(it->second);
        }
        return permutation;
    }

    // ============================================================================
    // LabelledVector
    // ============================================================================

    LabelledVector::LabelledVector(std::string name,
                                   std::vector<std::string> labels,
                                   Eigen::VectorXd values)
        : name(std::move(name)), labels(std::move(labels)), values(std::move(values))
    {
        if (static_cast<Eigen::Index>(this->labels.size()) != this->values.size())
        {
            throw DimensionMismatch("vector '" + this->name + "' has " +
                                    std::to_string(this->labels.size()) + " labels but " +
                                    std::to_string(this->values.size()) + " values");
        }
        require_unique(this->labels, "vector");
    }

    size_t LabelledVector::index_of(const std::string &label) const
    {
        for (size_t i = 0; i < labels.size(); ++i)
        {
            if (labels[i] == label)
            {
                return i;
            }
        }
        throw DimensionMismatch("label '" + label + "' not found in vector '" + name + "'");
    }

    bool LabelledVector::contains(const std::string &label) const
    {
        for (const auto &l : labels)
        {
            if (l == label)
            {
                return true;
            }
        }
        return false;
    }

    double LabelledVector::at(const std::string &label) const
    {
        return values(static_cast<Eigen::Index>(index_of(label)));
    }

    LabelledVector LabelledVector::align_to(const std::vector<std::string> &target_labels) const
    {
        auto permutation = permutation_onto(labels, target_labels, "vector '" + name + "'");

        Eigen::VectorXd aligned(static_cast<Eigen::Index>(target_labels.size()));
        for (size_t i = 0; i < permutation.size(); ++i)
        {
            aligned(static_cast<Eigen::Index>(i)) = values(permutation[i]);
        }
        return LabelledVector(name, target_labels, aligned);
    }

    LabelledVector LabelledVector::renamed(const std::string &new_name) const
    {
        LabelledVector copy = *this;
        copy.name = new_name;
        return copy;
    }

    nlohmann::json LabelledVector::to_json() const
    {
        nlohmann::json values_json = nlohmann::json::object();
        for (size_t i = 0; i < labels.size(); ++i)
        {
            values_json[labels[i]] = values(static_cast<Eigen::Index>(i));
        }
        return nlohmann::json{{"name", name}, {"labels", labels}, {"values", values_json}};
    }

    // ============================================================================
    // LabelledMatrix
    // ============================================================================

    LabelledMatrix::LabelledMatrix(std::vector<std::string> row_labels,
                                   std::vector<std::string> col_labels,
                                   Eigen::MatrixXd values)
        : row_labels(std::move(row_labels)),
          col_labels(std::move(col_labels)),
          values(std::move(values))
    {
        if (static_cast<Eigen::Index>(this->row_labels.size()) != this->values.rows() ||
            static_cast<Eigen::Index>(this->col_labels.size()) != this->values.cols())
        {
            throw DimensionMismatch("matrix of shape " + std::to_string(this->values.rows()) + "x" +
                                    std::to_string(this->values.cols()) + " labelled with " +
                                    std::to_string(this->row_labels.size()) + " rows and " +
                                    std::to_string(this->col_labels.size()) + " columns");
        }
        require_unique(this->row_labels, "row");
        require_unique(this->col_labels, "column");
    }

    LabelledMatrix LabelledMatrix::square(const std::vector<std::string> &labels,
                                          const Eigen::MatrixXd &values)
    {
        return LabelledMatrix(labels, labels, values);
    }

    LabelledMatrix LabelledMatrix::diagonal(const LabelledVector &diagonal_values)
    {
        const Eigen::Index n = diagonal_values.values.size();
        Eigen::MatrixXd values = Eigen::MatrixXd::Zero(n, n);
        for (Eigen::Index i = 0; i < n; ++i)
        {
            values(i, i) = diagonal_values.values(i);
        }
        return LabelledMatrix(diagonal_values.labels, diagonal_values.labels, values);
    }

    double LabelledMatrix::at(const std::string &row, const std::string &col) const
    {
        Eigen::Index r = -1;
        Eigen::Index c = -1;
        for (size_t i = 0; i < row_labels.size(); ++i)
        {
            if (row_labels[i] == row)
            {
                r = static_cast<Eigen::Index>(i);
            }
        }
        for (size_t j = 0; j < col_labels.size(); ++j)
        {
            if (col_labels[j] == col)
            {
                c = static_cast<Eigen::Index>(j);
            }
        }
        if (r < 0 || c < 0)
        {
            throw DimensionMismatch("no matrix entry for (" + row + ", " + col + ")");
        }
        return values(r, c);
    }

    LabelledMatrix LabelledMatrix::align_to(const std::vector<std::string> &target_rows,
                                            const std::vector<std::string> &target_cols) const
    {
        auto row_perm = permutation_onto(row_labels, target_rows, "matrix rows");
        auto col_perm = permutation_onto(col_labels, target_cols, "matrix columns");

        Eigen::MatrixXd aligned(static_cast<Eigen::Index>(target_rows.size()),
                                static_cast<Eigen::Index>(target_cols.size()));
        for (size_t i = 0; i < row_perm.size(); ++i)
        {
            for (size_t j = 0; j < col_perm.size(); ++j)
            {
                aligned(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) =
                    values(row_perm[i], col_perm[j]);
            }
        }
        return LabelledMatrix(target_rows, target_cols, aligned);
    }

    nlohmann::json LabelledMatrix::to_json() const
    {
        nlohmann::json rows_json = nlohmann::json::array();
        for (Eigen::Index i = 0; i < values.rows(); ++i)
        {
            nlohmann::json row = nlohmann::json::array();
            for (Eigen::Index j = 0; j < values.cols(); ++j)
            {
                row.push_back(values(i, j));
            }
            rows_json.push_back(row);
        }
        return nlohmann::json{{"rows", row_labels}, {"columns", col_labels}, {"matrix", rows_json}};
    }

} // namespace black_litterman
