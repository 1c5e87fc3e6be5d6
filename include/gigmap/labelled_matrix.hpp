#pragma once

#include <cstddef>
#include <eigen3/Eigen/Core>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace gigmap
{

// Dense numeric matrix with one label per row and per column.
struct LabelledMatrix
{
    std::vector<std::string> row_labels;
    std::vector<std::string> col_labels;
    Eigen::MatrixXd          values;

    size_t rows() const { return row_labels.size(); }
    size_t cols() const { return col_labels.size(); }

    std::optional<size_t> row_position(const std::string& label) const;
    std::optional<size_t> col_position(const std::string& label) const;

    LabelledMatrix transposed() const;

    // Rows/columns in the requested order; labels not present are filled.
    LabelledMatrix reindexed(const std::vector<std::string>& rows,
                             const std::vector<std::string>& cols,
                             double fill = std::numeric_limits<double>::quiet_NaN()) const;

    // Like reindexed() but every label must exist. Throws DataError.
    LabelledMatrix subset(const std::vector<std::string>& rows,
                          const std::vector<std::string>& cols) const;
};

}   // namespace gigmap
