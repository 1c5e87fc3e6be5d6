#include <gigmap/error.hpp>
#include <gigmap/labelled_matrix.hpp>
#include <unordered_map>

namespace gigmap
{

namespace
{

std::unordered_map<std::string, size_t> position_map(const std::vector<std::string>& labels)
{
    std::unordered_map<std::string, size_t> pos;
    pos.reserve(labels.size());
    for (size_t i = 0; i < labels.size(); ++i)
        pos.emplace(labels[i], i);
    return pos;
}

}   // namespace

std::optional<size_t> LabelledMatrix::row_position(const std::string& label) const
{
    for (size_t i = 0; i < row_labels.size(); ++i)
    {
        if (row_labels[i] == label)
            return i;
    }
    return std::nullopt;
}

std::optional<size_t> LabelledMatrix::col_position(const std::string& label) const
{
    for (size_t i = 0; i < col_labels.size(); ++i)
    {
        if (col_labels[i] == label)
            return i;
    }
    return std::nullopt;
}

LabelledMatrix LabelledMatrix::transposed() const
{
    LabelledMatrix t;
    t.row_labels = col_labels;
    t.col_labels = row_labels;
    t.values     = values.transpose();
    return t;
}

LabelledMatrix LabelledMatrix::reindexed(const std::vector<std::string>& rows,
                                         const std::vector<std::string>& cols,
                                         double                          fill) const
{
    const auto row_pos = position_map(row_labels);
    const auto col_pos = position_map(col_labels);

    LabelledMatrix out;
    out.row_labels = rows;
    out.col_labels = cols;
    out.values     = Eigen::MatrixXd::Constant(static_cast<Eigen::Index>(rows.size()),
                                           static_cast<Eigen::Index>(cols.size()),
                                           fill);

    std::vector<long> src_col(cols.size(), -1);
    for (size_t j = 0; j < cols.size(); ++j)
    {
        auto it = col_pos.find(cols[j]);
        if (it != col_pos.end())
            src_col[j] = static_cast<long>(it->second);
    }

    for (size_t i = 0; i < rows.size(); ++i)
    {
        auto rit = row_pos.find(rows[i]);
        if (rit == row_pos.end())
            continue;
        const auto r = static_cast<Eigen::Index>(rit->second);
        for (size_t j = 0; j < cols.size(); ++j)
        {
            if (src_col[j] >= 0)
                out.values(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) =
                    values(r, src_col[j]);
        }
    }
    return out;
}

LabelledMatrix LabelledMatrix::subset(const std::vector<std::string>& rows,
                                      const std::vector<std::string>& cols) const
{
    const auto row_pos = position_map(row_labels);
    const auto col_pos = position_map(col_labels);
    for (const auto& r : rows)
    {
        if (row_pos.count(r) == 0)
            throw DataError("row '" + r + "' not found in matrix");
    }
    for (const auto& c : cols)
    {
        if (col_pos.count(c) == 0)
            throw DataError("column '" + c + "' not found in matrix");
    }
    return reindexed(rows, cols);
}

}   // namespace gigmap
