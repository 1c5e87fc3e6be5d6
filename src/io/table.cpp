#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <gigmap/error.hpp>
#include <gigmap/logger.hpp>
#include <gigmap/table.hpp>
#include <ostream>
#include <unordered_set>

#include "input_file.hpp"

namespace gigmap
{

// ─── Table ──────────────────────────────────────────────────────────────────

Table::Table(std::vector<std::string> columns, std::string source)
    : source_(std::move(source)), columns_(std::move(columns))
{
    for (size_t i = 0; i < columns_.size(); ++i)
    {
        if (!column_ix_.emplace(columns_[i], i).second)
        {
            throw DataError((source_.empty() ? std::string("table") : source_)
                            + " has duplicate column '" + columns_[i] + "'");
        }
    }
    data_.resize(columns_.size());
}

bool Table::has_column(const std::string& name) const
{
    return column_ix_.count(name) > 0;
}

size_t Table::column_position(const std::string& name) const
{
    auto it = column_ix_.find(name);
    if (it == column_ix_.end())
    {
        throw DataError((source_.empty() ? std::string("table") : source_)
                        + " does not contain column '" + name + "'");
    }
    return it->second;
}

const std::vector<std::string>& Table::column(const std::string& name) const
{
    return data_[column_position(name)];
}

std::vector<double> Table::numeric_column(const std::string& name) const
{
    const auto&         cells = column(name);
    std::vector<double> out;
    out.reserve(cells.size());
    for (size_t row = 0; row < cells.size(); ++row)
    {
        const std::string& s = cells[row];
        if (s.empty() || s == "NA" || s == "NaN" || s == "nan")
        {
            out.push_back(std::nan(""));
            continue;
        }
        char*  end = nullptr;
        double v   = std::strtod(s.c_str(), &end);
        while (end && *end && std::isspace(static_cast<unsigned char>(*end)))
            ++end;
        if (end == s.c_str() || (end && *end != '\0'))
        {
            throw DataError((source_.empty() ? std::string("table") : source_) + " column '"
                            + name + "' has non-numeric value '" + s + "' on row "
                            + std::to_string(row + 1));
        }
        out.push_back(v);
    }
    return out;
}

void Table::add_row(std::vector<std::string> cells)
{
    if (cells.size() != columns_.size())
    {
        throw DataError((source_.empty() ? std::string("table") : source_) + " row "
                        + std::to_string(rows_ + 1) + " has " + std::to_string(cells.size())
                        + " fields, expected " + std::to_string(columns_.size()));
    }
    for (size_t i = 0; i < cells.size(); ++i)
        data_[i].push_back(std::move(cells[i]));
    ++rows_;
}

void Table::add_row(std::string label, std::vector<std::string> cells)
{
    add_row(std::move(cells));
    row_labels_.push_back(std::move(label));
    has_index_ = true;
}

void Table::set_index(std::string name)
{
    has_index_  = true;
    index_name_ = std::move(name);
}

// ─── Parsing ────────────────────────────────────────────────────────────────

namespace
{

// Detect delimiter by scanning the header line.
char detect_delimiter(const std::string& line)
{
    int commas = 0, semicolons = 0, tabs = 0;
    for (char c : line)
    {
        if (c == ',')
            ++commas;
        else if (c == ';')
            ++semicolons;
        else if (c == '\t')
            ++tabs;
    }
    if (tabs > commas && tabs >= semicolons)
        return '\t';
    if (semicolons > commas)
        return ';';
    return ',';
}

void trim(std::string& field)
{
    while (!field.empty() && std::isspace(static_cast<unsigned char>(field.back())))
        field.pop_back();
    size_t start = 0;
    while (start < field.size() && std::isspace(static_cast<unsigned char>(field[start])))
        ++start;
    field.erase(0, start);
}

// Split a record by delimiter, respecting quoted fields ("" is a literal quote).
std::vector<std::string> split_record(const std::string& record, char delim)
{
    std::vector<std::string> fields;
    std::string              field;
    bool                     in_quotes = false;
    bool                     quoted    = false;

    for (size_t i = 0; i < record.size(); ++i)
    {
        char c = record[i];
        if (c == '"')
        {
            if (in_quotes && i + 1 < record.size() && record[i + 1] == '"')
            {
                field += '"';
                ++i;
            }
            else
            {
                in_quotes = !in_quotes;
                quoted    = true;
            }
        }
        else if (c == delim && !in_quotes)
        {
            if (!quoted)
                trim(field);
            fields.push_back(std::move(field));
            field.clear();
            quoted = false;
        }
        else
        {
            field += c;
        }
    }
    if (!quoted)
        trim(field);
    fields.push_back(std::move(field));
    return fields;
}

enum class IndexMode
{
    None,
    Named,
    First,
};

Table read_table_impl(InputFile& input, IndexMode mode, const std::string& index_col)
{
    const std::string& path = input.path();
    std::string        record;

    // Header: first non-blank record
    bool have_header = false;
    while (input.get_record(record))
    {
        if (!record.empty())
        {
            have_header = true;
            break;
        }
    }
    if (!have_header)
    {
        throw DataError("file is empty: " + path);
    }

    const char delim  = detect_delimiter(record);
    auto       header = split_record(record, delim);

    size_t index_pos = header.size();
    if (mode == IndexMode::Named)
    {
        auto it = std::find(header.begin(), header.end(), index_col);
        if (it == header.end())
        {
            throw DataError(path + " does not contain column '" + index_col + "'");
        }
        index_pos = static_cast<size_t>(it - header.begin());
    }
    else if (mode == IndexMode::First)
    {
        index_pos = 0;
    }

    std::vector<std::string> columns;
    for (size_t i = 0; i < header.size(); ++i)
    {
        if (i != index_pos)
            columns.push_back(header[i]);
    }

    Table table(std::move(columns), path);
    if (index_pos < header.size())
        table.set_index(header[index_pos]);

    size_t line_no = 1;
    while (input.get_record(record))
    {
        ++line_no;
        if (record.empty())
            continue;

        auto fields = split_record(record, delim);
        if (fields.size() != header.size())
        {
            throw DataError(path + " line " + std::to_string(line_no) + " has "
                            + std::to_string(fields.size()) + " fields, expected "
                            + std::to_string(header.size()));
        }

        if (index_pos < header.size())
        {
            std::string label = std::move(fields[index_pos]);
            fields.erase(fields.begin() + static_cast<std::ptrdiff_t>(index_pos));
            table.add_row(std::move(label), std::move(fields));
        }
        else
        {
            table.add_row(std::move(fields));
        }
    }

    GIGMAP_LOG_DEBUG("table",
                     "Read {} rows and {} columns from {}",
                     table.row_count(),
                     table.column_count(),
                     path);
    return table;
}

}   // namespace

Table read_table(const std::string& path)
{
    InputFile input(path);
    return read_table_impl(input, IndexMode::None, {});
}

Table read_table(const std::string& path, const std::string& index_col)
{
    InputFile input(path);
    return read_table_impl(input, IndexMode::Named, index_col);
}

Table read_table_indexed(const std::string& path)
{
    InputFile input(path);
    return read_table_impl(input, IndexMode::First, {});
}

Table parse_table(std::istream& in, const std::string& source, bool first_column_index)
{
    InputFile input(in, source);
    return read_table_impl(input, first_column_index ? IndexMode::First : IndexMode::None, {});
}

std::vector<std::string> read_lines(const std::string& path)
{
    InputFile                input(path);
    std::vector<std::string> lines;
    std::string              line;
    while (input.getline(line))
    {
        if (!line.empty())
            lines.push_back(line);
    }
    if (lines.empty())
    {
        throw DataError("file is empty: " + path);
    }
    return lines;
}

// ─── Reshaping ──────────────────────────────────────────────────────────────

LabelledMatrix pivot(const Table&       table,
                     const std::string& index_col,
                     const std::string& columns_col,
                     const std::string& values_col,
                     double             fill)
{
    const auto& index  = table.column(index_col);
    const auto& keys   = table.column(columns_col);
    const auto  values = table.numeric_column(values_col);

    std::unordered_map<std::string, size_t> row_pos;
    std::unordered_map<std::string, size_t> col_pos;
    LabelledMatrix                          out;
    for (size_t i = 0; i < table.row_count(); ++i)
    {
        if (row_pos.emplace(index[i], out.row_labels.size()).second)
            out.row_labels.push_back(index[i]);
        if (col_pos.emplace(keys[i], out.col_labels.size()).second)
            out.col_labels.push_back(keys[i]);
    }

    out.values = Eigen::MatrixXd::Constant(static_cast<Eigen::Index>(out.row_labels.size()),
                                           static_cast<Eigen::Index>(out.col_labels.size()),
                                           fill);

    std::vector<bool> seen(out.row_labels.size() * out.col_labels.size(), false);
    for (size_t i = 0; i < table.row_count(); ++i)
    {
        size_t r    = row_pos[index[i]];
        size_t c    = col_pos[keys[i]];
        size_t slot = r * out.col_labels.size() + c;
        if (seen[slot])
        {
            throw DataError(table.source() + " has more than one '" + values_col + "' for '"
                            + index[i] + "' / '" + keys[i] + "'");
        }
        seen[slot] = true;
        if (!std::isnan(values[i]))
            out.values(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = values[i];
    }
    return out;
}

LabelledMatrix numeric_matrix(const Table& table)
{
    if (!table.has_index())
    {
        throw DataError(table.source() + " has no row index");
    }

    LabelledMatrix out;
    out.row_labels = table.row_labels();
    out.col_labels = table.columns();
    out.values.resize(static_cast<Eigen::Index>(table.row_count()),
                      static_cast<Eigen::Index>(table.column_count()));
    for (size_t c = 0; c < table.column_count(); ++c)
    {
        auto col = table.numeric_column(table.columns()[c]);
        for (size_t r = 0; r < col.size(); ++r)
            out.values(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = col[r];
    }
    return out;
}

// ─── Writing ────────────────────────────────────────────────────────────────

std::string csv_field(const std::string& value)
{
    if (value.find_first_of(",\"\n\r") == std::string::npos)
        return value;
    std::string out = "\"";
    for (char c : value)
    {
        if (c == '"')
            out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void write_table(std::ostream& out, const Table& table)
{
    bool first = true;
    if (table.has_index())
    {
        out << csv_field(table.index_name());
        first = false;
    }
    for (const auto& col : table.columns())
    {
        if (!first)
            out << ',';
        out << csv_field(col);
        first = false;
    }
    out << '\n';

    std::vector<const std::vector<std::string>*> cols;
    for (const auto& name : table.columns())
        cols.push_back(&table.column(name));

    for (size_t r = 0; r < table.row_count(); ++r)
    {
        first = true;
        if (table.has_index())
        {
            out << csv_field(table.row_labels()[r]);
            first = false;
        }
        for (const auto* col : cols)
        {
            if (!first)
                out << ',';
            out << csv_field((*col)[r]);
            first = false;
        }
        out << '\n';
    }
}

bool write_table(const std::string& path, const Table& table)
{
    std::ofstream file(path);
    if (!file.is_open())
    {
        GIGMAP_LOG_ERROR("table", "Cannot open '{}' for writing", path);
        return false;
    }
    write_table(file, table);
    return file.good();
}

}   // namespace gigmap
