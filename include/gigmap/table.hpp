#pragma once

#include <gigmap/labelled_matrix.hpp>
#include <iosfwd>
#include <limits>
#include <string>
#include <unordered_map>
#include <vector>

namespace gigmap
{

// Column-oriented text table. Every cell is kept as read; numeric views are
// produced on request so the error can name the file and column.
class Table
{
   public:
    Table() = default;
    explicit Table(std::vector<std::string> columns, std::string source = {});

    // File the table was read from, used in error messages.
    const std::string& source() const { return source_; }

    const std::vector<std::string>& columns() const { return columns_; }
    size_t                          row_count() const { return rows_; }
    size_t                          column_count() const { return columns_.size(); }

    bool has_column(const std::string& name) const;

    // Throws DataError naming the source when the column is absent.
    const std::vector<std::string>& column(const std::string& name) const;

    // Empty cells and NA/NaN become NaN. Any other non-numeric cell is a
    // DataError naming the file, column and row.
    std::vector<double> numeric_column(const std::string& name) const;

    // Index values, one per row. Empty when the table has no index.
    const std::vector<std::string>& row_labels() const { return row_labels_; }
    const std::string&              index_name() const { return index_name_; }
    bool                            has_index() const { return has_index_; }

    // Appends a row. Throws DataError if the cell count differs from the
    // column count.
    void add_row(std::vector<std::string> cells);
    void add_row(std::string label, std::vector<std::string> cells);

    void set_index(std::string name);

   private:
    size_t column_position(const std::string& name) const;

    std::string                             source_;
    std::vector<std::string>                columns_;
    std::unordered_map<std::string, size_t> column_ix_;
    std::vector<std::vector<std::string>>   data_;   // column-major
    size_t                                  rows_ = 0;
    bool                                    has_index_ = false;
    std::string                             index_name_;
    std::vector<std::string>                row_labels_;
};

// Read a delimited text table with a header row. The delimiter (comma, tab
// or semicolon) is detected from the header. Paths ending in ".gz" are
// decompressed. Throws DataError if the file is missing or empty.
Table read_table(const std::string& path);

// Same, moving the named column out of the data and into the row index.
Table read_table(const std::string& path, const std::string& index_col);

// Same, using the first column as the row index whatever its header.
Table read_table_indexed(const std::string& path);

// Parse a table already held in a stream. `source` names it in errors.
Table parse_table(std::istream& in, const std::string& source, bool first_column_index = false);

// One entry per line with trailing newline (and CR) stripped. Blank lines
// are skipped. gzip-aware. Throws DataError if missing or empty.
std::vector<std::string> read_lines(const std::string& path);

// Wide matrix from a long table: one row per distinct index value and one
// column per distinct columns value, both in first-seen order. Throws
// DataError on a repeated (row, column) pair.
LabelledMatrix pivot(const Table&       table,
                     const std::string& index_col,
                     const std::string& columns_col,
                     const std::string& values_col,
                     double             fill = std::numeric_limits<double>::quiet_NaN());

// Every data column of an indexed table as numbers. Throws DataError.
LabelledMatrix numeric_matrix(const Table& table);

// CSV with a header row; the index (when present) is written first.
void write_table(std::ostream& out, const Table& table);
// Returns false if the file could not be opened.
bool write_table(const std::string& path, const Table& table);

// Quote a CSV field if it holds a delimiter, quote or newline.
std::string csv_field(const std::string& value);

}   // namespace gigmap
