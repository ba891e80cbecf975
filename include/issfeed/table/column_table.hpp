#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace issfeed {
namespace table {

// Nullable scalar cell: null, string or number
class Cell {
public:
    using Value = std::variant<std::monostate, std::string, std::int64_t, double>;

    Cell() = default;
    explicit Cell(Value value) : value_(std::move(value)) {}

    bool is_null() const { return std::holds_alternative<std::monostate>(value_); }
    const Value& value() const { return value_; }

    // Typed views; nullopt for null, non-coercible or non-finite values
    std::optional<double> as_double() const;
    std::optional<std::string> as_string() const;
    std::optional<long long> as_long() const;

private:
    Value value_;
};

using Row = std::vector<Cell>;
using ColumnIndex = std::optional<size_t>;

/**
 * Column-oriented table: a list of column names plus positional rows.
 *
 * Decoded from the `{"<block>": {"columns": [...], "data": [[...], ...]}}`
 * shape. Every row has exactly as many cells as there are columns and column
 * names are unique within the table. Immutable once built.
 */
class ColumnTable {
public:
    // Throws DecodeError on a malformed shape, EmptyTable when rows are
    // required but absent.
    static ColumnTable decode(const nlohmann::json& document, const std::string& block,
                              bool allow_empty = false);

    static ColumnTable decode_block(const nlohmann::json& block, const std::string& name,
                                    bool allow_empty = false);

    ColumnTable(std::string name, std::vector<std::string> columns, std::vector<Row> rows);

    const std::string& name() const { return name_; }
    const std::vector<std::string>& columns() const { return columns_; }
    size_t column_count() const { return columns_.size(); }
    size_t row_count() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    // Linear scan over the column list
    ColumnIndex column_index(const std::string& column) const;

    // Throws OutOfRangeError past the last row
    const Row& row(size_t index) const;

    // First row, top to bottom, whose `column` cell reads as `value`
    const Row* find_row_where(const std::string& column, const std::string& value) const;

    // Null cell for an absent index or one beyond the row width
    static const Cell& cell(const Row& row, ColumnIndex index);

    static std::optional<double> as_double(const Row& row, ColumnIndex index) {
        return cell(row, index).as_double();
    }
    static std::optional<std::string> as_string(const Row& row, ColumnIndex index) {
        return cell(row, index).as_string();
    }
    static std::optional<long long> as_long(const Row& row, ColumnIndex index) {
        return cell(row, index).as_long();
    }

    // Name-addressed shorthands
    std::optional<double> get_double(const Row& row, const std::string& column) const {
        return as_double(row, column_index(column));
    }
    std::optional<std::string> get_string(const Row& row, const std::string& column) const {
        return as_string(row, column_index(column));
    }
    std::optional<long long> get_long(const Row& row, const std::string& column) const {
        return as_long(row, column_index(column));
    }

private:
    std::string name_;
    std::vector<std::string> columns_;
    std::vector<Row> rows_;
};

} // namespace table
} // namespace issfeed
