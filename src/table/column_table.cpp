#include "issfeed/table/column_table.hpp"
#include "issfeed/core/exceptions.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <unordered_set>

namespace issfeed {
namespace table {

namespace {

std::optional<double> parse_double(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<long long> truncate_to_long(double value) {
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    if (value >= static_cast<double>(std::numeric_limits<long long>::max()) ||
        value < static_cast<double>(std::numeric_limits<long long>::min())) {
        return std::nullopt;
    }
    return static_cast<long long>(value);
}

Cell decode_cell(const nlohmann::json& value, const std::string& table, size_t row, size_t col) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
            return Cell();
        case nlohmann::json::value_t::string:
            return Cell(value.get<std::string>());
        case nlohmann::json::value_t::number_integer:
            return Cell(value.get<std::int64_t>());
        case nlohmann::json::value_t::number_unsigned: {
            auto raw = value.get<std::uint64_t>();
            if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return Cell(static_cast<double>(raw));
            }
            return Cell(static_cast<std::int64_t>(raw));
        }
        case nlohmann::json::value_t::number_float:
            return Cell(value.get<double>());
        default:
            break;
    }
    throw DecodeError("table '" + table + "' row " + std::to_string(row) + " column " +
                      std::to_string(col) + " holds a non-scalar " + value.type_name());
}

} // namespace

// Cell

std::optional<double> Cell::as_double() const {
    if (const auto* d = std::get_if<double>(&value_)) {
        if (!std::isfinite(*d)) {
            return std::nullopt;
        }
        return *d;
    }
    if (const auto* i = std::get_if<std::int64_t>(&value_)) {
        return static_cast<double>(*i);
    }
    if (const auto* s = std::get_if<std::string>(&value_)) {
        return parse_double(*s);
    }
    return std::nullopt;
}

std::optional<std::string> Cell::as_string() const {
    if (const auto* s = std::get_if<std::string>(&value_)) {
        return *s;
    }
    if (const auto* i = std::get_if<std::int64_t>(&value_)) {
        return std::to_string(*i);
    }
    if (const auto* d = std::get_if<double>(&value_)) {
        if (!std::isfinite(*d)) {
            return std::nullopt;
        }
        return nlohmann::json(*d).dump();
    }
    return std::nullopt;
}

std::optional<long long> Cell::as_long() const {
    if (const auto* i = std::get_if<std::int64_t>(&value_)) {
        return static_cast<long long>(*i);
    }
    if (const auto* d = std::get_if<double>(&value_)) {
        return truncate_to_long(*d);
    }
    if (const auto* s = std::get_if<std::string>(&value_)) {
        if (s->empty()) {
            return std::nullopt;
        }
        const char* begin = s->c_str();
        char* end = nullptr;
        errno = 0;
        long long value = std::strtoll(begin, &end, 10);
        if (end != begin && *end == '\0' && errno != ERANGE) {
            return value;
        }
        auto as_real = parse_double(*s);
        if (as_real) {
            return truncate_to_long(*as_real);
        }
    }
    return std::nullopt;
}

// ColumnTable

ColumnTable ColumnTable::decode(const nlohmann::json& document, const std::string& block,
                                bool allow_empty) {
    if (!document.is_object()) {
        throw DecodeError("document is not an object (got " + std::string(document.type_name()) + ")");
    }
    auto it = document.find(block);
    if (it == document.end()) {
        throw DecodeError("missing table '" + block + "'");
    }
    return decode_block(*it, block, allow_empty);
}

ColumnTable ColumnTable::decode_block(const nlohmann::json& block, const std::string& name,
                                      bool allow_empty) {
    if (!block.is_object()) {
        throw DecodeError("table '" + name + "' is not an object");
    }

    auto columns_it = block.find("columns");
    auto data_it = block.find("data");
    if (columns_it == block.end() || !columns_it->is_array()) {
        throw DecodeError("table '" + name + "' has no 'columns' array");
    }
    if (data_it == block.end() || !data_it->is_array()) {
        throw DecodeError("table '" + name + "' has no 'data' array");
    }

    std::vector<std::string> columns;
    columns.reserve(columns_it->size());
    for (const auto& column : *columns_it) {
        if (!column.is_string()) {
            throw DecodeError("table '" + name + "' has a non-string column name");
        }
        columns.push_back(column.get<std::string>());
    }

    std::vector<Row> rows;
    rows.reserve(data_it->size());
    size_t row_number = 0;
    for (const auto& raw_row : *data_it) {
        if (!raw_row.is_array()) {
            throw DecodeError("table '" + name + "' row " + std::to_string(row_number) +
                              " is not an array");
        }
        Row row;
        row.reserve(raw_row.size());
        size_t col_number = 0;
        for (const auto& value : raw_row) {
            row.push_back(decode_cell(value, name, row_number, col_number));
            ++col_number;
        }
        rows.push_back(std::move(row));
        ++row_number;
    }

    if (rows.empty() && !allow_empty) {
        throw EmptyTable(name);
    }

    return ColumnTable(name, std::move(columns), std::move(rows));
}

ColumnTable::ColumnTable(std::string name, std::vector<std::string> columns, std::vector<Row> rows)
    : name_(std::move(name)), columns_(std::move(columns)), rows_(std::move(rows)) {
    std::unordered_set<std::string> seen;
    for (const auto& column : columns_) {
        if (!seen.insert(column).second) {
            throw DecodeError("table '" + name_ + "' repeats column '" + column + "'");
        }
    }
    for (size_t i = 0; i < rows_.size(); ++i) {
        if (rows_[i].size() != columns_.size()) {
            throw DecodeError("table '" + name_ + "' row " + std::to_string(i) + " has " +
                              std::to_string(rows_[i].size()) + " cells, expected " +
                              std::to_string(columns_.size()));
        }
    }
}

ColumnIndex ColumnTable::column_index(const std::string& column) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i] == column) {
            return i;
        }
    }
    return std::nullopt;
}

const Row& ColumnTable::row(size_t index) const {
    if (index >= rows_.size()) {
        throw OutOfRangeError("table '" + name_ + "' row " + std::to_string(index) +
                              " requested, " + std::to_string(rows_.size()) + " available");
    }
    return rows_[index];
}

const Row* ColumnTable::find_row_where(const std::string& column, const std::string& value) const {
    auto index = column_index(column);
    if (!index) {
        return nullptr;
    }
    for (const auto& row : rows_) {
        auto text = as_string(row, index);
        if (text && *text == value) {
            return &row;
        }
    }
    return nullptr;
}

const Cell& ColumnTable::cell(const Row& row, ColumnIndex index) {
    static const Cell null_cell;
    if (!index || *index >= row.size()) {
        return null_cell;
    }
    return row[*index];
}

} // namespace table
} // namespace issfeed
