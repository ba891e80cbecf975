#include <gtest/gtest.h>
#include "issfeed/table/column_table.hpp"
#include "issfeed/core/exceptions.hpp"
#include <cmath>
#include <limits>

using namespace issfeed;
using namespace issfeed::table;
using nlohmann::json;

class ColumnTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        document["marketdata"]["columns"] = json::array({"SECID", "BOARDID", "LAST", "VOLTODAY"});
        document["marketdata"]["data"] = json::array({
            json::array({"SBER", "SMAL", 250.5, 10}),
            json::array({"SBER", "TQBR", 251.25, 123456}),
            json::array({"SBER", "TQBR", 999.0, 1})
        });
    }

    json document;
};

TEST_F(ColumnTableTest, DecodesColumnsAndRows) {
    auto table = ColumnTable::decode(document, "marketdata");

    EXPECT_EQ(table.name(), "marketdata");
    EXPECT_EQ(table.column_count(), 4u);
    EXPECT_EQ(table.row_count(), 3u);
    EXPECT_FALSE(table.empty());
}

TEST_F(ColumnTableTest, ColumnIndexAddressesEveryRow) {
    auto table = ColumnTable::decode(document, "marketdata");
    const auto& raw_rows = document["marketdata"]["data"];

    for (size_t c = 0; c < table.column_count(); ++c) {
        const std::string& name = table.columns()[c];
        auto index = table.column_index(name);
        ASSERT_TRUE(index.has_value());
        EXPECT_EQ(*index, c);

        for (size_t r = 0; r < table.row_count(); ++r) {
            const auto& raw = raw_rows[r][c];
            const Cell& cell = ColumnTable::cell(table.row(r), index);
            if (raw.is_string()) {
                EXPECT_EQ(*cell.as_string(), raw.get<std::string>());
            } else {
                EXPECT_DOUBLE_EQ(*cell.as_double(), raw.get<double>());
            }
        }
    }
}

TEST_F(ColumnTableTest, UnknownColumnIsAbsent) {
    auto table = ColumnTable::decode(document, "marketdata");

    auto index = table.column_index("OPEN");
    EXPECT_FALSE(index.has_value());
    EXPECT_TRUE(ColumnTable::cell(table.row(0), index).is_null());
    EXPECT_FALSE(table.get_double(table.row(0), "OPEN").has_value());
}

TEST_F(ColumnTableTest, RowBeyondCountThrows) {
    auto table = ColumnTable::decode(document, "marketdata");
    EXPECT_THROW(table.row(3), OutOfRangeError);
}

TEST_F(ColumnTableTest, FindRowWhereReturnsFirstMatch) {
    auto table = ColumnTable::decode(document, "marketdata");

    const Row* row = table.find_row_where("BOARDID", "TQBR");
    ASSERT_NE(row, nullptr);
    EXPECT_DOUBLE_EQ(*table.get_double(*row, "LAST"), 251.25);

    EXPECT_EQ(table.find_row_where("BOARDID", "EQOB"), nullptr);
    EXPECT_EQ(table.find_row_where("MISSING", "TQBR"), nullptr);
}

TEST_F(ColumnTableTest, EmptyRequiredTableThrowsEmptyTable) {
    document["marketdata"]["data"] = json::array();

    try {
        ColumnTable::decode(document, "marketdata");
        FAIL() << "expected EmptyTable";
    } catch (const EmptyTable& e) {
        EXPECT_EQ(e.table_name(), "marketdata");
    }
}

TEST_F(ColumnTableTest, EmptyTableAllowedWhenOptional) {
    document["marketdata"]["data"] = json::array();

    auto table = ColumnTable::decode(document, "marketdata", true);
    EXPECT_TRUE(table.empty());
}

TEST_F(ColumnTableTest, EmptyTableIsADecodeError) {
    document["marketdata"]["data"] = json::array();
    EXPECT_THROW(ColumnTable::decode(document, "marketdata"), DecodeError);
}

TEST_F(ColumnTableTest, MalformedShapesThrowDecodeError) {
    EXPECT_THROW(ColumnTable::decode(json::array(), "marketdata"), DecodeError);
    EXPECT_THROW(ColumnTable::decode(document, "securities"), DecodeError);

    json no_columns = document;
    no_columns["marketdata"].erase("columns");
    EXPECT_THROW(ColumnTable::decode(no_columns, "marketdata"), DecodeError);

    json no_data = document;
    no_data["marketdata"]["data"] = "nope";
    EXPECT_THROW(ColumnTable::decode(no_data, "marketdata"), DecodeError);

    json short_row = document;
    short_row["marketdata"]["data"][1] = json::array({"SBER", "TQBR"});
    EXPECT_THROW(ColumnTable::decode(short_row, "marketdata"), DecodeError);

    json nested = document;
    nested["marketdata"]["data"][0][2] = json::object();
    EXPECT_THROW(ColumnTable::decode(nested, "marketdata"), DecodeError);

    json repeated = document;
    repeated["marketdata"]["columns"][3] = "LAST";
    EXPECT_THROW(ColumnTable::decode(repeated, "marketdata"), DecodeError);
}

TEST(CellTest, NullAndNonFiniteReadAsAbsent) {
    Cell null_cell;
    EXPECT_TRUE(null_cell.is_null());
    EXPECT_FALSE(null_cell.as_double().has_value());
    EXPECT_FALSE(null_cell.as_string().has_value());
    EXPECT_FALSE(null_cell.as_long().has_value());

    Cell nan_cell(Cell::Value(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_FALSE(nan_cell.as_double().has_value());

    Cell inf_cell(Cell::Value(std::numeric_limits<double>::infinity()));
    EXPECT_FALSE(inf_cell.as_double().has_value());
    EXPECT_FALSE(inf_cell.as_long().has_value());

    Cell text_inf(Cell::Value(std::string("inf")));
    EXPECT_FALSE(text_inf.as_double().has_value());
}

TEST(CellTest, NumericStringsCoerce) {
    Cell text(Cell::Value(std::string("123.5")));
    EXPECT_DOUBLE_EQ(*text.as_double(), 123.5);
    EXPECT_EQ(*text.as_long(), 123);

    Cell garbage(Cell::Value(std::string("12abc")));
    EXPECT_FALSE(garbage.as_double().has_value());
    EXPECT_EQ(*garbage.as_string(), "12abc");

    Cell integer(Cell::Value(std::int64_t{42}));
    EXPECT_EQ(*integer.as_string(), "42");
    EXPECT_DOUBLE_EQ(*integer.as_double(), 42.0);
}

TEST(CellTest, IndexBeyondRowIsNull) {
    Row row{Cell(Cell::Value(std::string("SBER")))};
    EXPECT_TRUE(ColumnTable::cell(row, ColumnIndex(5)).is_null());
    EXPECT_TRUE(ColumnTable::cell(row, std::nullopt).is_null());
}
