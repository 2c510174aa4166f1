#include <capex/core/column.hpp>
#include <capex/core/table.hpp>
#include <capex/core/value.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using capex::Value;

TEST_CASE("Column<Value> basic operations", "[core][column]") {
    capex::Column<Value> col{Value{std::int64_t{1}}, Value{2.5}, Value{}};

    SECTION("size and element access") {
        REQUIRE(col.size() == 3);
        REQUIRE(col[0] == Value{std::int64_t{1}});
        REQUIRE(capex::is_missing(col[2]));
    }

    SECTION("push_back and emplace_back grow the column") {
        col.push_back(Value{std::string("x")});
        col.emplace_back(true);
        REQUIRE(col.size() == 5);
        REQUIRE(col[3] == Value{std::string("x")});
        REQUIRE(col[4] == Value{true});
    }

    SECTION("resize pads with the fill value") {
        col.resize(5, Value{});
        REQUIRE(col.size() == 5);
        REQUIRE(capex::is_missing(col[4]));
    }

    SECTION("cells are writable in place") {
        col[2] = Value{7.0};
        REQUIRE(col[2] == Value{7.0});
    }
}

TEST_CASE("Column<int> transform", "[core][column]") {
    capex::Column<int> col{1, 2, 3};

    auto doubled = col.transform([](int x) { return x * 2.0; });

    REQUIRE(doubled.size() == 3);
    REQUIRE(doubled[0] == 2.0);
    REQUIRE(doubled[2] == 6.0);
}

TEST_CASE("Value helpers", "[core][value]") {
    SECTION("missing detection") {
        REQUIRE(capex::is_missing(Value{}));
        REQUIRE_FALSE(capex::is_missing(Value{std::string()}));
        REQUIRE_FALSE(capex::is_missing(Value{false}));
    }

    SECTION("number parsing") {
        REQUIRE(capex::parse_integer("42") == 42);
        REQUIRE(capex::parse_integer(" -7 ") == -7);
        REQUIRE(capex::parse_integer("+3") == 3);
        REQUIRE_FALSE(capex::parse_integer("4.5").has_value());
        REQUIRE(capex::parse_number("4.5") == 4.5);
        REQUIRE(capex::parse_number("1e3") == 1000.0);
        REQUIRE(capex::parse_number(".25") == 0.25);
        REQUIRE_FALSE(capex::parse_number("").has_value());
        REQUIRE_FALSE(capex::parse_number("12abc").has_value());
        REQUIRE_FALSE(capex::parse_number("nan").has_value());
        REQUIRE_FALSE(capex::parse_number("inf").has_value());
        REQUIRE_FALSE(capex::parse_number("1e400").has_value());
    }

    SECTION("double formatting keeps a decimal point") {
        REQUIRE(capex::format_double(1.0) == "1.0");
        REQUIRE(capex::format_double(6.5) == "6.5");
        REQUIRE(capex::format_double(0.0) == "0.0");
        REQUIRE(capex::format_double(-2.0) == "-2.0");
    }

    SECTION("text rendering") {
        REQUIRE(capex::to_text(Value{}).empty());
        REQUIRE(capex::to_text(Value{true}) == "true");
        REQUIRE(capex::to_text(Value{std::int64_t{12}}) == "12");
        REQUIRE(capex::to_text(Value{std::string(" Yes ")}) == " Yes ");
    }
}

TEST_CASE("Table column bookkeeping", "[core][table]") {
    capex::Table table;
    table.add_column("a", capex::Column<Value>{Value{std::int64_t{1}}, Value{std::int64_t{2}}});
    table.add_column("b", capex::Column<Value>{Value{std::string("x")}, Value{}});

    REQUIRE(table.rows() == 2);
    REQUIRE(table.contains("a"));
    REQUIRE_FALSE(table.contains("c"));
    REQUIRE(table.find("c") == nullptr);
    REQUIRE(table.column_names() == std::vector<std::string>{"a", "b"});

    SECTION("re-adding a column replaces it in place") {
        table.add_column("a", capex::Column<Value>{Value{3.0}, Value{4.0}});
        REQUIRE(table.columns.size() == 2);
        REQUIRE(table.column_names().front() == "a");
        REQUIRE((*table.find("a"))[1] == Value{4.0});
    }

    SECTION("a column of a different length is rejected") {
        REQUIRE_THROWS_AS(
            table.add_column("c", capex::Column<Value>{Value{std::int64_t{1}}}),
            std::invalid_argument);
        REQUIRE_THROWS_AS(table.add_column("a", capex::Column<Value>{Value{1.0}, Value{2.0},
                                                                     Value{3.0}}),
                          std::invalid_argument);
        REQUIRE(table.rows() == 2);
        REQUIRE_FALSE(table.contains("c"));
    }

    SECTION("row access") {
        auto row = table.row(1);
        REQUIRE(row.size() == 2);
        REQUIRE(row[0].first == "a");
        REQUIRE(row[0].second == Value{std::int64_t{2}});
        REQUIRE(capex::is_missing(row[1].second));
        REQUIRE_THROWS_AS(table.row(2), std::out_of_range);
    }
}

TEST_CASE("Table from rows", "[core][table]") {
    auto table = capex::Table::from_rows({
        {{"project", Value{std::string("A")}}, {"capex", Value{std::string("yes")}}},
        {{"capex", Value{5.5}}},
        {{"project", Value{std::string("B")}}, {"note", Value{std::string("late")}}},
    });

    REQUIRE(table.rows() == 3);
    REQUIRE(table.column_names() == std::vector<std::string>{"project", "capex", "note"});

    const auto& project = *table.find("project");
    REQUIRE(project[0] == Value{std::string("A")});
    REQUIRE(capex::is_missing(project[1]));
    REQUIRE(project[2] == Value{std::string("B")});

    const auto& capex_col = *table.find("capex");
    REQUIRE(capex_col[1] == Value{5.5});
    REQUIRE(capex::is_missing(capex_col[2]));

    const auto& note = *table.find("note");
    REQUIRE(capex::is_missing(note[0]));
    REQUIRE(capex::is_missing(note[1]));
    REQUIRE(note[2] == Value{std::string("late")});
}

TEST_CASE("Table from rows keeps the last of a repeated name", "[core][table]") {
    auto table = capex::Table::from_rows({
        {{"k", Value{std::int64_t{1}}}, {"k", Value{std::int64_t{2}}}},
        {{"v", Value{std::string("a")}}},
    });

    REQUIRE(table.column_names() == std::vector<std::string>{"k", "v"});
    REQUIRE((*table.find("k"))[0] == Value{std::int64_t{2}});
    REQUIRE(capex::is_missing((*table.find("k"))[1]));
    REQUIRE(table.find("v")->size() == 2);
}

TEST_CASE("Replacing the only column may change the row count", "[core][table]") {
    capex::Table table;
    table.add_column("a", capex::Column<Value>{Value{1.0}});
    table.add_column("a", capex::Column<Value>{Value{1.0}, Value{2.0}});
    REQUIRE(table.rows() == 2);
}

TEST_CASE("Table from no rows is empty", "[core][table]") {
    auto table = capex::Table::from_rows({});
    REQUIRE(table.rows() == 0);
    REQUIRE(table.columns.empty());
}
