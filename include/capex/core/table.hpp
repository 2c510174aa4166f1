#pragma once

#include <capex/core/column.hpp>
#include <capex/core/value.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace capex {

/// One named column of loosely-typed cells.
struct ColumnEntry {
    std::string name;
    Column<Value> values;
};

/// A row as an ordered list of (column name, cell) pairs.
using Row = std::vector<std::pair<std::string, Value>>;

/// An in-memory table: ordered named columns of equal length.
struct Table {
    std::vector<ColumnEntry> columns;
    std::unordered_map<std::string, std::size_t> index;

    /// Append a column, or replace the cells of an existing column with the same name.
    /// Throws std::invalid_argument when the length differs from the other columns.
    void add_column(std::string name, Column<Value> values);
    [[nodiscard]] auto find(const std::string& name) const -> const Column<Value>*;
    [[nodiscard]] auto contains(const std::string& name) const -> bool;
    [[nodiscard]] auto rows() const noexcept -> std::size_t;
    [[nodiscard]] auto column_names() const -> std::vector<std::string>;

    /// Materialize row `idx` in column order. Throws std::out_of_range.
    [[nodiscard]] auto row(std::size_t idx) const -> Row;

    /// Build a table from rows. Columns appear in first-seen order across
    /// all rows; a row that lacks a column gets a missing cell there.
    [[nodiscard]] static auto from_rows(const std::vector<Row>& rows) -> Table;
};

}  // namespace capex
