#include <capex/core/table.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace capex {

void Table::add_column(std::string name, Column<Value> values) {
    auto it = index.find(name);
    const bool replaces_only_column = it != index.end() && columns.size() == 1;
    if (!columns.empty() && !replaces_only_column && values.size() != rows()) {
        throw std::invalid_argument(fmt::format("column '{}' has {} rows, table has {}", name,
                                                values.size(), rows()));
    }
    if (it != index.end()) {
        columns[it->second].values = std::move(values);
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(ColumnEntry{.name = std::move(name), .values = std::move(values)});
    index[columns.back().name] = pos;
}

auto Table::find(const std::string& name) const -> const Column<Value>* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second].values;
    }
    return nullptr;
}

auto Table::contains(const std::string& name) const -> bool {
    return index.contains(name);
}

auto Table::rows() const noexcept -> std::size_t {
    if (columns.empty()) {
        return 0;
    }
    return columns.front().values.size();
}

auto Table::column_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& entry : columns) {
        names.push_back(entry.name);
    }
    return names;
}

auto Table::row(std::size_t idx) const -> Row {
    if (idx >= rows()) {
        throw std::out_of_range(fmt::format("row {} out of range ({} rows)", idx, rows()));
    }
    Row out;
    out.reserve(columns.size());
    for (const auto& entry : columns) {
        out.emplace_back(entry.name, entry.values[idx]);
    }
    return out;
}

auto Table::from_rows(const std::vector<Row>& rows) -> Table {
    std::vector<std::string> names;
    std::unordered_map<std::string, std::size_t> slots;
    for (const auto& row : rows) {
        for (const auto& [name, value] : row) {
            if (slots.emplace(name, names.size()).second) {
                names.push_back(name);
            }
        }
    }

    std::vector<Column<Value>> values(names.size());
    for (auto& column : values) {
        column.resize(rows.size(), Value{});
    }
    for (std::size_t r = 0; r < rows.size(); ++r) {
        // A name repeated within one row: last write wins.
        for (const auto& [name, value] : rows[r]) {
            values[slots.at(name)][r] = value;
        }
    }

    Table table;
    for (std::size_t c = 0; c < names.size(); ++c) {
        table.add_column(names[c], std::move(values[c]));
    }
    return table;
}

}  // namespace capex
