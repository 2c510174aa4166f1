#include <capex/io/csv.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <exception>
#include <fstream>
#include <optional>
#include <type_traits>
#include <vector>

namespace capex::io {

namespace {

enum class CellKind : std::uint8_t {
    Int,
    Double,
    Bool,
    Text,
};

auto parse_bool(std::string_view text) -> std::optional<bool> {
    text = trim(text);
    if (text == "True" || text == "TRUE" || text == "true") {
        return true;
    }
    if (text == "False" || text == "FALSE" || text == "false") {
        return false;
    }
    return std::nullopt;
}

auto is_null_cell(const std::string& text, const CsvReadOptions& options) -> bool {
    return (options.null_if_empty && text.empty()) || options.null_tokens.contains(text);
}

// Narrowest kind every non-null cell satisfies, tried in order int, double, bool.
auto infer_kind(const std::vector<std::string>& cells, const std::vector<bool>& validity)
    -> CellKind {
    bool all_int = true;
    bool all_double = true;
    bool all_bool = true;
    bool any_valid = false;
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (!validity[i]) {
            continue;
        }
        any_valid = true;
        if (all_int && !parse_integer(cells[i]).has_value()) {
            all_int = false;
        }
        if (all_double && !parse_number(cells[i]).has_value()) {
            all_double = false;
        }
        if (all_bool && !parse_bool(cells[i]).has_value()) {
            all_bool = false;
        }
        if (!all_int && !all_double && !all_bool) {
            break;
        }
    }
    if (!any_valid) {
        return CellKind::Text;
    }
    if (all_int) {
        return CellKind::Int;
    }
    if (all_double) {
        return CellKind::Double;
    }
    if (all_bool) {
        return CellKind::Bool;
    }
    return CellKind::Text;
}

auto to_value(std::string& cell, CellKind kind) -> Value {
    switch (kind) {
        case CellKind::Int:
            return Value{*parse_integer(cell)};
        case CellKind::Double:
            return Value{*parse_number(cell)};
        case CellKind::Bool:
            return Value{*parse_bool(cell)};
        case CellKind::Text:
            break;
    }
    return Value{std::move(cell)};
}

auto needs_quoting(std::string_view text) -> bool {
    return text.find_first_of(",\"\r\n") != std::string_view::npos;
}

auto quote(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (char ch : text) {
        if (ch == '"') {
            out.push_back('"');
        }
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

auto format_text_field(std::string_view text) -> std::string {
    return needs_quoting(text) ? quote(text) : std::string(text);
}

}  // namespace

auto parse_null_spec(std::string_view spec) -> CsvReadOptions {
    CsvReadOptions options;
    options.null_if_empty = false;
    std::size_t pos = 0;
    while (pos <= spec.size()) {
        std::size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }
        auto token = trim(spec.substr(pos, comma - pos));
        if (!token.empty()) {
            if (token == "<empty>") {
                options.null_if_empty = true;
            } else {
                options.null_tokens.emplace(token);
            }
        }
        if (comma == spec.size()) {
            break;
        }
        pos = comma + 1;
    }
    return options;
}

auto read_csv(std::string_view path, const CsvReadOptions& options)
    -> std::expected<Table, std::string> {
    try {
        rapidcsv::Document doc(std::string(path),
                               rapidcsv::LabelParams(0, -1),   // row 0 = header, no row-index column
                               rapidcsv::SeparatorParams(',')  // handles RFC 4180 quoting
        );

        const auto col_names = doc.GetColumnNames();
        Table table;
        for (std::size_t c = 0; c < col_names.size(); ++c) {
            std::vector<std::string> cells = doc.GetColumn<std::string>(c);
            std::vector<bool> validity(cells.size(), true);
            for (std::size_t i = 0; i < cells.size(); ++i) {
                validity[i] = !is_null_cell(cells[i], options);
            }

            const CellKind kind = infer_kind(cells, validity);
            Column<Value> values;
            values.reserve(cells.size());
            for (std::size_t i = 0; i < cells.size(); ++i) {
                if (!validity[i]) {
                    values.emplace_back();
                    continue;
                }
                values.emplace_back(to_value(cells[i], kind));
            }
            table.add_column(col_names[c], std::move(values));
        }

        spdlog::debug("read {} rows x {} columns from {}", table.rows(), table.columns.size(),
                      path);
        return table;
    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("failed to read csv '{}': {}", path, e.what()));
    }
}

auto format_field(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return {};
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "True" : "False";
            } else if constexpr (std::is_same_v<T, double>) {
                return format_double(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return format_text_field(v);
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

auto write_csv(const Table& table, std::string_view path)
    -> std::expected<std::size_t, std::string> {
    std::ofstream out{std::string(path)};
    if (!out) {
        return std::unexpected(fmt::format("cannot write csv '{}'", path));
    }

    std::vector<std::string> fields;
    fields.reserve(table.columns.size());
    for (const auto& entry : table.columns) {
        fields.push_back(format_text_field(entry.name));
    }
    out << fmt::format("{}\n", fmt::join(fields, ","));

    const std::size_t rows = table.rows();
    for (std::size_t row = 0; row < rows; ++row) {
        fields.clear();
        for (const auto& entry : table.columns) {
            fields.push_back(format_field(entry.values[row]));
        }
        out << fmt::format("{}\n", fmt::join(fields, ","));
    }

    out.flush();
    if (!out) {
        return std::unexpected(fmt::format("error while writing csv '{}'", path));
    }
    spdlog::debug("wrote {} rows to {}", rows, path);
    return rows;
}

}  // namespace capex::io
