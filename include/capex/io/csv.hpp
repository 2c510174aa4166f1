#pragma once

#include <capex/core/table.hpp>
#include <capex/core/value.hpp>

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <unordered_set>

namespace capex::io {

struct CsvReadOptions {
    bool null_if_empty = true;
    std::unordered_set<std::string> null_tokens;
};

/// Parse a comma separated null spec such as "<empty>,NA,n/a".
/// The token `<empty>` marks empty cells as missing.
[[nodiscard]] auto parse_null_spec(std::string_view spec) -> CsvReadOptions;

/// Read an RFC 4180 CSV file (header on the first line) into a Table.
///
/// Column types are inferred per column: all-integer columns become
/// std::int64_t, all-numeric columns double, all True/False columns bool,
/// anything else keeps the raw text. Null cells are missing in every case.
[[nodiscard]] auto read_csv(std::string_view path, const CsvReadOptions& options = {})
    -> std::expected<Table, std::string>;

/// Render one cell as a CSV field, quoting when needed.
[[nodiscard]] auto format_field(const Value& value) -> std::string;

/// Write `table` as CSV: a header row, then one line per row.
/// Returns the number of data rows written.
[[nodiscard]] auto write_csv(const Table& table, std::string_view path)
    -> std::expected<std::size_t, std::string>;

}  // namespace capex::io
