#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace capex {

/// A single loosely-typed cell. std::monostate marks a missing value.
using Value = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

[[nodiscard]] inline auto is_missing(const Value& value) noexcept -> bool {
    return std::holds_alternative<std::monostate>(value);
}

/// Strip ASCII whitespace from both ends.
[[nodiscard]] auto trim(std::string_view text) -> std::string_view;

/// Parse `text` (surrounding whitespace ignored) as a base-10 integer.
[[nodiscard]] auto parse_integer(std::string_view text) -> std::optional<std::int64_t>;

/// Parse `text` (surrounding whitespace ignored) as a finite floating-point
/// number. Accepts integer, fixed and exponent forms with an optional sign.
/// NaN and infinities are rejected.
[[nodiscard]] auto parse_number(std::string_view text) -> std::optional<double>;

/// Shortest round-trip rendering of a double; integral values keep a
/// trailing ".0" (`1.0`, `6.5`, `1e+20`).
[[nodiscard]] auto format_double(double value) -> std::string;

/// Plain-text rendering of a cell: "" for missing, "true"/"false" for
/// booleans, decimal for numbers, the string itself otherwise.
[[nodiscard]] auto to_text(const Value& value) -> std::string;

}  // namespace capex
