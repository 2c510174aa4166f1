#pragma once

#include <capex/core/column.hpp>
#include <capex/core/value.hpp>

#include <array>
#include <string_view>

namespace capex::report {

/// Lowercase, trimmed spellings that count as an affirmative CAPEX marker.
inline constexpr std::array<std::string_view, 5> kTruthyTokens{"yes", "y", "true", "t", "1"};

/// True when `text`, trimmed and lowercased, is one of kTruthyTokens.
[[nodiscard]] auto is_truthy_text(std::string_view text) -> bool;

/// Map one raw cell to its CAPEX amount.
///
/// Precedence:
///   1. numbers (and text that parses as a finite number) keep their value;
///   2. truthy text ("yes", " TRUE ", ...) and boolean true become 1.0;
///   3. everything else, missing cells included, becomes 0.0.
///
/// The result is always finite.
[[nodiscard]] auto normalize_value(const Value& value) -> double;

/// Normalize a whole column; output has the same length and order.
[[nodiscard]] auto normalize(const Column<Value>& values) -> Column<double>;

}  // namespace capex::report
