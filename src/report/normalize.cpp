#include <capex/report/normalize.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <string>
#include <type_traits>

namespace capex::report {

namespace {

auto numeric_amount(const Value& value) -> std::optional<double> {
    return std::visit(
        [](const auto& v) -> std::optional<double> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::int64_t>) {
                return static_cast<double>(v);
            } else if constexpr (std::is_same_v<T, double>) {
                if (!std::isfinite(v)) {
                    return std::nullopt;
                }
                return v;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return parse_number(v);
            } else {
                return std::nullopt;
            }
        },
        value);
}

}  // namespace

auto is_truthy_text(std::string_view text) -> bool {
    auto trimmed = trim(text);
    std::string lowered(trimmed);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return std::ranges::find(kTruthyTokens, std::string_view{lowered}) != kTruthyTokens.end();
}

auto normalize_value(const Value& value) -> double {
    if (auto amount = numeric_amount(value)) {
        return *amount;
    }
    if (is_missing(value)) {
        return 0.0;
    }
    return is_truthy_text(to_text(value)) ? 1.0 : 0.0;
}

auto normalize(const Column<Value>& values) -> Column<double> {
    return values.transform([](const Value& v) { return normalize_value(v); });
}

}  // namespace capex::report
