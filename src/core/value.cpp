#include <capex/core/value.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <string>
#include <system_error>
#include <type_traits>

namespace capex {

namespace {

// from_chars rejects an explicit '+', which numeric CSV text commonly carries.
auto strip_plus(std::string_view text) -> std::string_view {
    if (text.size() > 1 && text.front() == '+' && text[1] != '-' && text[1] != '+') {
        text.remove_prefix(1);
    }
    return text;
}

}  // namespace

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n\f\v");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n\f\v");
    return text.substr(begin, end - begin + 1);
}

auto parse_integer(std::string_view text) -> std::optional<std::int64_t> {
    text = strip_plus(trim(text));
    if (text.empty()) {
        return std::nullopt;
    }
    std::int64_t out = 0;
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, out);
    if (result.ec != std::errc() || result.ptr != end) {
        return std::nullopt;
    }
    return out;
}

auto parse_number(std::string_view text) -> std::optional<double> {
    text = strip_plus(trim(text));
    if (text.empty()) {
        return std::nullopt;
    }
    double out = 0.0;
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, out, std::chars_format::general);
    if (result.ec != std::errc() || result.ptr != end || !std::isfinite(out)) {
        return std::nullopt;
    }
    return out;
}

auto format_double(double value) -> std::string {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    std::string text = fmt::format("{}", value);
    if (text.find_first_of(".eE") == std::string::npos) {
        text.append(".0");
    }
    return text;
}

auto to_text(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return {};
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, double>) {
                return format_double(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

}  // namespace capex
