#pragma once

#include <iostream>
#include <optional>
#include <string>

namespace capex::app {

inline constexpr int kExitOk = 0;
inline constexpr int kExitWriteFailed = 1;
inline constexpr int kExitInputError = 2;

/// Settings for one report run, usually filled from the command line.
struct AppConfig {
    std::string input;
    std::string output = "capex_report.csv";
    std::optional<std::string> group_by;
    std::string capex_column = "capex";
    double capex_threshold = 0.0;
    /// Null token spec handed to io::parse_null_spec.
    std::string nulls = "<empty>";
    bool verbose = false;
};

/// Route spdlog output to stderr at info level, or debug when verbose.
void configure_logging(bool verbose);

/// Load `config.input`, build the report and write it to `config.output`.
///
/// Prints the four-line summary to `out` on success. On failure prints a
/// single line to `err`, writes nothing and returns kExitInputError
/// (missing input, unreadable CSV, missing CAPEX column) or
/// kExitWriteFailed (output not writable).
[[nodiscard]] auto run(const AppConfig& config, std::ostream& out = std::cout,
                       std::ostream& err = std::cerr) -> int;

}  // namespace capex::app
