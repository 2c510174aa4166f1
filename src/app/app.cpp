#include <capex/app/app.hpp>
#include <capex/io/csv.hpp>
#include <capex/report/aggregate.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <system_error>

namespace capex::app {

void configure_logging(bool verbose) {
    auto logger = spdlog::get("capex");
    if (logger == nullptr) {
        logger = spdlog::stderr_color_mt("capex");
    }
    spdlog::set_default_logger(logger);
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

auto run(const AppConfig& config, std::ostream& out, std::ostream& err) -> int {
    std::error_code ec;
    if (!std::filesystem::exists(config.input, ec)) {
        fmt::print(err, "Input file not found: {}\n", config.input);
        return kExitInputError;
    }

    auto table = io::read_csv(config.input, io::parse_null_spec(config.nulls));
    if (!table) {
        fmt::print(err, "Error: {}\n", table.error());
        return kExitInputError;
    }

    report::ReportConfig report_config;
    report_config.capex_column = config.capex_column;
    report_config.threshold = config.capex_threshold;
    report_config.group_by = config.group_by;

    auto report = report::aggregate(*table, report_config);
    if (!report) {
        fmt::print(err, "Error: {}\n", report.error().format());
        return kExitInputError;
    }

    auto written = io::write_csv(report->table, config.output);
    if (!written) {
        fmt::print(err, "Error: {}\n", written.error());
        return kExitWriteFailed;
    }

    const auto& summary = report->summary;
    fmt::print(out, "Processed {} rows\n", summary.total_rows);
    fmt::print(out, "CAPEX rows: {}\n", summary.capex_rows);
    fmt::print(out, "Total CAPEX amount: {}\n", format_double(summary.total_capex_amount));
    fmt::print(out, "Report written to: {}\n", config.output);
    return kExitOk;
}

}  // namespace capex::app
