#include <capex/core/table.hpp>
#include <capex/io/csv.hpp>
#include <capex/report/aggregate.hpp>
#include <capex/report/normalize.hpp>

#include <fmt/core.h>

#include <cstdint>
#include <string>

auto main() -> int {
    using capex::Value;

    // Mixed cells: truthy text, a plain zero, a numeric amount.
    auto table = capex::Table::from_rows({
        {{"project", Value{std::string("A")}}, {"capex", Value{std::string("yes")}}},
        {{"project", Value{std::string("A")}}, {"capex", Value{std::int64_t{0}}}},
        {{"project", Value{std::string("B")}}, {"capex", Value{5.5}}},
    });

    fmt::print("=== Normalization ===\n");
    auto amounts = capex::report::normalize(*table.find("capex"));
    for (std::size_t i = 0; i < amounts.size(); ++i) {
        fmt::print("row {}: {}\n", i, amounts[i]);
    }

    fmt::print("\n=== Grouped report ===\n");
    capex::report::ReportConfig config;
    config.group_by = "project";
    auto report = capex::report::aggregate(table, config);
    if (!report) {
        fmt::print("error: {}\n", report.error().format());
        return 1;
    }
    for (const auto& group : report->groups) {
        fmt::print("{}: capex_count={} capex_amount={} total_count={}\n",
                   capex::to_text(group.key), group.capex_count,
                   capex::format_double(group.capex_amount), group.total_count);
    }
    fmt::print("total_rows={} capex_rows={} total_capex_amount={}\n", report->summary.total_rows,
               report->summary.capex_rows,
               capex::format_double(report->summary.total_capex_amount));

    fmt::print("\n=== CSV rendering ===\n");
    for (const auto& entry : report->table.columns) {
        fmt::print("{}: {}\n", entry.name, capex::io::format_field(entry.values[0]));
    }

    return 0;
}
