#include <capex/report/aggregate.hpp>
#include <capex/report/normalize.hpp>

#include <fmt/format.h>
#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace capex::report {

namespace {

// NaN never compares equal to itself, so it would open a new group per row.
// Fold it into the missing-key group instead.
auto group_key(const Value& raw) -> Value {
    if (const auto* d = std::get_if<double>(&raw); d != nullptr && std::isnan(*d)) {
        return Value{};
    }
    return raw;
}

auto is_metric_column(std::string_view name) -> bool {
    return std::ranges::find(kGroupMetricColumns, name) != kGroupMetricColumns.end();
}

auto summarize_groups(const Column<Value>& keys, const Column<double>& amounts, double threshold)
    -> std::vector<GroupSummary> {
    const std::size_t rows = keys.size();
    robin_hood::unordered_flat_map<Value, std::size_t> index;
    index.reserve(rows);
    std::vector<GroupSummary> groups;
    for (std::size_t row = 0; row < rows; ++row) {
        Value key = group_key(keys[row]);
        auto it = index.find(key);
        std::size_t slot = 0;
        if (it == index.end()) {
            slot = groups.size();
            index.emplace(key, slot);
            groups.push_back(GroupSummary{.key = std::move(key)});
        } else {
            slot = it->second;
        }
        auto& group = groups[slot];
        ++group.total_count;
        if (is_capex(amounts[row], threshold)) {
            ++group.capex_count;
            group.capex_amount += amounts[row];
        }
    }
    return groups;
}

}  // namespace

auto ReportError::format() const -> std::string {
    switch (kind) {
        case ReportErrorKind::MissingColumn:
            return fmt::format("CAPEX column '{}' not found in input CSV", column);
        case ReportErrorKind::ColumnNameClash:
            return fmt::format("group-by column '{}' clashes with a report metric column",
                               column);
        case ReportErrorKind::ColumnLengthMismatch:
            return fmt::format("group-by column '{}' and CAPEX column '{}' differ in length",
                               column, other);
    }
    return "unknown report error";
}

auto aggregate(const Table& table, const ReportConfig& config) -> ReportResult {
    const auto* capex_values = table.find(config.capex_column);
    if (capex_values == nullptr) {
        return std::unexpected(
            ReportError{.kind = ReportErrorKind::MissingColumn, .column = config.capex_column});
    }

    const Column<double> amounts = normalize(*capex_values);

    Report report;
    report.summary.total_rows = static_cast<std::int64_t>(amounts.size());
    for (double amount : amounts) {
        if (is_capex(amount, config.threshold)) {
            ++report.summary.capex_rows;
            report.summary.total_capex_amount += amount;
        }
    }

    const Column<Value>* keys = nullptr;
    if (config.group_by.has_value()) {
        keys = table.find(*config.group_by);
        if (keys == nullptr) {
            spdlog::debug("group-by column '{}' not found; writing ungrouped summary",
                          *config.group_by);
        } else if (is_metric_column(*config.group_by)) {
            return std::unexpected(ReportError{.kind = ReportErrorKind::ColumnNameClash,
                                               .column = *config.group_by});
        } else if (keys->size() != amounts.size()) {
            return std::unexpected(ReportError{.kind = ReportErrorKind::ColumnLengthMismatch,
                                               .column = *config.group_by,
                                               .other = config.capex_column});
        }
    }

    if (keys != nullptr) {
        report.groups = summarize_groups(*keys, amounts, config.threshold);
        report.grouped = true;
        report.table = group_table(*config.group_by, report.groups);
        spdlog::debug("aggregated {} rows into {} groups by '{}'", report.summary.total_rows,
                      report.groups.size(), *config.group_by);
    } else {
        report.table = summary_table(report.summary);
    }
    return report;
}

auto summary_table(const Summary& summary) -> Table {
    Table table;
    table.add_column("total_rows", Column<Value>{Value{summary.total_rows}});
    table.add_column("capex_rows", Column<Value>{Value{summary.capex_rows}});
    table.add_column("total_capex_amount", Column<Value>{Value{summary.total_capex_amount}});
    return table;
}

auto group_table(const std::string& key_name, const std::vector<GroupSummary>& groups) -> Table {
    if (is_metric_column(key_name)) {
        throw std::invalid_argument(
            fmt::format("group key '{}' clashes with a report column", key_name));
    }
    Column<Value> keys;
    Column<Value> capex_counts;
    Column<Value> capex_amounts;
    Column<Value> total_counts;
    keys.reserve(groups.size());
    capex_counts.reserve(groups.size());
    capex_amounts.reserve(groups.size());
    total_counts.reserve(groups.size());
    for (const auto& group : groups) {
        keys.push_back(group.key);
        capex_counts.emplace_back(group.capex_count);
        capex_amounts.emplace_back(group.capex_amount);
        total_counts.emplace_back(group.total_count);
    }

    Table table;
    table.add_column(key_name, std::move(keys));
    table.add_column("capex_count", std::move(capex_counts));
    table.add_column("capex_amount", std::move(capex_amounts));
    table.add_column("total_count", std::move(total_counts));
    return table;
}

}  // namespace capex::report
