#pragma once

#include <capex/core/table.hpp>
#include <capex/core/value.hpp>

#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace capex::report {

/// Inputs that shape a CAPEX report.
struct ReportConfig {
    std::string capex_column = "capex";
    /// Rows whose normalized amount is strictly greater than this are CAPEX.
    double threshold = 0.0;
    /// Optional grouping column. Ignored when the table has no such column.
    std::optional<std::string> group_by;
};

/// Whole-table totals.
struct Summary {
    std::int64_t total_rows = 0;
    std::int64_t capex_rows = 0;
    double total_capex_amount = 0.0;
};

/// Totals for one distinct value of the grouping column.
struct GroupSummary {
    Value key;
    std::int64_t capex_count = 0;
    double capex_amount = 0.0;
    std::int64_t total_count = 0;
};

struct Report {
    Summary summary;
    /// Per-group totals in first-seen key order; empty when not grouped.
    std::vector<GroupSummary> groups;
    bool grouped = false;
    /// Tabular form of the report, ready for io::write_csv.
    Table table;
};

enum class ReportErrorKind : std::uint8_t {
    MissingColumn,
    /// The group-by column shares a name with a metric column of the report.
    ColumnNameClash,
    /// The group-by and capex columns hold different numbers of cells.
    ColumnLengthMismatch,
};

struct ReportError {
    ReportErrorKind kind = ReportErrorKind::MissingColumn;
    std::string column;
    /// The CAPEX column, for a length mismatch.
    std::string other;

    [[nodiscard]] auto format() const -> std::string;
};

using ReportResult = std::expected<Report, ReportError>;

/// Strict threshold test: an amount equal to the threshold is not CAPEX.
[[nodiscard]] constexpr auto is_capex(double amount, double threshold) noexcept -> bool {
    return amount > threshold;
}

/// Classify every row of `table` and summarize.
///
/// Fails with ReportErrorKind::MissingColumn when `config.capex_column` is
/// absent. A missing `config.group_by` column falls back to the ungrouped
/// report. A group-by column named like a metric column, or one whose length
/// differs from the capex column, is an error. `table` is not modified.
[[nodiscard]] auto aggregate(const Table& table, const ReportConfig& config) -> ReportResult;

/// Single-row table: total_rows, capex_rows, total_capex_amount.
[[nodiscard]] auto summary_table(const Summary& summary) -> Table;

/// Names of the metric columns that follow the key in a grouped report.
inline constexpr std::array<std::string_view, 3> kGroupMetricColumns = {
    "capex_count", "capex_amount", "total_count"};

/// One row per group: <key_name>, capex_count, capex_amount, total_count.
/// Throws std::invalid_argument when `key_name` is one of kGroupMetricColumns.
[[nodiscard]] auto group_table(const std::string& key_name,
                               const std::vector<GroupSummary>& groups) -> Table;

}  // namespace capex::report
