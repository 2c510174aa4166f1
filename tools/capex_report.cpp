#include <capex/app/app.hpp>

#include <CLI/CLI.hpp>

#include <iostream>
#include <string>

auto main(int argc, char** argv) -> int {
    CLI::App app{"capex_report: classify CSV rows as CAPEX and summarize"};
    app.set_version_flag("--version", "capex_report 0.1.0");

    capex::app::AppConfig config;
    std::string group_by;

    app.add_option("-i,--input", config.input, "Input CSV file path")->required();
    app.add_option("-o,--output", config.output, "Output CSV file path (default: capex_report.csv)");
    app.add_option("-g,--group-by", group_by,
                   "Optional column name to group by (e.g. project, department)");
    app.add_option("-c,--capex-column", config.capex_column,
                   "Name of the CAPEX column (default: capex)");
    app.add_option("-t,--capex-threshold", config.capex_threshold,
                   "Numeric threshold: values > threshold are CAPEX (default: 0.0)");
    app.add_option("--nulls", config.nulls,
                   "Comma separated tokens read as missing; <empty> means empty cells "
                   "(default: <empty>)");
    app.add_flag("-v,--verbose", config.verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    if (!group_by.empty()) {
        config.group_by = group_by;
    }

    capex::app::configure_logging(config.verbose);

    return capex::app::run(config, std::cout, std::cerr);
}
