// cardgrid-render: lay out a YAML record table as a sectioned card grid
// and write it as SVG.

#include <cardgrid/cardgrid.h>
#include <cardgrid/config.h>
#include <cardgrid/svg-writer.h>
#include <ytrace/ytrace.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <yaml-cpp/yaml.h>

#include <args.hxx>
#include <iostream>
#include <string>

using namespace cardgrid;

template<typename T>
static int fail(const std::string& what, const Result<T>& result) {
    std::cerr << "Error: " << what << ": " << error_msg(result) << "\n";
    return 1;
}

int main(int argc, char** argv) {
    args::ArgumentParser parser("cardgrid-render - Lay out records as a sectioned card grid (SVG)");
    args::HelpFlag help(parser, "help", "Show help", {'h', "help"});
    args::ValueFlag<std::string> configFlag(parser, "FILE", "Config file (YAML)", {'c', "config"});
    args::ValueFlag<std::string> dataFlag(parser, "FILE", "Record table (YAML sequence of rows)", {'d', "data"});
    args::ValueFlag<std::string> outputFlag(parser, "FILE", "Output SVG file (- for stdout)", {'o', "output"}, "-");
    args::ValueFlag<int> perRowFlag(parser, "N", "Cards per row", {'n', "elements-per-row"});
    args::ValueFlag<std::string> flowFlag(parser, "MODE", "Card flow: regular | offset", {"flow"});
    args::ValueFlag<std::string> orientationFlag(parser, "SIDE", "Section heads: top | left", {"orientation"});
    args::ValueFlag<std::string> logLevelFlag(parser, "LEVEL", "Log level (trace..off)", {"log-level"}, "warn");
    args::ValueFlag<std::string> logFileFlag(parser, "FILE", "Write log to file instead of stderr", {"log-file"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    if (!dataFlag) {
        std::cerr << "Error: --data is required\n";
        return 1;
    }

    // Logging
    std::shared_ptr<spdlog::logger> logger;
    if (logFileFlag) {
        logger = spdlog::basic_logger_mt("cardgrid", args::get(logFileFlag), true);
    } else {
        logger = spdlog::stderr_color_mt("cardgrid");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(args::get(logLevelFlag)));

    // Command line overrides sit on top of file and environment
    YAML::Node overrides;
    if (perRowFlag) {
        if (args::get(perRowFlag) <= 0) {
            std::cerr << "Error: --elements-per-row must be positive\n";
            return 1;
        }
        overrides["grid"]["elements-per-row"] = args::get(perRowFlag);
    }
    if (flowFlag) {
        overrides["grid"]["flow"] = args::get(flowFlag);
    }
    if (orientationFlag) {
        overrides["section-head"]["orientation"] = args::get(orientationFlag);
    }

    auto config = Config::create(configFlag ? args::get(configFlag) : "", overrides);
    if (!config) {
        return fail("failed to load configuration", config);
    }

    auto columns = (*config)->inputColumns();
    if (!columns) {
        return fail("invalid input columns", columns);
    }
    auto layoutConfig = (*config)->layoutConfig();
    if (!layoutConfig) {
        return fail("invalid layout configuration", layoutConfig);
    }

    auto records = loadRecords(args::get(dataFlag), *columns);
    if (!records) {
        return fail("failed to load records", records);
    }

    auto cardGrid = CardGrid::create(*layoutConfig);
    if (!cardGrid) {
        return fail("failed to create layout", cardGrid);
    }
    auto page = (*cardGrid)->layout(*records);
    if (!page) {
        return fail("layout failed", page);
    }

    auto writer = scene::SvgWriter::create();
    if (!writer) {
        return fail("failed to create SVG writer", writer);
    }

    const std::string output = args::get(outputFlag);
    if (output == "-") {
        auto svg = (*writer)->write(*page);
        if (!svg) {
            return fail("failed to serialise SVG", svg);
        }
        std::cout << *svg;
    } else {
        auto written = (*writer)->writeFile(*page, output);
        if (!written) {
            return fail("failed to write output", written);
        }
    }

    yinfo("cardgrid-render: {} records, page {}x{}", records->size(), page->width, page->height);
    spdlog::shutdown();
    return 0;
}
