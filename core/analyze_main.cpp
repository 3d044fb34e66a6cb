#include "loadwatch/analysis/analyzer.h"
#include "loadwatch/analysis/report_renderer.h"
#include "loadwatch/analysis/sample_reader.h"
#include "loadwatch/config/app_config.h"
#include "loadwatch/utils/logger.h"

#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace loadwatch;

static const char* kVersion = "0.1.0";

// sysexits.h EX_USAGE
static constexpr int kUsageError = 64;

static void print_usage(std::ostream& os) {
    os << "Usage:\n"
       << "  loadwatch-analyze --file <path> [--format text|html|json] [--out <path>]\n"
       << "                    [--config <path>] [--log-level <level>] [--title <text>]\n"
       << "  loadwatch-analyze --help\n"
       << "  loadwatch-analyze --version\n"
       << "\n"
       << "Options:\n"
       << "  --file <path>         Load-test results: JMeter JTL CSV, or JSON lines (.jsonl/.ndjson).\n"
       << "  --format text|html|json\n"
       << "                        Report format (default text).\n"
       << "  --out <path>          Write the report to a file instead of stdout.\n"
       << "  --config <path>       TOML file; its [thresholds] and [logging] sections apply.\n"
       << "  --log-level <level>   trace, debug, info, warn, error, off (logs go to stderr).\n"
       << "  --title <text>        Report title.\n"
       << "\n"
       << "Exit status:\n"
       << "  0 PASS, 2 UNSTABLE, 1 FAIL or input/analysis error, 64 usage error.\n"
       << "\n"
       << "Examples:\n"
       << "  loadwatch-analyze --file results.jtl\n"
       << "  loadwatch-analyze --file results.jtl --format html --out report.html\n";
}

int main(int argc, char** argv) {
    // Global flags
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            print_usage(std::cout);
            return 0;
        }
        if (a == "--version") {
            std::cout << "loadwatch-analyze v" << kVersion << "\n";
            return 0;
        }
    }

    std::string file_path;
    std::string format = "text";
    std::string out_path;
    std::string config_path;
    std::string log_level;
    analysis::RenderOptions render_options;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];

        if (a == "--file" && i + 1 < argc) {
            file_path = argv[++i];
            continue;
        }
        if (a == "--format" && i + 1 < argc) {
            format = argv[++i];
            if (format != "text" && format != "html" && format != "json") {
                std::cerr << "Invalid --format. Use: text, html or json\n";
                return kUsageError;
            }
            continue;
        }
        if (a == "--out" && i + 1 < argc) {
            out_path = argv[++i];
            continue;
        }
        if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }
        if (a == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
            continue;
        }
        if (a == "--title" && i + 1 < argc) {
            render_options.title = argv[++i];
            continue;
        }

        std::cerr << "Unknown argument: " << a << "\n";
        print_usage(std::cerr);
        return kUsageError;
    }

    if (file_path.empty()) {
        std::cerr << "Missing --file <path>\n";
        print_usage(std::cerr);
        return kUsageError;
    }

    AppConfig config;
    if (!config_path.empty()) {
        auto loaded = AppConfig::from_toml_file(config_path);
        if (!loaded) {
            std::cerr << "Error: cannot load configuration from " << config_path << "\n";
            return 1;
        }
        config = std::move(*loaded);
    }
    config.apply_env();
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }

    auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& p : problems) {
            std::cerr << "Invalid configuration: " << p << "\n";
        }
        return 1;
    }
    const bool log_file_ok = configure_logging(config.logging);
    auto& logger = LoggerFactory::get_logger("analyze");
    if (!log_file_ok) {
        logger.with_field("file", config.logging.file).warn("Cannot open log file, logging to console");
    }

    // Read + analyze
    auto batch = analysis::read_samples(file_path);
    if (!batch) {
        std::cerr << "Error: " << file_path << ": " << analysis::to_string(batch.error()) << "\n";
        return 1;
    }

    auto report = analysis::analyze(*batch, config.thresholds);
    if (!report) {
        std::cerr << "Error: " << file_path << ": " << analysis::to_string(report.error())
                  << " (" << batch->malformed_count << " malformed rows)\n";
        return 1;
    }

    render_options.source = std::filesystem::path(file_path).filename().string();

    std::string rendered;
    try {
        if (format == "html") {
            rendered = analysis::render_html(*report, render_options);
        } else if (format == "json") {
            rendered = analysis::render_json(*report, render_options);
        } else {
            rendered = analysis::render_text(*report, render_options);
        }
    } catch (const std::exception& e) {
        logger.error(std::string("Report rendering failed: ") + e.what());
        std::cerr << "Error: cannot render " << format << " report: " << e.what() << "\n";
        return 1;
    }

    // Decide output stream
    if (!out_path.empty()) {
        std::ofstream fout(out_path, std::ios::out | std::ios::trunc);
        if (!fout) {
            std::cerr << "Error: Failed to open output file: " << out_path << "\n";
            return 1;
        }
        fout << rendered;
        if (!fout) {
            std::cerr << "Error: Failed to write output file: " << out_path << "\n";
            return 1;
        }
    } else {
        std::cout << rendered;
    }

    logger.with_field("total", report->total_count)
          .with_field("success_rate_pct", report->success_rate_pct)
          .with_field("avg_response_ms", report->avg_response_ms)
          .with_field("malformed", report->malformed_count)
          .info(std::string("Verdict: ") + analysis::to_string(report->verdict));
    LoggerFactory::flush_all();

    return analysis::exit_code(report->verdict);
}
