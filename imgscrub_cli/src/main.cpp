//
// Created by Giuseppe Francione on 18/09/25.
//

#include <CLI/CLI.hpp>
#include <iostream>
#include <string>
#include "cli/cli_parser.hpp"
#include "commands/commands.hpp"
#include "report/metadata_report.hpp"
#include "utils/color.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libimgscrub/include/logger.hpp"

namespace {

void setup_logging(const Settings& settings) {
    Logger::clear_sinks();

    if (!settings.log_file.empty()) {
        auto file_sink = std::make_unique<FileLogSink>(settings.log_file, true);
        if (!file_sink->is_open()) {
            std::cerr << YELLOW << "Cannot open log file " << settings.log_file.string() << RESET << std::endl;
        } else {
            Logger::add_sink(std::move(file_sink));
        }
    }

    // NONE silences the console only, a log file still gets everything
    if (settings.log_level == "NONE") {
        Logger::set_min_level(LogLevel::Debug);
        return;
    }
    const LogLevel level = Logger::string_to_level(settings.log_level);
    Logger::set_min_level(level);

    auto console_sink = std::make_unique<ConsoleLogSink>();
    console_sink->log_level = level;
    Logger::add_sink(std::move(console_sink));
}

int run_inspect(const Settings& settings) {
    const nlohmann::json out = build_inspect_report(settings);
    if (settings.json) {
        std::cout << out.dump(2) << std::endl;
    } else {
        print_text_report(std::cout, out);
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {

    CLI::App app{"imgscrub: strips metadata from images by re-encoding their pixels."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    setup_logging(settings);

    if (settings.command == Command::Sanitize) {
        return run_sanitize(std::cin, std::cout, std::cerr, options_from(settings));
    }

    try {
        return run_inspect(settings);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return 1;
    }
}
