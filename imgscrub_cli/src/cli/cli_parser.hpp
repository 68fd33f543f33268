//
// Created by Giuseppe Francione on 20/09/25.
//

#ifndef IMGSCRUB_CLI_PARSER_HPP
#define IMGSCRUB_CLI_PARSER_HPP

#include "../../../libimgscrub/include/dimension_bounder.hpp"
#include <filesystem>
#include <string>

// forward declaration
namespace CLI { class App; }

enum class Command {
    Sanitize,
    Inspect
};

struct Settings {
    Command command = Command::Sanitize;

    // shared
    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::string output_format = "PNG";
    int max_dim = imgscrub::kDefaultMaxDimension;

    // inspect
    std::string input;
    bool sanitize = false;
    bool exif_full = false;
    bool json = false;
    bool cleanup = false;
};

/**
 * @brief Configures the CLI11 parser with the sanitize and inspect subcommands.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif //IMGSCRUB_CLI_PARSER_HPP
