//
// Created by Giuseppe Francione on 20/09/25.
//

#include "cli_parser.hpp"
#include "../../../libimgscrub/include/output_format.hpp"
#include <CLI/CLI.hpp>

namespace {

// output formats the encoders can produce
struct OutputFormatValidator : CLI::Validator {
    OutputFormatValidator() {
        name_ = "OutputFormat";
        func_ = [](const std::string& str) {
            if (imgscrub::parse_output_format(str).kind == imgscrub::OutputFormatKind::Other) {
                return std::string("Invalid format: '") + str + "'. Must be one of: PNG, JPEG, JPG, WEBP.";
            }
            return std::string(); // ok
        };
    }
};

void add_pipeline_options(CLI::App& cmd, Settings& settings) {
    cmd.add_option("--output-format", settings.output_format,
                   "Encode the sanitized image as PNG (default), JPEG or WEBP.")
        ->default_val("PNG")
        ->check(OutputFormatValidator());

    cmd.add_option("--max-dim", settings.max_dim,
                   "Downscale so that the longest edge is at most N pixels.")
        ->default_val(imgscrub::kDefaultMaxDimension)
        ->check(CLI::PositiveNumber);
}

} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.require_subcommand(1);

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
        ->default_val("ERROR")
        ->transform(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    // --- sanitize ---
    CLI::App* sanitize = app.add_subcommand(
        "sanitize", "Read a data URL from stdin, write the sanitized image as a data URL to stdout.");
    add_pipeline_options(*sanitize, settings);
    sanitize->callback([&settings]() { settings.command = Command::Sanitize; });

    // --- inspect ---
    CLI::App* inspect = app.add_subcommand(
        "inspect", "Report the metadata of an image, optionally before and after sanitization.");
    add_pipeline_options(*inspect, settings);

    inspect->add_option("input", settings.input, "Path to an image file or a data URL.")
        ->required();

    inspect->add_flag("--sanitize", settings.sanitize,
                      "Run the image through the sanitizer and report both versions.");
    inspect->add_flag("--exif-full", settings.exif_full,
                      "Include the full EXIF map instead of the privacy relevant subset.");
    inspect->add_flag("--json", settings.json,
                      "Emit JSON instead of text.");
    inspect->add_flag("--cleanup", settings.cleanup,
                      "Delete the sanitized temp file after reporting.");

    inspect->callback([&settings]() {
        settings.command = Command::Inspect;
        if (settings.cleanup && !settings.sanitize) {
            throw CLI::ValidationError("--cleanup", "only meaningful together with --sanitize");
        }
    });
}
