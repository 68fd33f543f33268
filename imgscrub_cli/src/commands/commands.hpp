//
// Created by Giuseppe Francione on 18/09/25.
//

#ifndef IMGSCRUB_COMMANDS_HPP
#define IMGSCRUB_COMMANDS_HPP

#include "../cli/cli_parser.hpp"
#include "../../../libimgscrub/include/byte_source.hpp"
#include "../../../libimgscrub/include/imgscrub.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <istream>
#include <ostream>
#include <system_error>

/**
 * @brief Removes the wrapped file when it goes out of scope.
 *
 * remove() deletes it early and reports the outcome; the destructor then
 * has nothing left to do.
 */
class ScopedFile {
public:
    explicit ScopedFile(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScopedFile();

    ScopedFile(const ScopedFile&) = delete;
    ScopedFile& operator=(const ScopedFile&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    /// Deletes the file now. @return the removal error, empty on success.
    std::error_code remove();

private:
    std::filesystem::path path_;
};

imgscrub::SanitizeOptions options_from(const Settings& settings);

/**
 * @brief The `sanitize` command: data URL on @p in, sanitized data URL on @p out.
 *
 * Blank input produces no output and exit code 0. On failure the error
 * text goes to @p err and nothing to @p out.
 *
 * @return Process exit code (0 or 1).
 */
int run_sanitize(std::istream& in, std::ostream& out, std::ostream& err,
                 const imgscrub::SanitizeOptions& options);

/**
 * @brief Sanitizes @p source into the temp directory and reports on the result.
 *
 * File sources go through sanitize_file_to_temp(); data URLs are sanitized
 * in memory and persisted directly, so the unsanitized bytes never touch
 * the disk. With Settings::cleanup the sanitized file is removed before
 * returning, also when reporting throws.
 *
 * @return {"sanitized": {"file", "report"}, "sanitized_mime"}.
 */
nlohmann::json sanitize_and_report(const imgscrub::ByteSource& source, const Settings& settings);

/**
 * @brief Assembles the full `inspect` report for Settings::input.
 * @throws imgscrub::Error on unreadable or undecodable input.
 */
nlohmann::json build_inspect_report(const Settings& settings);

#endif // IMGSCRUB_COMMANDS_HPP
