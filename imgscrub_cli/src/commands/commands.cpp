//
// Created by Giuseppe Francione on 18/09/25.
//

#include "commands.hpp"
#include "../report/metadata_report.hpp"
#include "../../../libimgscrub/include/errors.hpp"
#include "../../../libimgscrub/include/file_utils.hpp"
#include "../../../libimgscrub/include/logger.hpp"
#include "../../../libimgscrub/include/output_anonymizer.hpp"
#include "../../../libimgscrub/include/sanitizer.hpp"
#include <iterator>
#include <optional>
#include <string>

using namespace imgscrub;
namespace fs = std::filesystem;

ScopedFile::~ScopedFile() {
    if (!path_.empty()) remove_file_logged(path_, "main");
}

std::error_code ScopedFile::remove() {
    std::error_code ec;
    if (!path_.empty()) {
        fs::remove(path_, ec);
        path_.clear();
    }
    return ec;
}

SanitizeOptions options_from(const Settings& settings) {
    SanitizeOptions options;
    options.format = parse_output_format(settings.output_format);
    options.max_dim = settings.max_dim;
    return options;
}

// no trailing newline on success
int run_sanitize(std::istream& in, std::ostream& out, std::ostream& err, const SanitizeOptions& options) {
    const std::string input{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (input.find_first_not_of(" \t\r\n\f\v") == std::string::npos) {
        return 0;
    }

    try {
        const std::string result = sanitize_data_url(input, options);
        out << result << std::flush;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("sanitize failed: ") + e.what(), "main");
        err << e.what() << std::flush;
        return 1;
    }
    return 0;
}

nlohmann::json sanitize_and_report(const ByteSource& source, const Settings& settings) {
    const SanitizeOptions options = options_from(settings);

    fs::path sanitized_path;
    if (source.path) {
        sanitized_path = sanitize_file_to_temp(*source.path, options);
    } else {
        const SanitizedOutput output = Sanitizer().sanitize(source.bytes, options.format, options.max_dim,
                                                            source.declared_mime);
        std::error_code ec;
        const fs::path temp_dir = fs::temp_directory_path(ec);
        if (ec) {
            throw IoError("no usable temporary directory: " + ec.message());
        }
        sanitized_path = OutputAnonymizer::persist(output, temp_dir).path;
    }

    std::optional<ScopedFile> guard;
    if (settings.cleanup) guard.emplace(sanitized_path);

    const std::vector<std::uint8_t> sanitized = read_file(sanitized_path);
    nlohmann::json file = file_stat_report(sanitized_path);
    nlohmann::json report = build_metadata_report(sanitized, settings.exif_full);
    const std::string format = report["format"].get<std::string>();

    if (guard) {
        if (const std::error_code ec = guard->remove()) {
            file["delete_error"] = ec.message();
        } else {
            file["deleted"] = true;
        }
    }

    nlohmann::json out;
    out["sanitized"] = {{"file", std::move(file)}, {"report", std::move(report)}};
    out["sanitized_mime"] = mime_for_format(parse_output_format(format));
    return out;
}

nlohmann::json build_inspect_report(const Settings& settings) {
    const ByteSource source = load_byte_source(settings.input);

    nlohmann::json out;
    out["source"] = source.path ? source.path->filename().string() : std::string("<data-url>");
    out["before"] = build_metadata_report(source.bytes, settings.exif_full);
    if (source.path) {
        out["source_file"] = file_stat_report(*source.path);
    }

    if (settings.sanitize) {
        out.update(sanitize_and_report(source, settings));
    }
    return out;
}
