//
// Created by Giuseppe Francione on 06/12/25.
//

#include "../../include/output_anonymizer.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <cerrno>
#include <cstring>
#include <system_error>

#ifdef _WIN32
#include <chrono>
#else
#include <fcntl.h>
#include <sys/stat.h>
#endif

namespace {

    constexpr const char* kTag = "output_anonymizer";

    // returns an empty string on success, the error message otherwise
    std::string reset_timestamps(const std::filesystem::path& path) {
#ifdef _WIN32
        // atime cannot be set through std::filesystem
        std::error_code ec;
        const auto when = std::chrono::file_clock::from_sys(
            std::chrono::sys_seconds{std::chrono::seconds{imgscrub::kAnonymizedTimestamp}});
        std::filesystem::last_write_time(path, when, ec);
        return ec ? ec.message() : std::string{};
#else
        const timespec times[2] = {
            {static_cast<time_t>(imgscrub::kAnonymizedTimestamp), 0},
            {static_cast<time_t>(imgscrub::kAnonymizedTimestamp), 0}
        };
        if (utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
            return std::strerror(errno);
        }
        return {};
#endif
    }

} // namespace

namespace imgscrub {

std::string OutputAnonymizer::random_basename(const std::string& mime) {
    return "img_" + RandomUtils::random_hex(kNameHexDigits) + extension_for_mime(mime);
}

std::vector<AnonymizeWarning> OutputAnonymizer::reset_identity(const std::filesystem::path& path) {
    std::vector<AnonymizeWarning> warnings;

    std::error_code ec;
    std::filesystem::permissions(path, kAnonymizedPermissions, std::filesystem::perm_options::replace, ec);
    if (ec) {
        warnings.push_back({"permissions", ec.message()});
    }

    if (const std::string err = reset_timestamps(path); !err.empty()) {
        warnings.push_back({"timestamps", err});
    }
    return warnings;
}

AnonymizedFile OutputAnonymizer::persist(const SanitizedOutput& output, const std::filesystem::path& target_dir) {
    return persist(output, target_dir, &OutputAnonymizer::reset_identity);
}

AnonymizedFile OutputAnonymizer::persist(const SanitizedOutput& output,
                                         const std::filesystem::path& target_dir,
                                         const IdentityReset& reset) {
    std::error_code ec;
    if (!std::filesystem::is_directory(target_dir, ec)) {
        throw IoError("persist: not a directory: " + target_dir.string());
    }

    AnonymizedFile result;
    unique_FILE file;
    for (int attempt = 0; attempt < kMaxNameAttempts && !file; ++attempt) {
        result.basename = random_basename(output.mime);
        result.path = target_dir / result.basename;

        // "x": fail instead of truncating somebody else's file
        file.reset(open_file(result.path, "wbx"));
        if (!file) {
            if (errno == EEXIST) {
                Logger::log(LogLevel::Debug, "Name collision on " + result.basename + ", drawing again", kTag);
                continue;
            }
            throw IoError("persist: cannot create " + result.path.string() + ": " + std::strerror(errno));
        }
    }
    if (!file) {
        throw IoError("persist: no free file name in " + target_dir.string() + " after " +
                      std::to_string(kMaxNameAttempts) + " attempts");
    }

    try {
        write_and_close(std::move(file), output.bytes, result.path);
    } catch (const IoError&) {
        remove_file_logged(result.path, kTag);
        throw;
    }

    if (reset) {
        result.warnings = reset(result.path);
    }

    for (const auto& [operation, message] : result.warnings) {
        Logger::log(LogLevel::Warning,
                    "Could not reset " + operation + " of " + result.basename + ": " + message, kTag);
    }

    Logger::log(LogLevel::Info,
                "Persisted " + std::to_string(output.bytes.size()) + " bytes as " + result.basename, kTag);
    return result;
}

} // namespace imgscrub
