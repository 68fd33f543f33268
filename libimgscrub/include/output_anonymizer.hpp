//
// Created by Giuseppe Francione on 06/12/25.
//

/**
 * @file output_anonymizer.hpp
 * @brief Persists sanitized bytes under a name and file identity that say nothing about the source.
 */

#ifndef IMGSCRUB_OUTPUT_ANONYMIZER_HPP
#define IMGSCRUB_OUTPUT_ANONYMIZER_HPP

#include "sanitizer.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace imgscrub {

/// atime/mtime given to every persisted file: 2000-01-01T00:00:00Z.
inline constexpr std::int64_t kAnonymizedTimestamp = 946684800;

/// Permission bits given to every persisted file (0644).
inline constexpr std::filesystem::perms kAnonymizedPermissions =
    std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
    std::filesystem::perms::group_read | std::filesystem::perms::others_read;

/// Random hex digits in a persisted file name.
inline constexpr std::size_t kNameHexDigits = 8;

/// How many fresh names are drawn before giving up on collisions.
inline constexpr int kMaxNameAttempts = 16;

/**
 * @brief A best-effort reset that did not succeed.
 *
 * The file was written; only its timestamps or permission bits may still
 * carry the values the system gave them at creation.
 */
struct AnonymizeWarning {
    std::string operation; ///< "timestamps" or "permissions"
    std::string message;
};

/**
 * @brief A persisted sanitized file.
 */
struct AnonymizedFile {
    std::filesystem::path path;
    std::string basename;                      ///< img_xxxxxxxx.ext
    std::int64_t timestamp = kAnonymizedTimestamp;
    std::filesystem::perms permissions = kAnonymizedPermissions;
    std::vector<AnonymizeWarning> warnings;
};

/**
 * @brief Writes sanitized output to disk under a randomized name.
 */
class OutputAnonymizer {
public:
    /// Resets timestamps and permission bits of a written file, returning what failed.
    using IdentityReset = std::function<std::vector<AnonymizeWarning>(const std::filesystem::path&)>;

    /**
     * @brief Persist @p output in @p target_dir.
     *
     * The file is named img_<8 lowercase hex><ext>, with the extension taken
     * from the MIME type, and is created exclusively: an existing file is
     * never overwritten, a fresh name is drawn instead. Afterwards atime and
     * mtime are set to kAnonymizedTimestamp and the mode to 0644; failures of
     * those resets are reported in AnonymizedFile::warnings.
     *
     * @throws IoError if the directory is unusable, no free name was found
     * within kMaxNameAttempts, or writing fails.
     */
    static AnonymizedFile persist(const SanitizedOutput& output, const std::filesystem::path& target_dir);

    /**
     * @brief persist() with a caller supplied reset step.
     *
     * Every warning @p reset returns is logged at Warning and copied into
     * the result; the file stays in place.
     */
    static AnonymizedFile persist(const SanitizedOutput& output,
                                  const std::filesystem::path& target_dir,
                                  const IdentityReset& reset);

    /**
     * @brief Sets mode 0644 and atime/mtime kAnonymizedTimestamp on @p path.
     * @return One warning per operation that failed, empty on full success.
     */
    static std::vector<AnonymizeWarning> reset_identity(const std::filesystem::path& path);

    /// @return A fresh candidate basename for @p mime.
    static std::string random_basename(const std::string& mime);
};

} // namespace imgscrub

#endif // IMGSCRUB_OUTPUT_ANONYMIZER_HPP
