//
// Created by Giuseppe Francione on 13/11/25.
//

#ifndef IMGSCRUB_FILE_UTILS_HPP
#define IMGSCRUB_FILE_UTILS_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace imgscrub {

    struct FileCloser {
        void operator()(FILE* f) const { if (f) std::fclose(f); }
    };

    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wbx").
     * @return FILE* pointer or nullptr if open failed (errno is set).
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Reads a whole file into memory.
     * @throws IoError if the file cannot be opened or read.
     */
    std::vector<std::uint8_t> read_file(const std::filesystem::path &path);

    /**
     * @brief Writes @p data to an already open stream and closes it.
     *
     * The stream is closed even on failure.
     *
     * @throws IoError if writing, flushing or closing fails.
     */
    void write_and_close(unique_FILE file, std::span<const std::uint8_t> data,
                         const std::filesystem::path &path);

    /**
     * @brief Removes a single file and logs the outcome.
     *
     * A file that is already gone is not an error.
     *
     * @param path The file to remove.
     * @param tag The logger tag of the caller.
     * @return true if the file no longer exists afterwards.
     */
    bool remove_file_logged(const std::filesystem::path &path,
                            std::string_view tag = "file_utils");

} // namespace imgscrub

#endif // IMGSCRUB_FILE_UTILS_HPP
