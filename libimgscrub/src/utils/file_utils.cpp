//
// Created by Giuseppe Francione on 17/11/25.
//

#include "../../include/file_utils.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

namespace imgscrub {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        // On Windows, convert mode to wstring and use _wfopen, which accepts
        // wide-char paths (UTF-16), supporting Unicode and long paths.
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = std::filesystem::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }

        // prepend the magic prefix to bypass MAX_PATH
        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
        const unique_FILE fp(open_file(path, "rb"));
        if (!fp) {
            throw IoError("cannot open " + path.string() + ": " + std::strerror(errno));
        }

        std::vector<std::uint8_t> data;
        std::uint8_t chunk[64 * 1024];
        std::size_t n = 0;
        while ((n = std::fread(chunk, 1, sizeof(chunk), fp.get())) > 0) {
            data.insert(data.end(), chunk, chunk + n);
        }
        if (std::ferror(fp.get())) {
            throw IoError("read error on " + path.string());
        }

        Logger::log(LogLevel::Debug,
                    "Read " + std::to_string(data.size()) + " bytes from " + path.filename().string(),
                    "file_utils");
        return data;
    }

    void write_and_close(unique_FILE file, const std::span<const std::uint8_t> data,
                         const std::filesystem::path& path) {
        const bool written = data.empty() ||
                             std::fwrite(data.data(), 1, data.size(), file.get()) == data.size();
        const bool flushed = std::fflush(file.get()) == 0;
        const bool closed = std::fclose(file.release()) == 0;
        if (!written || !flushed || !closed) {
            throw IoError("write failed on " + path.string() + ": " + std::strerror(errno));
        }
    }

    bool remove_file_logged(const std::filesystem::path& path, const std::string_view tag) {
        std::error_code ec;
        const bool removed = std::filesystem::remove(path, ec);
        if (ec) {
            Logger::log(LogLevel::Warning,
                        "Can't remove " + path.filename().string() + " (" + ec.message() + ")", tag);
            return false;
        }
        if (removed) {
            Logger::log(LogLevel::Debug, "Removed " + path.filename().string(), tag);
        } else {
            Logger::log(LogLevel::Debug, path.filename().string() + " already gone", tag);
        }
        return true;
    }

} // namespace imgscrub
