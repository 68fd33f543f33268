//
// Created by Giuseppe Francione on 06/12/25.
//

#include "../../include/byte_source.hpp"
#include "../../include/data_url.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include <system_error>

namespace imgscrub {

    ByteSource load_byte_source(const std::string& input) {
        ByteSource source;

        // long data URLs make stat() fail with ENAMETOOLONG, which lands in ec
        std::error_code ec;
        const std::filesystem::path path(input);
        if (std::filesystem::is_regular_file(path, ec)) {
            source.bytes = read_file(path);
            source.path = path;
            return source;
        }

        if (!DataUrl::looks_like_data_url(input)) {
            throw IoError("input is neither an existing file nor a data URL: " + path.filename().string());
        }

        auto payload = DataUrl::parse(input);
        source.bytes = std::move(payload.bytes);
        source.declared_mime = std::move(payload.mime);
        return source;
    }

} // namespace imgscrub
