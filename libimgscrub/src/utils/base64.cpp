//
// Created by Giuseppe Francione on 04/12/25.
//

#include "../../include/base64.hpp"
#include "../../include/errors.hpp"
#include <array>

namespace {

    constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    constexpr std::array<std::int8_t, 256> make_reverse_table() {
        std::array<std::int8_t, 256> table{};
        for (auto& v : table) v = -1;
        for (int i = 0; i < 64; ++i) {
            table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
        }
        return table;
    }

    constexpr auto kReverse = make_reverse_table();

} // namespace

namespace imgscrub {

    std::string Base64::encode(const std::span<const std::uint8_t> data) {
        std::string out;
        out.reserve((data.size() + 2) / 3 * 4);

        std::size_t i = 0;
        for (; i + 3 <= data.size(); i += 3) {
            const std::uint32_t n = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
            out.push_back(kAlphabet[(n >> 18) & 0x3F]);
            out.push_back(kAlphabet[(n >> 12) & 0x3F]);
            out.push_back(kAlphabet[(n >> 6) & 0x3F]);
            out.push_back(kAlphabet[n & 0x3F]);
        }

        const std::size_t rest = data.size() - i;
        if (rest == 1) {
            const std::uint32_t n = data[i] << 16;
            out.push_back(kAlphabet[(n >> 18) & 0x3F]);
            out.push_back(kAlphabet[(n >> 12) & 0x3F]);
            out.append("==");
        } else if (rest == 2) {
            const std::uint32_t n = (data[i] << 16) | (data[i + 1] << 8);
            out.push_back(kAlphabet[(n >> 18) & 0x3F]);
            out.push_back(kAlphabet[(n >> 12) & 0x3F]);
            out.push_back(kAlphabet[(n >> 6) & 0x3F]);
            out.push_back('=');
        }
        return out;
    }

    std::vector<std::uint8_t> Base64::decode(const std::string_view text) {
        if (text.size() % 4 != 0) {
            throw InvalidFormat("base64 length " + std::to_string(text.size()) + " is not a multiple of 4");
        }

        std::size_t padding = 0;
        if (!text.empty() && text.back() == '=') {
            padding = text.size() >= 2 && text[text.size() - 2] == '=' ? 2 : 1;
        }

        std::vector<std::uint8_t> out;
        out.reserve(text.size() / 4 * 3);

        const std::size_t data_chars = text.size() - padding;
        std::uint32_t acc = 0;
        for (std::size_t i = 0; i < data_chars; ++i) {
            const std::int8_t v = kReverse[static_cast<unsigned char>(text[i])];
            if (v < 0) {
                throw InvalidFormat("invalid base64 character at offset " + std::to_string(i));
            }
            acc = (acc << 6) | static_cast<std::uint32_t>(v);
            if (i % 4 == 3) {
                out.push_back(static_cast<std::uint8_t>(acc >> 16));
                out.push_back(static_cast<std::uint8_t>(acc >> 8));
                out.push_back(static_cast<std::uint8_t>(acc));
                acc = 0;
            }
        }

        // trailing partial quantum: 2 chars -> 1 byte, 3 chars -> 2 bytes
        if (padding == 2) {
            out.push_back(static_cast<std::uint8_t>(acc >> 4));
        } else if (padding == 1) {
            out.push_back(static_cast<std::uint8_t>(acc >> 10));
            out.push_back(static_cast<std::uint8_t>(acc >> 2));
        }
        return out;
    }

} // namespace imgscrub
