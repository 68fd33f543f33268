//
// Created by Giuseppe Francione on 07/10/25.
//

#ifndef IMGSCRUB_RANDOM_UTILS_HPP
#define IMGSCRUB_RANDOM_UTILS_HPP

#include <cstddef>
#include <string>

/**
 * @brief Provides simple, thread-local random number utilities.
 *
 * Used to draw the non-identifying names of persisted artifacts. The
 * underlying generator (std::mt19937_64, seeded from std::random_device)
 * is thread-local, so callers on different threads never share state.
 */
namespace RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     * @return A random unsigned long long.
     */
    unsigned long long next_u64();

    /**
     * @brief Generates @p digits random lowercase hexadecimal characters.
     * @param digits Number of characters to produce.
     * @return A string matching [0-9a-f]{digits}.
     */
    std::string random_hex(std::size_t digits);

} // namespace

#endif //IMGSCRUB_RANDOM_UTILS_HPP
