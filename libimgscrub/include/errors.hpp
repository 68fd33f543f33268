//
// Created by Giuseppe Francione on 02/12/25.
//

/**
 * @file errors.hpp
 * @brief Exception taxonomy raised by the sanitization pipeline.
 */

#ifndef IMGSCRUB_ERRORS_HPP
#define IMGSCRUB_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace imgscrub {

/**
 * @brief Base class of every error thrown by imgscrub.
 *
 * Derives from std::runtime_error so callers that only care about
 * "something failed" can keep catching std::exception.
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Input bytes are not a recognized, parseable image container.
class DecodeError final : public Error {
public:
    using Error::Error;
};

/// @brief The encoder rejected the raster or the requested output format.
class EncodeError final : public Error {
public:
    using Error::Error;
};

/// @brief Malformed data URL or invalid base64 payload.
class InvalidFormat final : public Error {
public:
    using Error::Error;
};

/// @brief Non-positive max dimension or another unusable option.
class InvalidConfig final : public Error {
public:
    using Error::Error;
};

/// @brief Filesystem read/write failure.
class IoError final : public Error {
public:
    using Error::Error;
};

} // namespace imgscrub

#endif // IMGSCRUB_ERRORS_HPP
