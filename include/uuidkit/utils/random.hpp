/**
 * @file random.hpp
 * @brief Cryptographically secure random bytes.
 *
 * Backed by the OpenSSL CSPRNG. Running out of entropy is not recoverable
 * for callers and is reported with EntropyError.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#pragma once

#include "uuidkit/utils/export.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace uuidkit {
namespace utils {

/**
 * @class EntropyError
 * @brief The secure random source could not produce bytes.
 */
class UUIDKIT_UTILS_API EntropyError : public std::runtime_error {
public:
    explicit EntropyError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Fill a buffer with secure random bytes.
 * @throws EntropyError if the random source fails.
 */
UUIDKIT_UTILS_API void fillSecureRandom(void* buffer, size_t length);

/**
 * @brief Return N secure random bytes.
 * @throws EntropyError if the random source fails.
 */
template<size_t N>
std::array<uint8_t, N> secureRandomBytes() {
    std::array<uint8_t, N> bytes{};
    fillSecureRandom(bytes.data(), bytes.size());
    return bytes;
}

/**
 * @brief Return a secure random 16-bit value.
 */
inline uint16_t secureRandomU16() {
    auto bytes = secureRandomBytes<2>();
    return static_cast<uint16_t>((bytes[0] << 8) | bytes[1]);
}

}  // namespace utils
}  // namespace uuidkit
