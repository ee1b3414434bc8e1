/**
 * @file random.cpp
 * @brief Secure random source over OpenSSL RAND_bytes.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#include "uuidkit/utils/random.hpp"
#include "uuidkit/utils/logger.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <climits>

namespace uuidkit {
namespace utils {

void fillSecureRandom(void* buffer, size_t length) {
    auto* out = static_cast<unsigned char*>(buffer);

    // RAND_bytes takes an int length
    while (length > 0) {
        int chunk = length > static_cast<size_t>(INT_MAX)
            ? INT_MAX
            : static_cast<int>(length);

        if (RAND_bytes(out, chunk) != 1) {
            char reason[256] = {0};
            ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
            LOG_ERROR("Random", "RAND_bytes failed: {}", reason);
            throw EntropyError(std::string("secure random source failed: ") + reason);
        }

        out += chunk;
        length -= static_cast<size_t>(chunk);
    }
}

}  // namespace utils
}  // namespace uuidkit
