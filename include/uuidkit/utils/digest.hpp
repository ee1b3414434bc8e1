/**
 * @file digest.hpp
 * @brief MD5 and SHA-1 message digests for name-based UUIDs.
 *
 * Thin RAII wrapper over the OpenSSL EVP digest interface.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#pragma once

#include "uuidkit/utils/export.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// Avoid pulling OpenSSL headers into every consumer
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace uuidkit {
namespace utils {

/**
 * @class DigestError
 * @brief Raised when the underlying crypto library fails.
 */
class UUIDKIT_UTILS_API DigestError : public std::runtime_error {
public:
    explicit DigestError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @enum DigestAlgorithm
 * @brief Hash functions used by RFC 4122 name-based UUIDs.
 */
enum class DigestAlgorithm {
    MD5,    ///< 16-byte digest, UUID version 3
    SHA1    ///< 20-byte digest, UUID version 5
};

inline const char* digestAlgorithmToString(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::MD5: return "MD5";
        case DigestAlgorithm::SHA1: return "SHA-1";
        default: return "unknown";
    }
}

using Md5Digest = std::array<uint8_t, 16>;
using Sha1Digest = std::array<uint8_t, 20>;

/**
 * @class MessageDigest
 * @brief Incremental hash calculator.
 *
 * Usage:
 * @code
 * MessageDigest digest(DigestAlgorithm::SHA1);
 * digest.update(namespace_bytes.data(), namespace_bytes.size());
 * digest.update(name);
 * std::vector<uint8_t> hash = digest.finalize();
 * @endcode
 */
class UUIDKIT_UTILS_API MessageDigest {
public:
    /**
     * @brief Create a context ready to accept data.
     * @throws DigestError if the context cannot be initialized.
     */
    explicit MessageDigest(DigestAlgorithm algorithm);

    ~MessageDigest();

    MessageDigest(const MessageDigest&) = delete;
    MessageDigest& operator=(const MessageDigest&) = delete;

    MessageDigest(MessageDigest&&) noexcept;
    MessageDigest& operator=(MessageDigest&&) noexcept;

    void update(const void* data, size_t length);

    void update(const std::string& data) {
        update(data.data(), data.size());
    }

    /**
     * @brief Finish the hash and return the digest bytes.
     *
     * The context is reset afterwards and may be reused.
     */
    std::vector<uint8_t> finalize();

    /**
     * @brief Discard any data added so far.
     */
    void reset();

    DigestAlgorithm algorithm() const { return algorithm_; }

    /**
     * @brief Digest length in bytes for the configured algorithm.
     */
    size_t size() const;

private:
    struct ContextDeleter {
        void operator()(EVP_MD_CTX* ctx) const;
    };

    DigestAlgorithm algorithm_;
    std::unique_ptr<EVP_MD_CTX, ContextDeleter> ctx_;
};

/**
 * @brief Compute the MD5 digest of a buffer in one call.
 */
UUIDKIT_UTILS_API Md5Digest md5(const void* data, size_t length);

inline Md5Digest md5(const std::string& data) {
    return md5(data.data(), data.size());
}

/**
 * @brief Compute the SHA-1 digest of a buffer in one call.
 */
UUIDKIT_UTILS_API Sha1Digest sha1(const void* data, size_t length);

inline Sha1Digest sha1(const std::string& data) {
    return sha1(data.data(), data.size());
}

}  // namespace utils
}  // namespace uuidkit
