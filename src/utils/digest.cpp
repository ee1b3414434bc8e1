/**
 * @file digest.cpp
 * @brief MessageDigest implementation over OpenSSL EVP.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#include "uuidkit/utils/digest.hpp"
#include "uuidkit/utils/logger.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <algorithm>

namespace uuidkit {
namespace utils {

namespace {

const EVP_MD* evpFor(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::MD5: return EVP_md5();
        case DigestAlgorithm::SHA1: return EVP_sha1();
    }
    return nullptr;
}

[[noreturn]] void throwDigestError(const char* step, DigestAlgorithm algorithm) {
    char reason[256] = {0};
    ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
    LOG_ERROR("Digest", "{} failed for {}: {}", step,
              digestAlgorithmToString(algorithm), reason);
    throw DigestError(std::string(step) + " failed for " +
                      digestAlgorithmToString(algorithm) + ": " + reason);
}

}  // namespace

void MessageDigest::ContextDeleter::operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
}

MessageDigest::MessageDigest(DigestAlgorithm algorithm)
    : algorithm_(algorithm)
    , ctx_(EVP_MD_CTX_new())
{
    if (!ctx_) {
        throwDigestError("EVP_MD_CTX_new", algorithm_);
    }
    reset();
}

MessageDigest::~MessageDigest() = default;

MessageDigest::MessageDigest(MessageDigest&&) noexcept = default;

MessageDigest& MessageDigest::operator=(MessageDigest&&) noexcept = default;

void MessageDigest::update(const void* data, size_t length) {
    if (length == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, length) != 1) {
        throwDigestError("EVP_DigestUpdate", algorithm_);
    }
}

std::vector<uint8_t> MessageDigest::finalize() {
    std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int length = 0;

    if (EVP_DigestFinal_ex(ctx_.get(), result.data(), &length) != 1) {
        throwDigestError("EVP_DigestFinal_ex", algorithm_);
    }
    result.resize(length);

    reset();
    return result;
}

void MessageDigest::reset() {
    if (EVP_DigestInit_ex(ctx_.get(), evpFor(algorithm_), nullptr) != 1) {
        throwDigestError("EVP_DigestInit_ex", algorithm_);
    }
}

size_t MessageDigest::size() const {
    return static_cast<size_t>(EVP_MD_size(evpFor(algorithm_)));
}

Md5Digest md5(const void* data, size_t length) {
    MessageDigest digest(DigestAlgorithm::MD5);
    digest.update(data, length);
    auto bytes = digest.finalize();

    Md5Digest result{};
    std::copy_n(bytes.begin(), result.size(), result.begin());
    return result;
}

Sha1Digest sha1(const void* data, size_t length) {
    MessageDigest digest(DigestAlgorithm::SHA1);
    digest.update(data, length);
    auto bytes = digest.finalize();

    Sha1Digest result{};
    std::copy_n(bytes.begin(), result.size(), result.begin());
    return result;
}

}  // namespace utils
}  // namespace uuidkit
