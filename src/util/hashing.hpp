#ifndef PIIREDACT_UTIL_HASHING_HPP
#define PIIREDACT_UTIL_HASHING_HPP

#include <string>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <openssl/evp.h>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 document fingerprints.
 *
 * Logs and the archive identify documents by digest so that no document
 * text ever has to be written to either.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL's libcrypto.
 *
 * USAGE:
 *   @code
 *   std::string digest = piiredact::util::hashing::sha256(redactedText);
 *   std::string shortId = piiredact::util::hashing::shortDigest(digest);
 *   @endcode
 */

namespace piiredact {
namespace util {
namespace hashing {

/**
 * @brief SHA-256 of the input bytes as lowercase hex (64 characters).
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string sha256(const std::string &input)
{
    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        throw std::runtime_error("hashing::sha256: Failed to create EVP_MD_CTX.");
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int hashLength = 0;
    if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1
        || EVP_DigestFinal_ex(mdctx, hash, &hashLength) != 1)
    {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256: digest computation failed.");
    }
    EVP_MD_CTX_free(mdctx);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < hashLength; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(hash[i]);
    }
    return oss.str();
}

/**
 * @brief First 12 hex characters of a digest, for log lines.
 */
inline std::string shortDigest(const std::string &hexDigest)
{
    return hexDigest.substr(0, 12);
}

} // namespace hashing
} // namespace util
} // namespace piiredact

#endif // PIIREDACT_UTIL_HASHING_HPP
