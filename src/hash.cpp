#include "keytree/hash.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/ripemd.h>
#include <openssl/sha.h>

/**
 * @file hash.cpp
 * @brief Implementation of the OpenSSL digest wrappers.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    Hash::Digest256 Hash::sha256(const uint8_t* data, std::size_t len) {
        Digest256 digest{};
        if (SHA256(data, len, digest.data()) == nullptr) {
            throw CryptoException("SHA-256 failed");
        }
        return digest;
    }

    Hash::Digest256 Hash::doubleSha256(const uint8_t* data, std::size_t len) {
        Digest256 first = sha256(data, len);
        return sha256(first.data(), first.size());
    }

    Hash::Digest160 Hash::ripemd160(const uint8_t* data, std::size_t len) {
        Digest160 digest{};
        if (RIPEMD160(data, len, digest.data()) == nullptr) {
            throw CryptoException("RIPEMD-160 failed");
        }
        return digest;
    }

    Hash::Digest160 Hash::hash160(const uint8_t* data, std::size_t len) {
        Digest256 sha = sha256(data, len);
        return ripemd160(sha.data(), sha.size());
    }

    Hash::Mac512 Hash::hmacSha512(const uint8_t* key, std::size_t keyLen,
                                  const uint8_t* data, std::size_t len) {
        Mac512 mac;
        unsigned int macLen = 0;

        if (HMAC(EVP_sha512(), key, static_cast<int>(keyLen),
                 data, len, mac.data(), &macLen) == nullptr || macLen != mac.size()) {
            throw CryptoException("HMAC-SHA512 failed");
        }

        return mac;
    }

} // namespace Keytree
