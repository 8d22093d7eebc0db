#ifndef KEYTREE_HASH_HPP
#define KEYTREE_HASH_HPP

#include <array>
#include <cstddef>
#include <cstdint>

#include "exceptions.hpp"
#include "secure_memory.hpp"

/**
 * @file hash.hpp
 * @brief Thin OpenSSL wrappers for the digests used by BIP-32.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    /**
     * @class Hash
     * @brief SHA-256, RIPEMD-160 and HMAC-SHA512 over raw byte buffers.
     *
     * Every function throws CryptoException if the underlying OpenSSL call fails.
     */
    class Hash {
    public:
        using Digest256 = std::array<uint8_t, 32>;
        using Digest160 = std::array<uint8_t, 20>;
        using Mac512 = SecretArray<64>;

        static Digest256 sha256(const uint8_t* data, std::size_t len);

        /// SHA256(SHA256(data)), used for the Base58Check checksum.
        static Digest256 doubleSha256(const uint8_t* data, std::size_t len);

        static Digest160 ripemd160(const uint8_t* data, std::size_t len);

        /// RIPEMD160(SHA256(data)).
        static Digest160 hash160(const uint8_t* data, std::size_t len);

        /**
         * @brief HMAC-SHA512 of a message under a key.
         * @return The 64-byte MAC, held in a buffer that erases itself.
         * @throw CryptoException If HMAC-SHA512 fails.
         */
        static Mac512 hmacSha512(const uint8_t* key, std::size_t keyLen,
                                 const uint8_t* data, std::size_t len);

    private:
        Hash() = delete;
    };

} // namespace Keytree

#endif // KEYTREE_HASH_HPP
