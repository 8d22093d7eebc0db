#ifndef KEYTREE_BASE58_HPP
#define KEYTREE_BASE58_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "exceptions.hpp"
#include "secure_memory.hpp"

/**
 * @file base58.hpp
 * @brief Base58 and Base58Check text encoding.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    /**
     * @class Base58
     * @brief Bitcoin-alphabet Base58, with optional double-SHA256 checksum.
     *
     * Both directions hold their output in zeroizing buffers since extended
     * private keys pass through here.
     */
    class Base58 {
    public:
        static SecureString encode(const uint8_t* data, std::size_t len);

        /**
         * @throw DecodeException On a character outside the alphabet.
         */
        static SecureBytes decode(std::string_view text);

        /// Appends the first 4 bytes of SHA256(SHA256(data)) and encodes.
        static SecureString encodeCheck(const uint8_t* data, std::size_t len);

        /**
         * @brief Decodes and verifies the trailing 4-byte checksum.
         * @return The payload without its checksum.
         * @throw DecodeException On a bad character, short input or checksum mismatch.
         */
        static SecureBytes decodeCheck(std::string_view text);

    private:
        Base58() = delete;
    };

} // namespace Keytree

#endif // KEYTREE_BASE58_HPP
