#ifndef KEYTREE_EXTENDED_KEY_HPP
#define KEYTREE_EXTENDED_KEY_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "exceptions.hpp"
#include "extended_key_attributes.hpp"
#include "key_version.hpp"
#include "secure_memory.hpp"

/**
 * @file extended_key.hpp
 * @brief Serialized form of an extended key (xprv/xpub/tprv/tpub).
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    /**
     * @struct ExtendedKey
     * @brief Wire layout of a BIP-32 extended key.
     *
     * 78 bytes: version(4) || depth(1) || parent fingerprint(4) ||
     * child number(4) || chain code(32) || key(33). For a private key the
     * key field is 0x00 followed by the scalar, for a public key it is the
     * compressed point. Carries no derivation logic.
     */
    struct ExtendedKey {
        /// Size of an extended key when deserialized into bytes from Base58.
        static constexpr std::size_t BYTE_SIZE = 78;

        /// Maximum size of a Base58Check-encoded extended key.
        static constexpr std::size_t MAX_BASE58_SIZE = 112;

        KeyVersion version = KeyVersion::fromU32(KeyVersion::XPRV);
        Depth depth = 0;
        KeyFingerprint parentFingerprint{};
        uint32_t childIndex = 0;
        ChainCode chainCode{};
        SecretArray<33> keyBytes;

        /// The 78-byte payload.
        SecureBytes toBytes() const;

        /// Base58Check encoding of the payload. Held in a SecureString since it
        /// may carry a private scalar.
        SecureString toString() const;

        /**
         * @throw DecodeException If len is not 78.
         */
        static ExtendedKey fromBytes(const uint8_t* data, std::size_t len);

        /**
         * @brief Decode a Base58Check extended key string.
         * @throw DecodeException On bad alphabet, checksum or payload length.
         */
        static ExtendedKey parse(std::string_view text);

        /// Copy of the attribute fields.
        ExtendedKeyAttributes attributes() const;
    };

} // namespace Keytree

#endif // KEYTREE_EXTENDED_KEY_HPP
