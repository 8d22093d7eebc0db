#ifndef KEYTREE_EXTENDED_PUBLIC_KEY_HPP
#define KEYTREE_EXTENDED_PUBLIC_KEY_HPP

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>

#include "exceptions.hpp"
#include "extended_key.hpp"
#include "extended_key_attributes.hpp"
#include "hkd.hpp"
#include "key_backend.hpp"
#include "key_version.hpp"

/**
 * @file extended_public_key.hpp
 * @brief Extended public keys (xpub/tpub).
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    /**
     * @class ExtendedPublicKey
     * @brief A public point plus its extended key attributes.
     *
     * Obtained from ExtendedPrivateKey::publicKey() or by decoding an xpub.
     * Deriving children directly from a public key is not supported.
     *
     * @tparam Backend A key backend (see key_backend.hpp).
     */
    template <typename Backend>
    class ExtendedPublicKey {
        static_assert(is_key_backend<Backend>::value, "Backend does not satisfy the key backend contract");

    public:
        using Point = typename Backend::Point;

        ExtendedPublicKey(Point publicKey, const ExtendedKeyAttributes& attrs)
            : publicKey_(std::move(publicKey)), attrs_(attrs) {}

        /**
         * @brief Rebuild a public key from its wire form.
         * @throw DecodeException If the version is not a public one.
         * @throw CryptoException If the key bytes are not a valid point.
         */
        static ExtendedPublicKey fromExtendedKey(const ExtendedKey& key) {
            if (!key.version.isPublic()) {
                throw DecodeException("extended key version is not a public key version");
            }

            PublicKeyBytes bytes;
            std::copy(key.keyBytes.begin(), key.keyBytes.end(), bytes.begin());

            return ExtendedPublicKey(Backend::publicKeyFromBytes(bytes), key.attributes());
        }

        /**
         * @brief Decode an xpub/tpub string.
         * @throw DecodeException On any encoding or version error.
         * @throw CryptoException If the key bytes are not a valid point.
         */
        static ExtendedPublicKey parse(std::string_view text) {
            return fromExtendedKey(ExtendedKey::parse(text));
        }

        const Point& publicKey() const { return publicKey_; }
        const ExtendedKeyAttributes& attributes() const { return attrs_; }

        Depth depth() const { return attrs_.depth; }
        const KeyFingerprint& parentFingerprint() const { return attrs_.parentFingerprint; }
        ChildIndex childIndex() const { return attrs_.childIndex; }
        const ChainCode& chainCode() const { return attrs_.chainCode; }

        /// Compressed SEC1 encoding of the point.
        PublicKeyBytes toBytes() const { return Backend::publicKeyToBytes(publicKey_); }

        /// Fingerprint of this key, i.e. the parentFingerprint of its children.
        KeyFingerprint fingerprint() const { return HKD::fingerprint(toBytes()); }

        ExtendedKey toExtendedKey(const KeyVersion& version) const {
            ExtendedKey key;
            key.version = version;
            key.depth = attrs_.depth;
            key.parentFingerprint = attrs_.parentFingerprint;
            key.childIndex = attrs_.childIndex.raw();
            key.chainCode = attrs_.chainCode;

            const PublicKeyBytes bytes = toBytes();
            std::copy(bytes.begin(), bytes.end(), key.keyBytes.begin());
            return key;
        }

        /// Public keys are not secret, so the text is handed out as a plain string.
        std::string toString(const KeyVersion& version) const {
            return std::string(toExtendedKey(version).toString().view());
        }

        bool operator==(const ExtendedPublicKey& other) const {
            return attrs_ == other.attrs_ && toBytes() == other.toBytes();
        }

        bool operator!=(const ExtendedPublicKey& other) const { return !(*this == other); }

    private:
        Point publicKey_;
        ExtendedKeyAttributes attrs_;
    };

} // namespace Keytree

#endif // KEYTREE_EXTENDED_PUBLIC_KEY_HPP
