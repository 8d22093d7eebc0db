#ifndef KEYTREE_EXTENDED_PRIVATE_KEY_HPP
#define KEYTREE_EXTENDED_PRIVATE_KEY_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "child_index.hpp"
#include "derivation_path.hpp"
#include "exceptions.hpp"
#include "extended_key.hpp"
#include "extended_key_attributes.hpp"
#include "extended_public_key.hpp"
#include "hkd.hpp"
#include "key_backend.hpp"
#include "key_version.hpp"
#include "secure_memory.hpp"

/**
 * @file extended_private_key.hpp
 * @brief Extended private keys (xprv/tprv) and BIP-32 child key derivation.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    /**
     * @class ExtendedPrivateKey
     * @brief Implements BIP-32 compliant hierarchical deterministic key derivation
     * over a pluggable curve backend.
     *
     * The private scalar is owned exclusively and erased by the backend's
     * Scalar type when this object goes away. Equality is constant-time.
     *
     * @tparam Backend A key backend (see key_backend.hpp).
     */
    template <typename Backend>
    class ExtendedPrivateKey {
        static_assert(is_key_backend<Backend>::value, "Backend does not satisfy the key backend contract");

    public:
        using Scalar = typename Backend::Scalar;
        using PublicKey = ExtendedPublicKey<Backend>;

        /// Maximum derivation depth.
        static constexpr Depth MAX_DEPTH = std::numeric_limits<Depth>::max();

        ExtendedPrivateKey(Scalar privateKey, const ExtendedKeyAttributes& attrs)
            : privateKey_(std::move(privateKey)), attrs_(attrs) {}

        /**
         * @brief Derives the master node from a seed.
         * @param seed Seed bytes.
         * @param len 16, 32 or 64.
         * @return Root key (depth 0, zero parent fingerprint, child 0).
         * @throw SeedLengthException If len is not allowed.
         * @throw CryptoException If I_L is not a valid scalar.
         */
        static ExtendedPrivateKey fromSeed(const uint8_t* seed, std::size_t len) {
            HKD::NodeMaterial I = HKD::computeMasterNode(seed, len);

            ExtendedKeyAttributes attrs;
            attrs.chainCode = I.chainCode;

            return ExtendedPrivateKey(Backend::scalarFromBytes(I.key), attrs);
        }

        /// Overload for any contiguous byte container (std::vector, std::array, SecureBytes).
        template <typename Bytes>
        static ExtendedPrivateKey fromSeed(const Bytes& seed) {
            static_assert(std::is_same<std::remove_cv_t<typename Bytes::value_type>, uint8_t>::value,
                          "seed must be a container of uint8_t");
            return fromSeed(seed.data(), seed.size());
        }

        /**
         * @brief Derives the key at path from the root of seed.
         *
         * Stops at the first failing step; no partially derived key is returned.
         */
        template <typename Bytes>
        static ExtendedPrivateKey deriveFromPath(const Bytes& seed, const DerivationPath& path) {
            return fromSeed(seed).derivePath(path);
        }

        /**
         * @brief Derives a child key.
         *
         * Applies the BIP-32 CKD function. Normal or hardened derivation is
         * chosen from the index. An invalid child scalar (probability below
         * 2^-127) is reported, never skipped over.
         *
         * @param index Child index.
         * @return The derived child.
         * @throw DepthException If this key is already at depth 255.
         * @throw CryptoException If the derived key is invalid.
         */
        ExtendedPrivateKey deriveChild(ChildIndex index) const {
            const Depth depth = HKD::childDepth(attrs_.depth);
            const PublicKeyBytes parentPublic = publicKeyBytes();

            HKD::NodeMaterial I = index.isHardened()
                ? HKD::computeHardenedChild(attrs_.chainCode, Backend::scalarToBytes(privateKey_), index)
                : HKD::computeNormalChild(attrs_.chainCode, parentPublic, index);

            ExtendedKeyAttributes attrs;
            attrs.depth = depth;
            attrs.parentFingerprint = HKD::fingerprint(parentPublic);
            attrs.childIndex = index;
            attrs.chainCode = I.chainCode;

            return ExtendedPrivateKey(Backend::deriveChildScalar(privateKey_, I.key), attrs);
        }

        /**
         * @brief Derives a descendant of this key along a relative path.
         */
        ExtendedPrivateKey derivePath(const DerivationPath& path) const {
            ExtendedPrivateKey current = *this;
            for (const ChildIndex& index : path) {
                current = current.deriveChild(index);
            }
            return current;
        }

        /**
         * @brief Derives count consecutive normal children starting at first.
         * @throw ChildIndexException If the range reaches into the hardened half.
         */
        std::vector<ExtendedPrivateKey> deriveChildren(uint32_t first, uint32_t count) const {
            if (count > 0 && (first >= ChildIndex::HARDENED_OFFSET ||
                              count - 1 > ChildIndex::HARDENED_OFFSET - 1 - first)) {
                throw ChildIndexException("child range runs into hardened indices");
            }

            std::vector<ExtendedPrivateKey> keys;
            keys.reserve(count);

            for (uint32_t i = 0; i < count; ++i) {
                keys.push_back(deriveChild(ChildIndex::normal(first + i)));
            }

            return keys;
        }

        /**
         * @brief Rebuild a private key from its wire form.
         * @throw DecodeException If the version is not private or the key does not start with 0x00.
         * @throw CryptoException If the scalar is zero or out of range.
         */
        static ExtendedPrivateKey fromExtendedKey(const ExtendedKey& key) {
            if (!key.version.isPrivate()) {
                throw DecodeException("extended key version is not a private key version");
            }
            if (key.keyBytes[0] != 0x00) {
                throw DecodeException("private key material must start with 0x00");
            }

            SecretKeyBytes scalar(key.keyBytes.data() + 1, KEY_SIZE);
            return ExtendedPrivateKey(Backend::scalarFromBytes(scalar), key.attributes());
        }

        /**
         * @brief Decode an xprv/tprv string.
         * @throw DecodeException On any encoding or version error.
         * @throw CryptoException If the scalar is invalid.
         */
        static ExtendedPrivateKey parse(std::string_view text) {
            return fromExtendedKey(ExtendedKey::parse(text));
        }

        /**
         * @brief The matching extended public key: same attributes, point instead of scalar.
         */
        PublicKey publicKey() const {
            return PublicKey(Backend::publicKeyOf(privateKey_), attrs_);
        }

        const Scalar& privateKey() const { return privateKey_; }
        const ExtendedKeyAttributes& attributes() const { return attrs_; }

        Depth depth() const { return attrs_.depth; }
        const KeyFingerprint& parentFingerprint() const { return attrs_.parentFingerprint; }
        ChildIndex childIndex() const { return attrs_.childIndex; }
        const ChainCode& chainCode() const { return attrs_.chainCode; }

        /// Big-endian scalar bytes.
        SecretKeyBytes toBytes() const { return Backend::scalarToBytes(privateKey_); }

        KeyFingerprint fingerprint() const { return HKD::fingerprint(publicKeyBytes()); }

        ExtendedKey toExtendedKey(const KeyVersion& version) const {
            ExtendedKey key;
            key.version = version;
            key.depth = attrs_.depth;
            key.parentFingerprint = attrs_.parentFingerprint;
            key.childIndex = attrs_.childIndex.raw();
            key.chainCode = attrs_.chainCode;

            const SecretKeyBytes scalar = toBytes();
            key.keyBytes[0] = 0x00;
            std::copy(scalar.begin(), scalar.end(), key.keyBytes.begin() + 1);
            return key;
        }

        /**
         * @brief xprv/tprv text, erased when the returned object goes away.
         */
        SecureString toString(const KeyVersion& version) const {
            return toExtendedKey(version).toString();
        }

        /**
         * @brief Constant-time comparison of the scalar bytes and every attribute.
         */
        bool secureEquals(const ExtendedPrivateKey& other) const {
            const SecretKeyBytes ours = toBytes();
            const SecretKeyBytes theirs = other.toBytes();

            bool same = ours.secureEquals(theirs);
            same &= attrs_.secureEquals(other.attrs_);
            return same;
        }

        bool operator==(const ExtendedPrivateKey& other) const { return secureEquals(other); }
        bool operator!=(const ExtendedPrivateKey& other) const { return !secureEquals(other); }

    private:
        PublicKeyBytes publicKeyBytes() const {
            return Backend::publicKeyToBytes(Backend::publicKeyOf(privateKey_));
        }

        Scalar privateKey_;
        ExtendedKeyAttributes attrs_;
    };

} // namespace Keytree

#endif // KEYTREE_EXTENDED_PRIVATE_KEY_HPP
