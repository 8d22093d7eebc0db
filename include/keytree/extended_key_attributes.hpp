#ifndef KEYTREE_EXTENDED_KEY_ATTRIBUTES_HPP
#define KEYTREE_EXTENDED_KEY_ATTRIBUTES_HPP

#include <array>
#include <cstdint>

#include "child_index.hpp"
#include "secure_memory.hpp"

/**
 * @file extended_key_attributes.hpp
 * @brief Metadata carried alongside every derived key.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    /// Size of input key material and derived keys.
    constexpr std::size_t KEY_SIZE = 32;

    using ChainCode = std::array<uint8_t, KEY_SIZE>;
    using KeyFingerprint = std::array<uint8_t, 4>;
    using Depth = uint8_t;

    /**
     * @struct ExtendedKeyAttributes
     * @brief Depth, parent fingerprint, child index and chain code.
     *
     * depth is 0 only for a root key; for every other key it is the parent's
     * depth plus one. parentFingerprint identifies the parent's public key.
     */
    struct ExtendedKeyAttributes {
        Depth depth = 0;
        KeyFingerprint parentFingerprint{};
        ChildIndex childIndex;
        ChainCode chainCode{};

        bool isRoot() const { return depth == 0; }

        /**
         * @brief Constant-time comparison of every field.
         */
        bool secureEquals(const ExtendedKeyAttributes& other) const noexcept {
            const auto ours = childIndex.toBytes();
            const auto theirs = other.childIndex.toBytes();

            bool same = secure_equals(&depth, &other.depth, sizeof(depth));
            same &= secure_equals(parentFingerprint.data(), other.parentFingerprint.data(), parentFingerprint.size());
            same &= secure_equals(ours.data(), theirs.data(), ours.size());
            same &= secure_equals(chainCode.data(), other.chainCode.data(), chainCode.size());
            return same;
        }

        bool operator==(const ExtendedKeyAttributes& other) const {
            return depth == other.depth
                && parentFingerprint == other.parentFingerprint
                && childIndex == other.childIndex
                && chainCode == other.chainCode;
        }

        bool operator!=(const ExtendedKeyAttributes& other) const { return !(*this == other); }
    };

} // namespace Keytree

#endif // KEYTREE_EXTENDED_KEY_ATTRIBUTES_HPP
