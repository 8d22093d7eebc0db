#include "keytree/extended_key.hpp"
#include "keytree/base58.hpp"

#include <algorithm>
#include <array>
#include <string>

/**
 * @file extended_key.cpp
 * @brief Implementation of the 78-byte extended key codec.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    SecureBytes ExtendedKey::toBytes() const {
        SecureBytes out;
        out.reserve(BYTE_SIZE);

        const auto v = version.toBytes();
        out.insert(out.end(), v.begin(), v.end());

        out.push_back(depth);
        out.insert(out.end(), parentFingerprint.begin(), parentFingerprint.end());

        const auto child = ChildIndex(childIndex).toBytes();
        out.insert(out.end(), child.begin(), child.end());

        out.insert(out.end(), chainCode.begin(), chainCode.end());
        out.insert(out.end(), keyBytes.begin(), keyBytes.end());

        return out;
    }

    SecureString ExtendedKey::toString() const {
        const SecureBytes payload = toBytes();
        return Base58::encodeCheck(payload.data(), payload.size());
    }

    ExtendedKey ExtendedKey::fromBytes(const uint8_t* data, std::size_t len) {
        if (len != BYTE_SIZE) {
            throw DecodeException("extended key must be 78 bytes, got " + std::to_string(len));
        }

        ExtendedKey key;

        std::array<uint8_t, 4> v;
        std::copy_n(data, 4, v.begin());
        key.version = KeyVersion::fromBytes(v);

        key.depth = data[4];
        std::copy_n(data + 5, 4, key.parentFingerprint.begin());

        key.childIndex = (static_cast<uint32_t>(data[9]) << 24) |
                         (static_cast<uint32_t>(data[10]) << 16) |
                         (static_cast<uint32_t>(data[11]) << 8) |
                         static_cast<uint32_t>(data[12]);

        std::copy_n(data + 13, 32, key.chainCode.begin());
        std::copy_n(data + 45, 33, key.keyBytes.begin());

        return key;
    }

    ExtendedKey ExtendedKey::parse(std::string_view text) {
        if (text.size() > MAX_BASE58_SIZE) {
            throw DecodeException("extended key string too long");
        }

        const SecureBytes payload = Base58::decodeCheck(text);
        return fromBytes(payload.data(), payload.size());
    }

    ExtendedKeyAttributes ExtendedKey::attributes() const {
        ExtendedKeyAttributes attrs;
        attrs.depth = depth;
        attrs.parentFingerprint = parentFingerprint;
        attrs.childIndex = ChildIndex(childIndex);
        attrs.chainCode = chainCode;
        return attrs;
    }

} // namespace Keytree
