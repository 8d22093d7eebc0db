#include "keytree/key_version.hpp"

/**
 * @file key_version.cpp
 * @brief Implementation of KeyVersion.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    const KeyVersion KeyVersion::MainnetPublic(Kind::MainnetPublic, KeyVersion::XPUB);
    const KeyVersion KeyVersion::MainnetPrivate(Kind::MainnetPrivate, KeyVersion::XPRV);
    const KeyVersion KeyVersion::TestnetPublic(Kind::TestnetPublic, KeyVersion::TPUB);
    const KeyVersion KeyVersion::TestnetPrivate(Kind::TestnetPrivate, KeyVersion::TPRV);

    KeyVersion KeyVersion::fromU32(uint32_t value) {
        switch (value) {
            case XPUB: return KeyVersion(Kind::MainnetPublic, value);
            case XPRV: return KeyVersion(Kind::MainnetPrivate, value);
            case TPUB: return KeyVersion(Kind::TestnetPublic, value);
            case TPRV: return KeyVersion(Kind::TestnetPrivate, value);
            default:   return KeyVersion(Kind::Other, value);
        }
    }

    KeyVersion KeyVersion::fromBytes(const std::array<uint8_t, 4>& bytes) {
        return fromU32((static_cast<uint32_t>(bytes[0]) << 24) |
                       (static_cast<uint32_t>(bytes[1]) << 16) |
                       (static_cast<uint32_t>(bytes[2]) << 8) |
                       static_cast<uint32_t>(bytes[3]));
    }

    std::array<uint8_t, 4> KeyVersion::toBytes() const {
        return {
            static_cast<uint8_t>((value_ >> 24) & 0xFF),
            static_cast<uint8_t>((value_ >> 16) & 0xFF),
            static_cast<uint8_t>((value_ >> 8) & 0xFF),
            static_cast<uint8_t>(value_ & 0xFF)
        };
    }

} // namespace Keytree
