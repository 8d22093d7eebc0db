#ifndef KEYTREE_KEY_VERSION_HPP
#define KEYTREE_KEY_VERSION_HPP

#include <array>
#include <cstdint>

/**
 * @file key_version.hpp
 * @brief 4-byte version prefix of a serialized extended key.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    /**
     * @class KeyVersion
     * @brief Network and key type carried by an extended key's version bytes.
     *
     * The four BIP-32 prefixes map to named kinds; any other value is kept
     * as Kind::Other and round-trips unchanged.
     */
    class KeyVersion {
    public:
        enum class Kind {
            MainnetPublic,
            MainnetPrivate,
            TestnetPublic,
            TestnetPrivate,
            Other
        };

        static constexpr uint32_t XPUB = 0x0488B21E;
        static constexpr uint32_t XPRV = 0x0488ADE4;
        static constexpr uint32_t TPUB = 0x043587CF;
        static constexpr uint32_t TPRV = 0x04358394;

        static const KeyVersion MainnetPublic;
        static const KeyVersion MainnetPrivate;
        static const KeyVersion TestnetPublic;
        static const KeyVersion TestnetPrivate;

        static KeyVersion fromU32(uint32_t value);

        /// Big-endian decoding of the first four payload bytes.
        static KeyVersion fromBytes(const std::array<uint8_t, 4>& bytes);

        uint32_t toU32() const { return value_; }
        std::array<uint8_t, 4> toBytes() const;

        Kind kind() const { return kind_; }

        bool isMainnet() const { return kind_ == Kind::MainnetPublic || kind_ == Kind::MainnetPrivate; }
        bool isTestnet() const { return kind_ == Kind::TestnetPublic || kind_ == Kind::TestnetPrivate; }
        bool isPublic() const { return kind_ == Kind::MainnetPublic || kind_ == Kind::TestnetPublic; }
        bool isPrivate() const { return kind_ == Kind::MainnetPrivate || kind_ == Kind::TestnetPrivate; }

        bool operator==(const KeyVersion& other) const { return value_ == other.value_; }
        bool operator!=(const KeyVersion& other) const { return value_ != other.value_; }

    private:
        KeyVersion(Kind kind, uint32_t value) : kind_(kind), value_(value) {}

        Kind kind_;
        uint32_t value_;
    };

} // namespace Keytree

#endif // KEYTREE_KEY_VERSION_HPP
