#ifndef KEYTREE_CHILD_INDEX_HPP
#define KEYTREE_CHILD_INDEX_HPP

#include <array>
#include <cstdint>
#include <string>

#include "exceptions.hpp"

/**
 * @file child_index.hpp
 * @brief Index of a single BIP-32 derivation step.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    /**
     * @class ChildIndex
     * @brief 32-bit child number; values from 2^31 upward are hardened.
     */
    class ChildIndex {
    public:
        /// @brief BIP-32 Hardened derivation offset (2^31)
        static constexpr uint32_t HARDENED_OFFSET = 0x80000000;

        constexpr ChildIndex() = default;

        /**
         * @brief Wrap a raw child number as found on the wire (flag included).
         */
        explicit constexpr ChildIndex(uint32_t raw) : raw_(raw) {}

        /**
         * @brief Build a child index from an unhardened index and a flag.
         * @param index Index in [0, 2^31).
         * @param hardened Whether to set the hardened bit.
         * @throw ChildIndexException If index is already >= 2^31.
         */
        static ChildIndex create(uint32_t index, bool hardened);

        /// Shorthand for create(index, true).
        static ChildIndex hardened(uint32_t index) { return create(index, true); }

        /// Shorthand for create(index, false).
        static ChildIndex normal(uint32_t index) { return create(index, false); }

        /**
         * @brief Parse the textual form: decimal digits, optionally followed by '.
         * @throw DecodeException If the text is malformed or the index overflows 2^31.
         */
        static ChildIndex parse(const std::string& text);

        constexpr uint32_t raw() const { return raw_; }

        /// Index with the hardened bit stripped.
        constexpr uint32_t index() const { return raw_ & ~HARDENED_OFFSET; }

        constexpr bool isHardened() const { return (raw_ & HARDENED_OFFSET) != 0; }

        /// 4-byte big-endian serialization.
        std::array<uint8_t, 4> toBytes() const;

        /// e.g. "44'" or "0".
        std::string toString() const;

        constexpr bool operator==(const ChildIndex& other) const { return raw_ == other.raw_; }
        constexpr bool operator!=(const ChildIndex& other) const { return raw_ != other.raw_; }

    private:
        uint32_t raw_ = 0;
    };

} // namespace Keytree

#endif // KEYTREE_CHILD_INDEX_HPP
