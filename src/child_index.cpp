#include "keytree/child_index.hpp"

/**
 * @file child_index.cpp
 * @brief Implementation of ChildIndex.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    ChildIndex ChildIndex::create(uint32_t index, bool hardened) {
        if (index & HARDENED_OFFSET) {
            throw ChildIndexException("child index must be below 2^31: " + std::to_string(index));
        }
        return ChildIndex(hardened ? (index | HARDENED_OFFSET) : index);
    }

    ChildIndex ChildIndex::parse(const std::string& text) {
        std::string digits = text;
        bool hardened = false;

        if (!digits.empty() && digits.back() == '\'') {
            hardened = true;
            digits.pop_back();
        }

        if (digits.empty()) {
            throw DecodeException("empty child index");
        }

        // Accumulate in 64 bits so an oversized index is caught before it wraps.
        uint64_t value = 0;
        for (char c : digits) {
            if (c < '0' || c > '9') {
                throw DecodeException("invalid child index: " + text);
            }
            value = value * 10 + static_cast<uint64_t>(c - '0');
            if (value >= HARDENED_OFFSET) {
                throw DecodeException("child index out of range: " + text);
            }
        }

        return ChildIndex(hardened ? (static_cast<uint32_t>(value) | HARDENED_OFFSET)
                                   : static_cast<uint32_t>(value));
    }

    std::array<uint8_t, 4> ChildIndex::toBytes() const {
        return {
            static_cast<uint8_t>((raw_ >> 24) & 0xFF),
            static_cast<uint8_t>((raw_ >> 16) & 0xFF),
            static_cast<uint8_t>((raw_ >> 8) & 0xFF),
            static_cast<uint8_t>(raw_ & 0xFF)
        };
    }

    std::string ChildIndex::toString() const {
        std::string text = std::to_string(index());
        if (isHardened()) {
            text.push_back('\'');
        }
        return text;
    }

} // namespace Keytree
