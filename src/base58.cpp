#include "keytree/base58.hpp"
#include "keytree/hash.hpp"

#include <cstring>

/**
 * @file base58.cpp
 * @brief Implementation of Base58 and Base58Check.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    namespace {

        const char* const ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

    }

    SecureString Base58::encode(const uint8_t* data, std::size_t len) {
        // Skip leading zeroes, each one becomes a '1'
        std::size_t zeroes = 0;
        while (zeroes < len && data[zeroes] == 0) {
            zeroes++;
        }

        // log(256) / log(58), rounded up
        SecureBytes b58((len - zeroes) * 138 / 100 + 1);
        std::size_t length = 0;

        for (std::size_t i = zeroes; i < len; ++i) {
            int carry = data[i];
            for (std::size_t j = 0; j < length; ++j) {
                carry += 256 * b58[j];
                b58[j] = static_cast<uint8_t>(carry % 58);
                carry /= 58;
            }
            while (carry > 0) {
                b58[length++] = static_cast<uint8_t>(carry % 58);
                carry /= 58;
            }
        }

        SecureString str;
        str.reserve(zeroes + length);
        for (std::size_t i = 0; i < zeroes; ++i) {
            str.push_back(ALPHABET[0]);
        }

        // Digits were accumulated least significant first
        for (std::size_t i = 0; i < length; ++i) {
            str.push_back(ALPHABET[b58[length - 1 - i]]);
        }

        return str;
    }

    SecureBytes Base58::decode(std::string_view text) {
        std::size_t zeroes = 0;
        while (zeroes < text.size() && text[zeroes] == ALPHABET[0]) {
            zeroes++;
        }

        // Little-endian base-256 accumulator
        SecureBytes vch;
        vch.reserve(text.size() * 733 / 1000 + 1);

        for (std::size_t i = zeroes; i < text.size(); ++i) {
            const char* p = text[i] != '\0' ? std::strchr(ALPHABET, text[i]) : nullptr;
            if (p == nullptr) {
                throw DecodeException("invalid base58 character");
            }
            int carry = static_cast<int>(p - ALPHABET);
            for (std::size_t j = 0; j < vch.size(); ++j) {
                carry += 58 * vch[j];
                vch[j] = static_cast<uint8_t>(carry % 256);
                carry /= 256;
            }
            while (carry > 0) {
                vch.push_back(static_cast<uint8_t>(carry % 256));
                carry /= 256;
            }
        }

        SecureBytes data(zeroes, 0);
        data.insert(data.end(), vch.rbegin(), vch.rend());
        return data;
    }

    SecureString Base58::encodeCheck(const uint8_t* data, std::size_t len) {
        const Hash::Digest256 checksum = Hash::doubleSha256(data, len);

        SecureBytes vch(data, data + len);
        vch.insert(vch.end(), checksum.begin(), checksum.begin() + 4);

        return encode(vch.data(), vch.size());
    }

    SecureBytes Base58::decodeCheck(std::string_view text) {
        SecureBytes vch = decode(text);

        if (vch.size() < 4) {
            throw DecodeException("base58check payload too short");
        }

        const std::size_t payloadLen = vch.size() - 4;
        const Hash::Digest256 checksum = Hash::doubleSha256(vch.data(), payloadLen);

        if (!secure_equals(checksum.data(), vch.data() + payloadLen, 4)) {
            throw DecodeException("base58check checksum mismatch");
        }

        vch.resize(payloadLen);
        return vch;
    }

} // namespace Keytree
