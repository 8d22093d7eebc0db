/**
 * @file test_secure_memory.cpp
 * @brief Unit tests for the secret-holding containers using Catch2.
 * @author Keytree Project
 * @date 2026
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "keytree/secure_memory.hpp"

#include <algorithm>
#include <string>
#include <type_traits>
#include <utility>

using namespace Keytree;

namespace {

    bool allZero(const SecretArray<32>& a) {
        return std::all_of(a.begin(), a.end(), [](uint8_t b) { return b == 0; });
    }

}

TEST_CASE("secure_memzero clears the buffer", "[secure_memory]") {
    uint8_t buffer[16];
    std::fill(std::begin(buffer), std::end(buffer), 0xAB);

    secure_memzero(buffer, sizeof(buffer));

    REQUIRE(std::all_of(std::begin(buffer), std::end(buffer), [](uint8_t b) { return b == 0; }));
    REQUIRE_NOTHROW(secure_memzero(nullptr, 16));
}

TEST_CASE("secure_equals compares every byte", "[secure_memory]") {
    const uint8_t a[4] = {1, 2, 3, 4};
    const uint8_t b[4] = {1, 2, 3, 4};
    const uint8_t c[4] = {1, 2, 3, 5};
    const uint8_t d[4] = {0, 2, 3, 4};

    REQUIRE(secure_equals(a, b, 4));
    REQUIRE_FALSE(secure_equals(a, c, 4));
    REQUIRE_FALSE(secure_equals(a, d, 4));
    REQUIRE(secure_equals(a, c, 3));
}

TEST_CASE("SecretArray::wipe zeroes its bytes", "[secret_array]") {
    SecretArray<32> secret;
    std::fill(secret.begin(), secret.end(), 0x5A);
    REQUIRE_FALSE(allZero(secret));

    secret.wipe();

    REQUIRE(allZero(secret));
}

TEST_CASE("SecretArray moved-from objects are erased", "[secret_array]") {
    SecretArray<32> source;
    std::fill(source.begin(), source.end(), 0x11);

    SecretArray<32> moved(std::move(source));
    REQUIRE(moved[0] == 0x11);
    REQUIRE(moved[31] == 0x11);
    REQUIRE(allZero(source));

    SecretArray<32> target;
    target = std::move(moved);
    REQUIRE(target[15] == 0x11);
    REQUIRE(allZero(moved));
}

TEST_CASE("SecretArray copies are independent", "[secret_array]") {
    SecretArray<32> original;
    std::fill(original.begin(), original.end(), 0x22);

    SecretArray<32> copy = original;
    original.wipe();

    REQUIRE(copy[0] == 0x22);
    REQUIRE(allZero(original));
}

TEST_CASE("SecretArray equality", "[secret_array]") {
    const uint8_t raw[32] = {1, 2, 3};

    SecretArray<32> a(raw, sizeof(raw));
    SecretArray<32> b(raw, sizeof(raw));

    REQUIRE(a == b);
    REQUIRE(a.secureEquals(b));

    b[31] ^= 0x01;
    REQUIRE(a != b);
    REQUIRE_FALSE(a.secureEquals(b));
}

TEST_CASE("SecureBytes behaves like a byte vector", "[secure_bytes]") {
    SecureBytes bytes;
    for (int i = 0; i < 1000; ++i) {
        bytes.push_back(static_cast<uint8_t>(i));
    }

    REQUIRE(bytes.size() == 1000);
    REQUIRE(bytes[999] == static_cast<uint8_t>(999));
}

TEST_CASE("SecureString holds text and compares it", "[secure_string]") {
    static_assert(!std::is_copy_constructible<SecureString>::value, "SecureString must not be copyable");
    static_assert(std::is_nothrow_move_constructible<SecureString>::value, "SecureString must be movable");

    SecureString text("xprv9s21");
    REQUIRE(text.size() == 8);
    REQUIRE(text.view() == "xprv9s21");
    REQUIRE(text == std::string("xprv9s21"));
    REQUIRE(text != "xprv9s22");
    REQUIRE(text != "xprv9s2");

    SecureString other;
    REQUIRE(other.empty());
    for (char c : std::string("xprv9s21")) {
        other.push_back(c);
    }
    REQUIRE(text == other);

    SecureString moved(std::move(other));
    REQUIRE(moved == text);
}
