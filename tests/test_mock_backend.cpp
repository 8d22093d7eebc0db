/**
 * @file test_mock_backend.cpp
 * @brief Derivation engine tests over a deterministic mock backend using Catch2.
 * @author Keytree Project
 * @date 2026
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "keytree/derivation_path.hpp"
#include "keytree/extended_private_key.hpp"
#include "keytree/hkd.hpp"
#include "mock_backend.hpp"
#include "test_helpers.hpp"

#include <string>

using namespace Keytree;
using TestHelpers::MockBackend;
using TestHelpers::hexToBytes;
using TestHelpers::toHex;

using MockPrv = ExtendedPrivateKey<MockBackend>;
using MockPub = ExtendedPublicKey<MockBackend>;

static_assert(is_key_backend<MockBackend>::value, "mock must satisfy the backend contract");

const std::string SEED_HEX = "000102030405060708090a0b0c0d0e0f";

TEST_CASE("Master key material comes straight from HMAC-SHA512", "[mock][fromSeed]") {
    MockBackend::reset();
    auto master = MockPrv::fromSeed(hexToBytes(SEED_HEX));

    // Independent of the curve backend
    REQUIRE(toHex(master.toBytes()) == "e8f32e723decf4051aefac8e2c93c9c5b214313817cdb01a1494b917c8436b35");
    REQUIRE(toHex(master.chainCode()) == "873dff81c02f525623fd1fe5167eac3a55a049de3d314bb42ee227ffed37d508");
    REQUIRE(MockBackend::childDerivations == 0);
}

TEST_CASE("Hardened children hash the private key, normal children the public key", "[mock][deriveChild]") {
    MockBackend::reset();
    auto master = MockPrv::fromSeed(hexToBytes(SEED_HEX));
    const PublicKeyBytes parentPublic = master.publicKey().toBytes();

    SECTION("hardened") {
        const auto index = ChildIndex::hardened(7);
        auto I = HKD::computeHardenedChild(master.chainCode(), master.toBytes(), index);
        auto child = master.deriveChild(index);

        REQUIRE(child.toBytes() == MockBackend::deriveChildScalar(master.privateKey(), I.key));
        REQUIRE(child.chainCode() == I.chainCode);
    }

    SECTION("normal") {
        const auto index = ChildIndex::normal(7);
        auto I = HKD::computeNormalChild(master.chainCode(), parentPublic, index);
        auto child = master.deriveChild(index);

        REQUIRE(child.toBytes() == MockBackend::deriveChildScalar(master.privateKey(), I.key));
        REQUIRE(child.chainCode() == I.chainCode);
    }

    SECTION("attributes") {
        auto child = master.deriveChild(ChildIndex::normal(3));

        REQUIRE(child.depth() == 1);
        REQUIRE(child.childIndex() == ChildIndex::normal(3));
        REQUIRE(child.parentFingerprint() == HKD::fingerprint(parentPublic));
    }
}

TEST_CASE("An invalid child scalar is reported without moving to the next index", "[mock][crypto]") {
    MockBackend::reset();
    auto master = MockPrv::fromSeed(hexToBytes(SEED_HEX));

    MockBackend::failNextChild = true;
    REQUIRE_THROWS_AS(master.deriveChild(ChildIndex::normal(0)), CryptoException);
    REQUIRE(MockBackend::childDerivations == 1);

    // The parent is untouched and the same index derives once the fault is gone
    REQUIRE_NOTHROW(master.deriveChild(ChildIndex::normal(0)));
    REQUIRE(MockBackend::childDerivations == 2);
}

TEST_CASE("A failure inside a path aborts the whole path", "[mock][crypto][path]") {
    MockBackend::reset();
    const auto seed = hexToBytes(SEED_HEX);

    MockBackend::failNextChild = true;
    REQUIRE_THROWS_AS(MockPrv::deriveFromPath(seed, DerivationPath::parse("m/0'/1/2")), CryptoException);
    REQUIRE(MockBackend::childDerivations == 1);
}

TEST_CASE("Derivation reaches depth 255 and stops there", "[mock][depth]") {
    MockBackend::reset();
    auto key = MockPrv::fromSeed(hexToBytes(SEED_HEX));

    for (int level = 1; level <= 255; ++level) {
        key = key.deriveChild(ChildIndex::create(static_cast<uint32_t>(level), level % 2 == 0));
    }

    REQUIRE(key.depth() == 255);
    REQUIRE(key.depth() == MockPrv::MAX_DEPTH);

    const int before = MockBackend::childDerivations;
    REQUIRE_THROWS_AS(key.deriveChild(ChildIndex::normal(0)), DepthException);
    REQUIRE_THROWS_AS(key.deriveChildren(0, 1), DepthException);
    REQUIRE(MockBackend::childDerivations == before);
}

TEST_CASE("Path derivation equals step-by-step derivation", "[mock][path]") {
    MockBackend::reset();
    const auto seed = hexToBytes(SEED_HEX);
    auto master = MockPrv::fromSeed(seed);

    auto manual = master.deriveChild(ChildIndex::hardened(44))
                        .deriveChild(ChildIndex::hardened(0))
                        .deriveChild(ChildIndex::normal(5));

    REQUIRE(MockPrv::deriveFromPath(seed, DerivationPath::parse("m/44'/0'/5")) == manual);
    REQUIRE(master.derivePath(DerivationPath::parse("m/44'/0'/5")) == manual);
    REQUIRE(master.derivePath(DerivationPath()) == master);
}

TEST_CASE("Keys over any backend round-trip through their text form", "[mock][serialization]") {
    MockBackend::reset();
    auto key = MockPrv::deriveFromPath(hexToBytes(SEED_HEX), DerivationPath::parse("m/1/2'"));

    const SecureString xprv = key.toString(KeyVersion::MainnetPrivate);
    const std::string xpub = key.publicKey().toString(KeyVersion::MainnetPublic);

    REQUIRE(xprv.view().substr(0, 4) == "xprv");
    REQUIRE(xpub.substr(0, 4) == "xpub");
    REQUIRE(MockPrv::parse(xprv.view()) == key);
    REQUIRE(MockPub::parse(xpub) == key.publicKey());
    REQUIRE(MockPub::parse(xpub).fingerprint() == key.fingerprint());
}
