/**
 * @file mock_backend.hpp
 * @brief Deterministic stand-in key backend for exercising the derivation engine.
 * @author Keytree Project
 * @date 2026
 */

#ifndef KEYTREE_TEST_MOCK_BACKEND_HPP
#define KEYTREE_TEST_MOCK_BACKEND_HPP

#include "keytree/exceptions.hpp"
#include "keytree/hash.hpp"
#include "keytree/key_backend.hpp"

#include <algorithm>

namespace TestHelpers {

    /**
     * @brief Toy backend: scalars add modulo 2^256 and the "public key" is
     * 0x02 || SHA256(scalar).
     *
     * failNextChild makes the next deriveChildScalar produce a zero scalar,
     * which is rejected like a real invalid child.
     */
    struct MockBackend {
        using Scalar = Keytree::SecretKeyBytes;
        using Point = Keytree::PublicKeyBytes;

        static inline bool failNextChild = false;
        static inline int childDerivations = 0;

        static void reset() {
            failNextChild = false;
            childDerivations = 0;
        }

        static bool isZero(const Keytree::SecretKeyBytes& bytes) {
            return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
        }

        static Scalar scalarFromBytes(const Keytree::SecretKeyBytes& bytes) {
            if (isZero(bytes)) {
                throw Keytree::CryptoException("Invalid private key");
            }
            return Scalar(bytes);
        }

        static Keytree::SecretKeyBytes scalarToBytes(const Scalar& scalar) {
            return scalar;
        }

        static Scalar deriveChildScalar(const Scalar& parent, const Keytree::SecretKeyBytes& tweak) {
            ++childDerivations;

            Scalar child;
            unsigned carry = 0;
            for (std::size_t i = child.size(); i-- > 0;) {
                carry += static_cast<unsigned>(parent[i]) + tweak[i];
                child[i] = static_cast<uint8_t>(carry & 0xFF);
                carry >>= 8;
            }

            if (failNextChild) {
                failNextChild = false;
                child.wipe();
            }

            if (isZero(child)) {
                throw Keytree::CryptoException("Invalid derived child key");
            }
            return child;
        }

        static Point publicKeyOf(const Scalar& scalar) {
            const auto digest = Keytree::Hash::sha256(scalar.data(), scalar.size());

            Point point;
            point[0] = 0x02;
            std::copy(digest.begin(), digest.end(), point.begin() + 1);
            return point;
        }

        static Keytree::PublicKeyBytes publicKeyToBytes(const Point& point) {
            return point;
        }

        static Point publicKeyFromBytes(const Keytree::PublicKeyBytes& bytes) {
            if (bytes[0] != 0x02 && bytes[0] != 0x03) {
                throw Keytree::CryptoException("Public key is not in compressed form");
            }
            return bytes;
        }
    };

} // namespace TestHelpers

#endif // KEYTREE_TEST_MOCK_BACKEND_HPP
