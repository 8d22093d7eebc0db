#include "keytree/openssl_backend.hpp"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

#include <memory>

/**
 * @file openssl_backend.cpp
 * @brief Implementation of the OpenSSL key backend.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    namespace {

        using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;
        using BnCtxPtr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
        using EcPointPtr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;

        /**
         * @brief The secp256k1 group, built once. Only used through const pointers.
         */
        const EC_GROUP* group() {
            static EC_GROUP* curve = EC_GROUP_new_by_curve_name(NID_secp256k1);
            if (curve == nullptr) {
                throw CryptoException("Failure to load the secp256k1 curve");
            }
            return curve;
        }

        /// The group order n.
        const BIGNUM* order() {
            const BIGNUM* n = EC_GROUP_get0_order(group());
            if (n == nullptr) {
                throw CryptoException("Failure to read the curve order");
            }
            return n;
        }

        BignumPtr toBignum(const SecretKeyBytes& bytes) {
            BignumPtr bn(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr), BN_clear_free);
            if (!bn) {
                throw CryptoException("Failure to convert key bytes");
            }
            return bn;
        }

        /// True if 0 < k < n.
        bool inRange(const BIGNUM* k) {
            return !BN_is_zero(k) && BN_cmp(k, order()) < 0;
        }

        BnCtxPtr newContext() {
            BnCtxPtr ctx(BN_CTX_new(), BN_CTX_free);
            if (!ctx) {
                throw CryptoException("Failure to allocate a BN_CTX");
            }
            return ctx;
        }

    }

    OpensslSecp256k1Backend::Scalar OpensslSecp256k1Backend::scalarFromBytes(const SecretKeyBytes& bytes) {
        BignumPtr k = toBignum(bytes);
        if (!inRange(k.get())) {
            throw CryptoException("Invalid private key");
        }
        return Scalar(bytes);
    }

    SecretKeyBytes OpensslSecp256k1Backend::scalarToBytes(const Scalar& scalar) {
        return scalar;
    }

    OpensslSecp256k1Backend::Scalar OpensslSecp256k1Backend::deriveChildScalar(const Scalar& parent,
                                                                               const SecretKeyBytes& tweak) {
        BignumPtr parentKey = toBignum(parent);
        BignumPtr childKey = toBignum(tweak);

        // BIP-32 rejects I_L >= n instead of reducing it
        if (BN_cmp(childKey.get(), order()) >= 0) {
            throw CryptoException("Invalid derived child key");
        }

        // child_key = (parent_key + I_L) mod n
        BnCtxPtr ctx = newContext();
        if (!BN_mod_add(childKey.get(), parentKey.get(), childKey.get(), order(), ctx.get())) {
            throw CryptoException("Modular addition of private keys failed");
        }

        if (BN_is_zero(childKey.get())) {
            throw CryptoException("Invalid derived child key");
        }

        Scalar child;
        if (BN_bn2binpad(childKey.get(), child.data(), static_cast<int>(child.size())) != static_cast<int>(child.size())) {
            throw CryptoException("Failure to serialize the child key");
        }
        return child;
    }

    OpensslSecp256k1Backend::Point OpensslSecp256k1Backend::publicKeyOf(const Scalar& scalar) {
        BignumPtr k = toBignum(scalar);
        if (!inRange(k.get())) {
            throw CryptoException("Invalid private key");
        }

        BnCtxPtr ctx = newContext();
        EcPointPtr pub(EC_POINT_new(group()), EC_POINT_free);

        // pub = k * G
        if (!pub || !EC_POINT_mul(group(), pub.get(), k.get(), nullptr, nullptr, ctx.get())) {
            throw CryptoException("Failure to create the public key");
        }

        // Compressed format: 0x02/0x03 depending on the parity of y, then x
        Point out;
        size_t size = EC_POINT_point2oct(group(), pub.get(), POINT_CONVERSION_COMPRESSED,
                                         out.data(), out.size(), ctx.get());
        if (size != out.size()) {
            throw CryptoException("Failure to serialize the public key");
        }
        return out;
    }

    PublicKeyBytes OpensslSecp256k1Backend::publicKeyToBytes(const Point& point) {
        return point;
    }

    OpensslSecp256k1Backend::Point OpensslSecp256k1Backend::publicKeyFromBytes(const PublicKeyBytes& bytes) {
        if (bytes[0] != 0x02 && bytes[0] != 0x03) {
            throw CryptoException("Public key is not in compressed form");
        }

        BnCtxPtr ctx = newContext();
        EcPointPtr pub(EC_POINT_new(group()), EC_POINT_free);

        // oct2point rejects x coordinates with no matching point on the curve
        if (!pub || !EC_POINT_oct2point(group(), pub.get(), bytes.data(), bytes.size(), ctx.get())) {
            throw CryptoException("Invalid public key");
        }
        return bytes;
    }

} // namespace Keytree
