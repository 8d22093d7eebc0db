#include "keytree/secp256k1_backend.hpp"

/**
 * @file secp256k1_backend.cpp
 * @brief Implementation of the libsecp256k1 key backend.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    const secp256k1_context* Secp256k1Backend::context() {
        static secp256k1_context* ctx =
            secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
        if (ctx == nullptr) {
            throw CryptoException("Failure to create the secp256k1 context");
        }
        return ctx;
    }

    Secp256k1Backend::Scalar Secp256k1Backend::scalarFromBytes(const SecretKeyBytes& bytes) {
        if (!secp256k1_ec_seckey_verify(context(), bytes.data())) {
            throw CryptoException("Invalid private key");
        }
        return Scalar(bytes);
    }

    SecretKeyBytes Secp256k1Backend::scalarToBytes(const Scalar& scalar) {
        return scalar;
    }

    Secp256k1Backend::Scalar Secp256k1Backend::deriveChildScalar(const Scalar& parent, const SecretKeyBytes& tweak) {
        // We start by copying the parent key into the child key
        Scalar child(parent);

        // This function adds I_L (acting as a tweak) to child in place.
        // It handles the modulo over the curve order and fails on I_L >= n or a zero result.
        if (!secp256k1_ec_seckey_tweak_add(context(), child.data(), tweak.data())) {
            throw CryptoException("Invalid derived child key");
        }

        return child;
    }

    Secp256k1Backend::Point Secp256k1Backend::publicKeyOf(const Scalar& scalar) {
        Point pubkey;
        if (!secp256k1_ec_pubkey_create(context(), &pubkey, scalar.data())) {
            throw CryptoException("Failure to create the public key");
        }
        return pubkey;
    }

    PublicKeyBytes Secp256k1Backend::publicKeyToBytes(const Point& point) {
        PublicKeyBytes output;
        size_t outputLen = output.size();

        secp256k1_ec_pubkey_serialize(context(), output.data(), &outputLen, &point, SECP256K1_EC_COMPRESSED);
        if (outputLen != output.size()) {
            throw CryptoException("Unexpected public key serialization length");
        }

        return output;
    }

    Secp256k1Backend::Point Secp256k1Backend::publicKeyFromBytes(const PublicKeyBytes& bytes) {
        if (bytes[0] != 0x02 && bytes[0] != 0x03) {
            throw CryptoException("Public key is not in compressed form");
        }

        Point pubkey;
        if (!secp256k1_ec_pubkey_parse(context(), &pubkey, bytes.data(), bytes.size())) {
            throw CryptoException("Invalid public key");
        }
        return pubkey;
    }

} // namespace Keytree
