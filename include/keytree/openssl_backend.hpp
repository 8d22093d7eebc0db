#ifndef KEYTREE_OPENSSL_BACKEND_HPP
#define KEYTREE_OPENSSL_BACKEND_HPP

#include "exceptions.hpp"
#include "key_backend.hpp"
#include "secure_memory.hpp"

/**
 * @file openssl_backend.hpp
 * @brief Key backend over OpenSSL's EC_GROUP / EC_POINT / BIGNUM.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    /**
     * @class OpensslSecp256k1Backend
     * @brief secp256k1 arithmetic through libcrypto, for builds that already
     * depend on OpenSSL. Produces the same keys as Secp256k1Backend.
     *
     * Points are kept in their validated compressed encoding.
     */
    class OpensslSecp256k1Backend {
    public:
        using Scalar = SecretKeyBytes;
        using Point = PublicKeyBytes;

        /**
         * @throw CryptoException If bytes are zero or not below the curve order.
         */
        static Scalar scalarFromBytes(const SecretKeyBytes& bytes);

        static SecretKeyBytes scalarToBytes(const Scalar& scalar);

        /**
         * @brief (parent + tweak) mod n.
         * @throw CryptoException If tweak >= n or the result is zero.
         */
        static Scalar deriveChildScalar(const Scalar& parent, const SecretKeyBytes& tweak);

        /// public_key = private_key * G, compressed.
        static Point publicKeyOf(const Scalar& scalar);

        static PublicKeyBytes publicKeyToBytes(const Point& point);

        /**
         * @throw CryptoException If bytes are not a compressed point on the curve.
         */
        static Point publicKeyFromBytes(const PublicKeyBytes& bytes);

    private:
        OpensslSecp256k1Backend() = delete;
    };

} // namespace Keytree

#endif // KEYTREE_OPENSSL_BACKEND_HPP
