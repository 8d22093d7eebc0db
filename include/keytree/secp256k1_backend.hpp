#ifndef KEYTREE_SECP256K1_BACKEND_HPP
#define KEYTREE_SECP256K1_BACKEND_HPP

#include <secp256k1.h>

#include "exceptions.hpp"
#include "key_backend.hpp"
#include "secure_memory.hpp"

/**
 * @file secp256k1_backend.hpp
 * @brief Key backend over Bitcoin Core's libsecp256k1.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    /**
     * @class Secp256k1Backend
     * @brief secp256k1 scalars and points through libsecp256k1.
     *
     * A single context is created on first use and only passed to
     * functions that take it const.
     */
    class Secp256k1Backend {
    public:
        using Scalar = SecretKeyBytes;
        using Point = secp256k1_pubkey;

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

        /**
         * @throw CryptoException If the scalar is invalid.
         */
        static Point publicKeyOf(const Scalar& scalar);

        static PublicKeyBytes publicKeyToBytes(const Point& point);

        /**
         * @throw CryptoException If bytes are not a valid compressed point.
         */
        static Point publicKeyFromBytes(const PublicKeyBytes& bytes);

    private:
        static const secp256k1_context* context();

        Secp256k1Backend() = delete;
    };

} // namespace Keytree

#endif // KEYTREE_SECP256K1_BACKEND_HPP
