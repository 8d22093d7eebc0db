#ifndef KEYTREE_KEY_BACKEND_HPP
#define KEYTREE_KEY_BACKEND_HPP

#include <array>
#include <cstdint>
#include <type_traits>
#include <utility>

#include "extended_key_attributes.hpp"

/**
 * @file key_backend.hpp
 * @brief Contract between the derivation engine and an elliptic-curve library.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    /// Big-endian bytes of a private scalar (or of a derivation tweak).
    using SecretKeyBytes = SecretArray<KEY_SIZE>;

    /// SEC1 compressed public key: a 0x02/0x03 tag followed by the x coordinate.
    using PublicKeyBytes = std::array<uint8_t, KEY_SIZE + 1>;

    /**
     * A key backend is a class B exposing:
     *
     * @code
     * using Scalar = ...;   // secret scalar, erases itself on destruction
     * using Point  = ...;   // public point
     *
     * static Scalar          scalarFromBytes(const SecretKeyBytes&);
     * static SecretKeyBytes  scalarToBytes(const Scalar&);
     * static Scalar          deriveChildScalar(const Scalar& parent, const SecretKeyBytes& tweak);
     * static Point           publicKeyOf(const Scalar&);
     * static PublicKeyBytes  publicKeyToBytes(const Point&);
     * static Point           publicKeyFromBytes(const PublicKeyBytes&);
     * @endcode
     *
     * scalarFromBytes rejects zero and values >= the group order.
     * deriveChildScalar returns (parent + tweak) mod n and rejects a tweak
     * >= n or a zero result. publicKeyFromBytes rejects anything that is not
     * a valid compressed point. All rejections throw CryptoException.
     *
     * The derivation engine never does curve arithmetic itself.
     */
    template <typename B, typename = void>
    struct is_key_backend : std::false_type {};

    template <typename B>
    struct is_key_backend<B, std::void_t<
        typename B::Scalar,
        typename B::Point,
        decltype(B::scalarFromBytes(std::declval<const SecretKeyBytes&>())),
        decltype(B::scalarToBytes(std::declval<const typename B::Scalar&>())),
        decltype(B::deriveChildScalar(std::declval<const typename B::Scalar&>(),
                                      std::declval<const SecretKeyBytes&>())),
        decltype(B::publicKeyOf(std::declval<const typename B::Scalar&>())),
        decltype(B::publicKeyToBytes(std::declval<const typename B::Point&>())),
        decltype(B::publicKeyFromBytes(std::declval<const PublicKeyBytes&>()))>>
        : std::true_type {};

} // namespace Keytree

#endif // KEYTREE_KEY_BACKEND_HPP
