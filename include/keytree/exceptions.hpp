#ifndef KEYTREE_EXCEPTIONS_HPP
#define KEYTREE_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

/**
 * @file exceptions.hpp
 * @brief Exception hierarchy for hierarchical key derivation.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    /**
     * @class KeytreeException
     * @brief Base class for every error raised by the library.
     *
     * Catch this type if you want to handle all derivation, parsing and
     * backend errors in one place.
     */
    class KeytreeException : public std::runtime_error
    {
    public:
        /**
         * @brief Construct a new KeytreeException.
         * @param message Error message.
         */
        using std::runtime_error::runtime_error;
    };

    /**
     * @class SeedLengthException
     * @brief Thrown when a root seed is not 16, 32 or 64 bytes long.
     */
    class SeedLengthException : public KeytreeException
    {
    public:
        using KeytreeException::KeytreeException;
    };

    /**
     * @class DepthException
     * @brief Thrown when a derivation would go past depth 255.
     */
    class DepthException : public KeytreeException
    {
    public:
        using KeytreeException::KeytreeException;
    };

    /**
     * @class ChildIndexException
     * @brief Thrown when a child index is already in the hardened range
     * before the hardened flag is applied.
     */
    class ChildIndexException : public KeytreeException
    {
    public:
        using KeytreeException::KeytreeException;
    };

    /**
     * @class CryptoException
     * @brief Thrown when the curve backend rejects key material.
     *
     * Covers invalid or zero scalars, points that are not on the curve,
     * key material of the wrong length and failing OpenSSL/libsecp256k1 calls.
     */
    class CryptoException : public KeytreeException
    {
    public:
        using KeytreeException::KeytreeException;
    };

    /**
     * @class DecodeException
     * @brief Thrown when text or wire input is malformed.
     *
     * Base58 alphabet or checksum failures, wrong payload length, malformed
     * derivation paths and version/key byte mismatches.
     */
    class DecodeException : public KeytreeException
    {
    public:
        using KeytreeException::KeytreeException;
    };

} // namespace Keytree

#endif // KEYTREE_EXCEPTIONS_HPP
