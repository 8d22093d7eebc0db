#ifndef KEYTREE_HKD_HPP
#define KEYTREE_HKD_HPP

#include <array>
#include <cstddef>
#include <cstdint>

#include "child_index.hpp"
#include "exceptions.hpp"
#include "extended_key_attributes.hpp"
#include "key_backend.hpp"
#include "secure_memory.hpp"

/**
 * @file hkd.hpp
 * @brief HMAC-SHA512 core of BIP-32 hierarchical key derivation.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    /**
     * @class HKD
     * @brief Curve-independent half of the BIP-32 CKD functions.
     *
     * Produces the raw HMAC-SHA512 output ("I") for the master node and for
     * child nodes, and computes key fingerprints. Turning I_L into a scalar
     * is left to the key backend.
     */
    class HKD {
    public:
        /// @brief Key of the master node HMAC: the ASCII string "Bitcoin seed".
        static constexpr std::array<uint8_t, 12> DOMAIN_SEPARATOR = {
            0x42, 0x69, 0x74, 0x63, 0x6f, 0x69, 0x6e, 0x20, 0x73, 0x65, 0x65, 0x64
        };

        /**
         * @brief The two halves of one HMAC-SHA512 output: the 32-byte
         * left half (I_L, master key or child tweak) and the 32-byte right
         * half (I_R, chain code). Both halves are erased on destruction,
         * so an exception thrown while consuming them leaves nothing behind.
         */
        struct NodeMaterial {
            SecretKeyBytes key;   // I_L
            ChainCode chainCode;  // I_R

            NodeMaterial() = default;
            NodeMaterial(const NodeMaterial&) = default;
            NodeMaterial& operator=(const NodeMaterial&) = default;

            ~NodeMaterial() { zeroize(); }

            void zeroize() {
                key.wipe();
                secure_memzero(chainCode.data(), chainCode.size());
            }
        };

        /**
         * @brief Check that a seed is 16, 32 or 64 bytes long.
         * @throw SeedLengthException Otherwise.
         */
        static void checkSeedLength(std::size_t len);

        /**
         * @brief Computes I = HMAC-SHA512("Bitcoin seed", seed).
         * @param seed Seed bytes.
         * @param len Seed length, 16, 32 or 64.
         * @return Master key material and chain code.
         * @throw SeedLengthException If len is not allowed.
         * @throw CryptoException If HMAC-SHA512 fails.
         */
        static NodeMaterial computeMasterNode(const uint8_t* seed, std::size_t len);

        /**
         * @brief Computes I for a hardened child:
         * HMAC-SHA512(c_par, 0x00 || k_par || ser32(i)).
         * @throw CryptoException If HMAC-SHA512 fails.
         */
        static NodeMaterial computeHardenedChild(const ChainCode& chainCode,
                                                 const SecretKeyBytes& parentKey,
                                                 ChildIndex index);

        /**
         * @brief Computes I for a normal child:
         * HMAC-SHA512(c_par, serP(K_par) || ser32(i)).
         * @throw CryptoException If HMAC-SHA512 fails.
         */
        static NodeMaterial computeNormalChild(const ChainCode& chainCode,
                                               const PublicKeyBytes& parentPublicKey,
                                               ChildIndex index);

        /**
         * @brief First four bytes of RIPEMD160(SHA256(public key)).
         */
        static KeyFingerprint fingerprint(const PublicKeyBytes& publicKey);

        /**
         * @brief Depth of a child of a node at the given depth.
         * @throw DepthException If depth is already 255.
         */
        static Depth childDepth(Depth depth);

    private:
        HKD() = delete;
    };

} // namespace Keytree

#endif // KEYTREE_HKD_HPP
