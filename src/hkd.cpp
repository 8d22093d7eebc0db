#include "keytree/hkd.hpp"
#include "keytree/hash.hpp"

#include <algorithm>
#include <limits>
#include <string>

/**
 * @file hkd.cpp
 * @brief Implementation of the HKD class compliant with BIP-32.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    namespace {

        /**
         * @brief Split a 64-byte MAC into I_L and I_R.
         */
        HKD::NodeMaterial split(const Hash::Mac512& I) {
            HKD::NodeMaterial node;
            std::copy(I.begin(), I.begin() + 32, node.key.begin());
            std::copy(I.begin() + 32, I.end(), node.chainCode.begin());
            return node;
        }

    }

    void HKD::checkSeedLength(std::size_t len) {
        if (len != 16 && len != 32 && len != 64) {
            throw SeedLengthException("seed must be 16, 32 or 64 bytes, got " + std::to_string(len));
        }
    }

    HKD::NodeMaterial HKD::computeMasterNode(const uint8_t* seed, std::size_t len) {
        checkSeedLength(len);

        // HMAC-SHA512(Key="Bitcoin seed", Data=seed)
        // Left 32 bytes: master private key / Right 32 bytes: master chain code
        Hash::Mac512 I = Hash::hmacSha512(DOMAIN_SEPARATOR.data(), DOMAIN_SEPARATOR.size(), seed, len);
        return split(I);
    }

    HKD::NodeMaterial HKD::computeHardenedChild(const ChainCode& chainCode,
                                                const SecretKeyBytes& parentKey,
                                                ChildIndex index) {
        // Format: 0x00 | parent private key | index
        SecretArray<37> data;
        data[0] = 0x00;
        std::copy(parentKey.begin(), parentKey.end(), data.begin() + 1);

        const auto be = index.toBytes();
        std::copy(be.begin(), be.end(), data.begin() + 33);

        Hash::Mac512 I = Hash::hmacSha512(chainCode.data(), chainCode.size(), data.data(), data.size());
        return split(I);
    }

    HKD::NodeMaterial HKD::computeNormalChild(const ChainCode& chainCode,
                                              const PublicKeyBytes& parentPublicKey,
                                              ChildIndex index) {
        // Format: parent public key | index
        std::array<uint8_t, 37> data;
        std::copy(parentPublicKey.begin(), parentPublicKey.end(), data.begin());

        const auto be = index.toBytes();
        std::copy(be.begin(), be.end(), data.begin() + 33);

        Hash::Mac512 I = Hash::hmacSha512(chainCode.data(), chainCode.size(), data.data(), data.size());
        return split(I);
    }

    KeyFingerprint HKD::fingerprint(const PublicKeyBytes& publicKey) {
        const Hash::Digest160 id = Hash::hash160(publicKey.data(), publicKey.size());
        KeyFingerprint fp;
        std::copy(id.begin(), id.begin() + fp.size(), fp.begin());
        return fp;
    }

    Depth HKD::childDepth(Depth depth) {
        if (depth == std::numeric_limits<Depth>::max()) {
            throw DepthException("maximum derivation depth exceeded");
        }
        return static_cast<Depth>(depth + 1);
    }

} // Namespace Keytree
