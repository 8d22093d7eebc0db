#ifndef KEYTREE_KEYTREE_HPP
#define KEYTREE_KEYTREE_HPP

/**
 * @file keytree.hpp
 * @brief Umbrella header and secp256k1 aliases.
 * @author Keytree Project
 * @date 2026
 *
 * @code
 * auto xprv = Keytree::XPrv::deriveFromPath(seed, Keytree::DerivationPath::parse("m/44'/0'/0'/0/0"));
 * std::string text = xprv.publicKey().toString(Keytree::KeyVersion::MainnetPublic);
 * @endcode
 */

#include "base58.hpp"
#include "child_index.hpp"
#include "derivation_path.hpp"
#include "exceptions.hpp"
#include "extended_key.hpp"
#include "extended_key_attributes.hpp"
#include "extended_private_key.hpp"
#include "extended_public_key.hpp"
#include "hkd.hpp"
#include "key_backend.hpp"
#include "key_version.hpp"
#include "secp256k1_backend.hpp"
#include "secure_memory.hpp"

namespace Keytree {

    /// Extended private secp256k1 key.
    using XPrv = ExtendedPrivateKey<Secp256k1Backend>;

    /// Extended public secp256k1 key.
    using XPub = ExtendedPublicKey<Secp256k1Backend>;

} // namespace Keytree

#endif // KEYTREE_KEYTREE_HPP
