#pragma once

#include <cstdint>
#include "derivation_path.hpp"
#include "key_deserializer.hpp"

namespace hdwif {

// Utility class for BIP32-style private key derivation.
//
// Compatibility note: every step builds its HMAC message from the private key
// (0x00 || key || index), hardened or not, and takes the left half of the HMAC
// output as the child key without adding the parent key mod n. Normal steps
// therefore do not match standard BIP32 public-key derivation.
class Bip32Util {
public:
    // Derives one child from parent key material
    static ExtendedKeyMaterial derive_priv_child(const ExtendedKeyMaterial& parent, uint32_t child_num);

    // Applies derive_priv_child for every step of path, in order.
    // An empty path returns material unchanged.
    static ExtendedKeyMaterial derive(const ExtendedKeyMaterial& material, const DerivationPath& path);
};

} // namespace hdwif
