#include "bip32_util.hpp"
#include "hash_utils.hpp"
#include <openssl/crypto.h>
#include <algorithm>
#include <array>

namespace hdwif {

// Derives a child key from parent key material.
//
// The derivation process:
// 1. Build the 37-byte message 0x00 || parent private key || child_num (big-endian)
// 2. Calculate HMAC-SHA512 of the message using the parent chain code as key
// 3. The left 32 bytes become the child key
// 4. The right 32 bytes become the child chain code
ExtendedKeyMaterial Bip32Util::derive_priv_child(const ExtendedKeyMaterial& parent, uint32_t child_num) {
    std::array<uint8_t, CKD_MESSAGE_SIZE> data;
    data[0] = PRIVATE_KEY_PREFIX;
    std::copy(parent.key.begin(), parent.key.end(), data.begin() + 1);

    data[33] = static_cast<uint8_t>((child_num >> 24) & 0xff);
    data[34] = static_cast<uint8_t>((child_num >> 16) & 0xff);
    data[35] = static_cast<uint8_t>((child_num >> 8) & 0xff);
    data[36] = static_cast<uint8_t>(child_num & 0xff);

    auto hmac_result = HashUtils::hmac_sha512(parent.chain_code, data);

    ExtendedKeyMaterial child;
    std::copy_n(hmac_result.begin(), KEY_SIZE, child.key.begin());
    std::copy_n(hmac_result.begin() + KEY_SIZE, CHAIN_CODE_SIZE, child.chain_code.begin());

    OPENSSL_cleanse(data.data(), data.size());
    OPENSSL_cleanse(hmac_result.data(), hmac_result.size());

    return child;
}

ExtendedKeyMaterial Bip32Util::derive(const ExtendedKeyMaterial& material, const DerivationPath& path) {
    ExtendedKeyMaterial current_key = material;
    for (const auto& step : path) {
        current_key = derive_priv_child(current_key, step.child_number());
    }
    return current_key;
}

} // namespace hdwif
