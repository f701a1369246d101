#include "hash_utils.hpp"
#include "error.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <algorithm>

namespace hdwif {

std::array<uint8_t, SHA256_DIGEST_LENGTH> HashUtils::sha256(std::span<const uint8_t> data) {
    std::array<uint8_t, SHA256_DIGEST_LENGTH> hash;
    SHA256_CTX sha256;
    SHA256_Init(&sha256);
    SHA256_Update(&sha256, data.data(), data.size());
    SHA256_Final(hash.data(), &sha256);
    return hash;
}

// Double SHA256 is the checksum digest of base58check payloads
std::array<uint8_t, SHA256_DIGEST_LENGTH> HashUtils::double_sha256(std::span<const uint8_t> data) {
    auto first_hash = sha256(data);
    return sha256(std::span<const uint8_t>(first_hash.data(), first_hash.size()));
}

std::array<uint8_t, CHECKSUM_SIZE> HashUtils::checksum(std::span<const uint8_t> data) {
    auto hash = double_sha256(data);
    std::array<uint8_t, CHECKSUM_SIZE> result;
    std::copy_n(hash.begin(), CHECKSUM_SIZE, result.begin());
    return result;
}

// Computes HMAC-SHA512 as used by BIP32 child key derivation.
// The chain code is the HMAC key and the serialized parent data is the message.
std::array<uint8_t, HMAC_SHA512_SIZE> HashUtils::hmac_sha512(std::span<const uint8_t> key,
                                                             std::span<const uint8_t> data) {
    std::array<uint8_t, HMAC_SHA512_SIZE> result;
    unsigned int result_len = 0;
    if (!HMAC(EVP_sha512(), key.data(), static_cast<int>(key.size()),
              data.data(), data.size(), result.data(), &result_len) ||
        result_len != HMAC_SHA512_SIZE) {
        throw DeriveError(DeriveError::ErrorType::DerivationError, "HMAC-SHA512 computation failed");
    }
    return result;
}

} // namespace hdwif
