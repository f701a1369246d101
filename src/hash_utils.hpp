#pragma once

#include <array>
#include <span>
#include <cstdint>
#include <openssl/sha.h>
#include "consts.hpp"

namespace hdwif {

// HashUtils wraps the OpenSSL digests used by base58check and BIP32
class HashUtils {
public:
    // Computes the SHA256 hash of input data
    // Returns a 32-byte SHA256 hash of the input data
    static std::array<uint8_t, SHA256_DIGEST_LENGTH> sha256(std::span<const uint8_t> data);

    // Computes double SHA256 hash (SHA256(SHA256(data)))
    static std::array<uint8_t, SHA256_DIGEST_LENGTH> double_sha256(std::span<const uint8_t> data);

    // First 4 bytes of double SHA256, as appended by base58check
    static std::array<uint8_t, CHECKSUM_SIZE> checksum(std::span<const uint8_t> data);

    // Computes HMAC-SHA512 of data keyed by key
    // Throws DeriveError(DerivationError) if OpenSSL fails
    static std::array<uint8_t, HMAC_SHA512_SIZE> hmac_sha512(std::span<const uint8_t> key,
                                                             std::span<const uint8_t> data);

private:
    // Private constructor to prevent instantiation
    HashUtils() = delete;
};

} // namespace hdwif
