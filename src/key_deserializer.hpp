#pragma once

#include <array>
#include <memory>
#include <span>
#include <string>
#include <cstdint>
#include "base58.hpp"
#include "consts.hpp"
#include "result.hpp"

namespace hdwif {

// Private key and chain code, the state threaded through BIP32 derivation
struct ExtendedKeyMaterial {
    std::array<uint8_t, KEY_SIZE> key;
    std::array<uint8_t, CHAIN_CODE_SIZE> chain_code;

    bool operator==(const ExtendedKeyMaterial&) const = default;
};

// Serialized BIP32 extended key split into its fields
struct ExKey {
    std::array<uint8_t, 4> version;      // Version bytes indicating key type (mainnet/testnet, private/public)
    std::array<uint8_t, 1> depth;        // Depth in the derivation path (0 for master keys)
    std::array<uint8_t, 4> finger_print; // First 4 bytes of the parent key's identifier
    std::array<uint8_t, 4> child_number; // Index of the key in relation to its parent
    std::array<uint8_t, CHAIN_CODE_SIZE> chaincode;
    uint8_t key_prefix;                  // Leading byte of the 33-byte key field, 0x00 for private keys
    std::array<uint8_t, KEY_SIZE> key;

    ExtendedKeyMaterial material() const { return {key, chaincode}; }
};

class KeyDeserializer {
public:
    // Split a 78-byte payload into an extended key
    static Result<ExKey> deserialize(std::span<const uint8_t> bytes);
};

// ExtendedKeyDecoder turns an xprv/tprv string into key material using the
// base58check codec it was built with
class ExtendedKeyDecoder {
public:
    explicit ExtendedKeyDecoder(std::shared_ptr<const Base58Codec> codec)
        : codec_(std::move(codec)) {}

    Result<ExKey> decode_key(const std::string& extended_key) const;
    Result<ExtendedKeyMaterial> decode(const std::string& extended_key) const;

private:
    std::shared_ptr<const Base58Codec> codec_;
};

} // namespace hdwif
