#pragma once

#include <string>
#include <vector>
#include <span>
#include <cstdint>
#include "result.hpp"

namespace hdwif {

// Base58Codec is the base58check capability the derivation pipeline is given.
// Implementations must append and verify the 4-byte double SHA256 checksum.
class Base58Codec {
public:
    virtual ~Base58Codec() = default;

    // Encodes payload followed by its checksum
    virtual std::string encode_check(std::span<const uint8_t> payload) const = 0;

    // Decodes a base58check string and returns the payload without its checksum.
    // Fails with Base58DecodeError or ChecksumMismatch.
    virtual Result<std::vector<uint8_t>> decode_check(const std::string& encoded) const = 0;
};

// Base58 is the Bitcoin-alphabet implementation of Base58Codec.
//
// Base58 is a binary-to-text encoding scheme primarily used in Bitcoin addresses
// and keys. It uses a 58-character alphabet that leaves out easily confused
// characters (0, O, I, l). Leading zero bytes are written as leading '1's.
class Base58 : public Base58Codec {
public:
    static const std::string ALPHABET;

    // Encodes bytes as a Base58 string
    static std::string encode(std::span<const uint8_t> data);

    // Decodes a Base58 string into bytes, without any checksum handling
    static Result<std::vector<uint8_t>> decode(const std::string& encoded);

    std::string encode_check(std::span<const uint8_t> payload) const override;
    Result<std::vector<uint8_t>> decode_check(const std::string& encoded) const override;
};

} // namespace hdwif
