#pragma once

#include <array>
#include <memory>
#include <string>
#include <cstdint>
#include "base58.hpp"
#include "consts.hpp"

namespace hdwif {

// WifEncoder serializes a private key in Wallet Import Format:
// base58check(0xEF || key || 0x01), i.e. a compressed testnet/regtest key.
class WifEncoder {
public:
    explicit WifEncoder(std::shared_ptr<const Base58Codec> codec)
        : codec_(std::move(codec)) {}

    // Precondition: the encoder was built with a codec
    std::string encode(const std::array<uint8_t, KEY_SIZE>& key) const;

private:
    std::shared_ptr<const Base58Codec> codec_;
};

} // namespace hdwif
