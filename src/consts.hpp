#pragma once

#include <cstddef>
#include <cstdint>

namespace hdwif {

    // BIP32 serialized extended key layout
    // version(4) | depth(1) | fingerprint(4) | child number(4) | chain code(32) | key(33)
    constexpr size_t EXTENDED_KEY_SIZE = 78;
    constexpr size_t VERSION_OFFSET = 0;
    constexpr size_t DEPTH_OFFSET = 4;
    constexpr size_t FINGERPRINT_OFFSET = 5;
    constexpr size_t CHILD_NUMBER_OFFSET = 9;
    constexpr size_t CHAIN_CODE_OFFSET = 13;
    constexpr size_t KEY_PREFIX_OFFSET = 45;
    constexpr size_t KEY_OFFSET = 46; // skips the 0x00 prefix of the 33-byte key field

    constexpr size_t KEY_SIZE = 32;
    constexpr size_t CHAIN_CODE_SIZE = 32;
    constexpr size_t CHECKSUM_SIZE = 4;
    constexpr size_t HMAC_SHA512_SIZE = 64;

    // Child numbers at or above this value are hardened
    constexpr uint32_t HARDENED_OFFSET = 0x80000000;

    // CKDpriv message: 0x00 | key(32) | child number(4)
    constexpr uint8_t PRIVATE_KEY_PREFIX = 0x00;
    constexpr size_t CKD_MESSAGE_SIZE = 1 + KEY_SIZE + 4;

    // Wallet Import Format, testnet/regtest only
    constexpr uint8_t WIF_VERSION_TESTNET = 0xEF;
    constexpr uint8_t WIF_COMPRESSED_FLAG = 0x01;

} // namespace hdwif
