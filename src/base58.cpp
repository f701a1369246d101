#include "base58.hpp"
#include "hash_utils.hpp"
#include "error.hpp"
#include <algorithm>

namespace hdwif {

const std::string Base58::ALPHABET =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

// Encodes bytes into a Base58 string.
//
// The encoding process:
// 1. Treats the input as one big-endian number and repeatedly divides it by 58
// 2. Maps each remainder to its alphabet character
// 3. Writes one '1' for every leading zero byte of the input
std::string Base58::encode(std::span<const uint8_t> data) {
    auto first_nonzero = std::find_if(data.begin(), data.end(),
        [](uint8_t byte) { return byte != 0; });
    size_t leading_zeros = static_cast<size_t>(std::distance(data.begin(), first_nonzero));

    // Base58 digits, least significant first
    std::vector<uint8_t> digits;
    digits.reserve(data.size() * 138 / 100 + 1);

    for (auto it = first_nonzero; it != data.end(); ++it) {
        size_t carry = *it;
        for (auto& digit : digits) {
            carry += static_cast<size_t>(digit) << 8;
            digit = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string result(leading_zeros, ALPHABET[0]);
    result.reserve(leading_zeros + digits.size());
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        result.push_back(ALPHABET[*it]);
    }
    return result;
}

// Decodes a Base58-encoded string into bytes.
//
// The decoding process:
// 1. Converts each Base58 character to its corresponding value
// 2. Builds the result by multiplying existing value by 58 and adding new digits
// 3. Handles leading '1' characters (which represent leading zeros)
Result<std::vector<uint8_t>> Base58::decode(const std::string& base58_string) {
    std::vector<uint8_t> result;
    for (char c : base58_string) {
        // Convert character to Base58 value
        auto digit = ALPHABET.find(c);
        if (digit == std::string::npos) {
            return DecodeError(DeriveError::ErrorType::Base58DecodeError,
                std::string("Invalid base58 character '") + c + "'");
        }

        // Multiply existing result by 58 and add new digit
        size_t carry = digit;
        for (auto it = result.rbegin(); it != result.rend(); ++it) {
            carry += static_cast<size_t>(*it) * 58;
            *it = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }

        // Add any remaining carry as new digits
        while (carry > 0) {
            result.insert(result.begin(), static_cast<uint8_t>(carry & 0xff));
            carry >>= 8;
        }
    }

    // Handle leading '1' characters (0x00 bytes in output)
    for (char c : base58_string) {
        if (c != ALPHABET[0]) break;
        result.insert(result.begin(), 0);
    }

    return result;
}

std::string Base58::encode_check(std::span<const uint8_t> payload) const {
    std::vector<uint8_t> data(payload.begin(), payload.end());
    auto checksum = HashUtils::checksum(payload);
    data.insert(data.end(), checksum.begin(), checksum.end());
    return encode(data);
}

// Decodes a base58check string, verifies the trailing 4-byte checksum against
// double SHA256 of the payload and strips it.
Result<std::vector<uint8_t>> Base58::decode_check(const std::string& encoded) const {
    auto decoded = decode(encoded);
    if (!decoded) {
        return decoded;
    }
    std::vector<uint8_t> data = std::move(decoded).value();

    if (data.size() < CHECKSUM_SIZE) {
        return DecodeError(DeriveError::ErrorType::Base58DecodeError,
            "Base58check string too short for checksum");
    }

    auto payload = std::span<const uint8_t>(data.data(), data.size() - CHECKSUM_SIZE);
    auto expected = HashUtils::checksum(payload);
    if (!std::equal(expected.begin(), expected.end(), data.end() - CHECKSUM_SIZE)) {
        return DecodeError(DeriveError::ErrorType::ChecksumMismatch);
    }

    data.resize(data.size() - CHECKSUM_SIZE);
    return data;
}

} // namespace hdwif
