#include "key_deserializer.hpp"
#include "error.hpp"
#include <algorithm>

namespace hdwif {

// Deserialize bytes into an extended key.
// Args: bytes - Byte span containing the serialized key data (must be 78 bytes)
// Returns: The deserialized extended key, or InvalidKeyFormat on a size mismatch
// The version bytes are not checked, so any 78-byte payload is accepted.
Result<ExKey> KeyDeserializer::deserialize(std::span<const uint8_t> bytes) {
    if (bytes.size() != EXTENDED_KEY_SIZE) {
        return DecodeError(DeriveError::ErrorType::InvalidKeyFormat,
            "Extended key must be " + std::to_string(EXTENDED_KEY_SIZE) + " bytes, got " +
            std::to_string(bytes.size()));
    }

    ExKey key;
    std::copy_n(bytes.begin() + VERSION_OFFSET, 4, key.version.begin());
    std::copy_n(bytes.begin() + DEPTH_OFFSET, 1, key.depth.begin());
    std::copy_n(bytes.begin() + FINGERPRINT_OFFSET, 4, key.finger_print.begin());
    std::copy_n(bytes.begin() + CHILD_NUMBER_OFFSET, 4, key.child_number.begin());
    std::copy_n(bytes.begin() + CHAIN_CODE_OFFSET, CHAIN_CODE_SIZE, key.chaincode.begin());
    key.key_prefix = bytes[KEY_PREFIX_OFFSET];
    std::copy_n(bytes.begin() + KEY_OFFSET, KEY_SIZE, key.key.begin());

    return key;
}

Result<ExKey> ExtendedKeyDecoder::decode_key(const std::string& extended_key) const {
    if (!codec_) {
        return DeriveError(DeriveError::ErrorType::MissingCodec);
    }

    auto payload = codec_->decode_check(extended_key);
    if (!payload) {
        return payload.error();
    }
    return KeyDeserializer::deserialize(payload.value());
}

Result<ExtendedKeyMaterial> ExtendedKeyDecoder::decode(const std::string& extended_key) const {
    auto key = decode_key(extended_key);
    if (!key) {
        return key.error();
    }
    return key.value().material();
}

} // namespace hdwif
