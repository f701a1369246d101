#include "wif.hpp"
#include "error.hpp"
#include <openssl/crypto.h>
#include <algorithm>

namespace hdwif {

std::string WifEncoder::encode(const std::array<uint8_t, KEY_SIZE>& key) const {
    if (!codec_) {
        throw DeriveError(DeriveError::ErrorType::MissingCodec);
    }

    std::array<uint8_t, 1 + KEY_SIZE + 1> payload;
    payload[0] = WIF_VERSION_TESTNET;
    std::copy(key.begin(), key.end(), payload.begin() + 1);
    payload[1 + KEY_SIZE] = WIF_COMPRESSED_FLAG;

    auto wif = codec_->encode_check(payload);
    OPENSSL_cleanse(payload.data(), payload.size());
    return wif;
}

} // namespace hdwif
