#pragma once

#include <memory>
#include <string>
#include "base58.hpp"
#include "bip32_util.hpp"
#include "derivation_path.hpp"
#include "key_deserializer.hpp"
#include "result.hpp"
#include "wif.hpp"

namespace hdwif {

// KeyDeriver runs the whole pipeline:
// decode extended key -> parse path -> derive -> encode WIF.
// The first failing stage ends the run and its error is returned.
class KeyDeriver {
public:
    // A null codec is accepted here and reported as MissingCodec on first use
    explicit KeyDeriver(std::shared_ptr<const Base58Codec> codec);

    Result<std::string> derive_wif(const std::string& extended_key, const std::string& path) const;

    // Same as derive_wif but stops before WIF encoding
    Result<ExtendedKeyMaterial> derive_material(const std::string& extended_key, const std::string& path) const;

private:
    ExtendedKeyDecoder decoder_;
    WifEncoder encoder_;
};

// KeyDeriver using the built-in Base58 codec
KeyDeriver make_default_deriver();

} // namespace hdwif
