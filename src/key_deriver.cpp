#include "key_deriver.hpp"
#include "error.hpp"

namespace hdwif {

KeyDeriver::KeyDeriver(std::shared_ptr<const Base58Codec> codec)
    : decoder_(codec)
    , encoder_(codec)
{}

Result<ExtendedKeyMaterial> KeyDeriver::derive_material(const std::string& extended_key,
                                                        const std::string& path) const {
    // Reports MissingCodec before any other stage runs
    auto material = decoder_.decode(extended_key);
    if (!material) {
        return material.error();
    }

    auto steps = PathParser::parse(path);
    if (!steps) {
        return steps.error();
    }

    return Bip32Util::derive(material.value(), steps.value());
}

Result<std::string> KeyDeriver::derive_wif(const std::string& extended_key, const std::string& path) const {
    auto derived = derive_material(extended_key, path);
    if (!derived) {
        return derived.error();
    }
    return encoder_.encode(derived.value().key);
}

KeyDeriver make_default_deriver() {
    return KeyDeriver(std::make_shared<const Base58>());
}

} // namespace hdwif
