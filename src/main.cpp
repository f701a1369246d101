// derive_privkey
//
// Derives a private key from a BIP32 extended private key (xprv/tprv) and a
// derivation path, and prints it in Wallet Import Format for testnet/regtest.
//
// Usage: derive_privkey <xprv_or_tprv> <keypath>
//
// Exit status is 0 with the WIF on stdout, or 1 with a message on stderr for
// any failure (bad arguments, undecodable key, invalid path, internal error).

#include "key_deriver.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    if (argc != 3) {
        std::cerr << "Usage: derive_privkey <xprv_or_tprv> <keypath>" << std::endl;
        std::cerr << "Example: derive_privkey tprv8Zgx... m/84h/1h/0h/0/0" << std::endl;
        return 1;
    }

    const std::string extended_key = argv[1];
    const std::string keypath = argv[2];

    try {
        auto deriver = hdwif::make_default_deriver();
        auto wif = deriver.derive_wif(extended_key, keypath);
        if (!wif) {
            const auto& error = wif.error();
            if (error.is_path_error()) {
                std::cerr << "Error: invalid keypath '" << keypath << "': " << error.what() << std::endl;
            } else {
                std::cerr << "Error: " << error.what() << std::endl;
            }
            return 1;
        }

        std::cout << wif.value() << std::endl;
    } catch (const std::exception& e) {
        // Only internal failures (OpenSSL, allocation) reach here
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
