#include "bip32_util.hpp"
#include "hex_utils.hpp"
#include "gtest/gtest.h"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <algorithm>

namespace hdwif {

namespace {

// key = 00..01, chain code = 11..11
ExtendedKeyMaterial fixture_material() {
    ExtendedKeyMaterial material;
    material.key.fill(0x00);
    material.key.back() = 0x01;
    material.chain_code.fill(0x11);
    return material;
}

// One CKDpriv step computed directly with OpenSSL
ExtendedKeyMaterial manual_step(const ExtendedKeyMaterial& parent, uint32_t child_num) {
    std::vector<uint8_t> message;
    message.push_back(0x00);
    message.insert(message.end(), parent.key.begin(), parent.key.end());
    message.push_back(static_cast<uint8_t>(child_num >> 24));
    message.push_back(static_cast<uint8_t>(child_num >> 16));
    message.push_back(static_cast<uint8_t>(child_num >> 8));
    message.push_back(static_cast<uint8_t>(child_num));

    std::array<uint8_t, 64> digest;
    unsigned int digest_len = 0;
    HMAC(EVP_sha512(), parent.chain_code.data(), static_cast<int>(parent.chain_code.size()),
         message.data(), message.size(), digest.data(), &digest_len);
    EXPECT_EQ(digest_len, 64u);

    ExtendedKeyMaterial child;
    std::copy_n(digest.begin(), 32, child.key.begin());
    std::copy_n(digest.begin() + 32, 32, child.chain_code.begin());
    return child;
}

}

TEST(Bip32Util, EmptyPathReturnsInputUnchanged) {
    auto material = fixture_material();
    EXPECT_EQ(Bip32Util::derive(material, DerivationPath{}), material);
}

TEST(Bip32Util, DerivationIsDeterministic) {
    auto material = fixture_material();
    DerivationPath path = {{84, true}, {1, true}, {0, true}, {0, false}, {0, false}};
    EXPECT_EQ(Bip32Util::derive(material, path), Bip32Util::derive(material, path));
}

TEST(Bip32Util, MatchesManualHmacSteps) {
    auto material = fixture_material();
    DerivationPath path = {{0, true}, {1, false}};

    auto expected = manual_step(manual_step(material, 0x80000000), 1);
    auto derived = Bip32Util::derive(material, path);
    EXPECT_EQ(derived, expected);
    EXPECT_EQ(HexUtils::encode(derived.key),
              "ff1ee695f3a4531b2acca429157b1d152ac553d576ed38b33339b79e4f2c2db5");
    EXPECT_EQ(HexUtils::encode(derived.chain_code),
              "aa67566eb97652f9eb8166b1a6262d914e0ff5f03bf814aaab05f587c30747cc");
}

TEST(Bip32Util, SingleHardenedStep) {
    auto child = Bip32Util::derive_priv_child(fixture_material(), 0x80000000);
    EXPECT_EQ(HexUtils::encode(child.key),
              "7bbcefe147a1d747ff9de5664245fa1dffb6031cf3074ccc8756b37bea586c02");
    EXPECT_EQ(HexUtils::encode(child.chain_code),
              "b664c22952869f9d3eb38eef07d1167b29dbf3ec5b1127b69c75a7d1164a5b98");
}

// Normal steps use the private key in the HMAC message as well
TEST(Bip32Util, NormalStepUsesPrivateKeyMessage) {
    auto material = fixture_material();
    auto child = Bip32Util::derive_priv_child(material, 5);
    EXPECT_EQ(child, manual_step(material, 5));
    EXPECT_EQ(HexUtils::encode(child.key),
              "8d264ce31da43fb5c0e63953ddd2f87d4d5a00b22956879b5171aac483bf135b");
    EXPECT_NE(child, Bip32Util::derive_priv_child(material, 5 + HARDENED_OFFSET));
}

TEST(Bip32Util, StepOrderMatters) {
    auto material = fixture_material();
    DerivationPath forward = {{0, false}, {1, false}};
    DerivationPath reversed = {{1, false}, {0, false}};
    EXPECT_NE(Bip32Util::derive(material, forward), Bip32Util::derive(material, reversed));
}

TEST(Bip32Util, DoesNotModifyInput) {
    auto material = fixture_material();
    auto copy = material;
    Bip32Util::derive(material, DerivationPath{{7, true}});
    EXPECT_EQ(material, copy);
}

} // namespace hdwif
