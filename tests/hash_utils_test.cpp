#include "hash_utils.hpp"
#include "hex_utils.hpp"
#include "gtest/gtest.h"

namespace hdwif {

namespace {

const std::vector<uint8_t> ABC = {'a', 'b', 'c'};

}

TEST(HashUtils, Sha256) {
    EXPECT_EQ(HexUtils::encode(HashUtils::sha256(ABC)),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(HexUtils::encode(HashUtils::sha256(std::vector<uint8_t>{})),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HashUtils, DoubleSha256AndChecksum) {
    EXPECT_EQ(HexUtils::encode(HashUtils::double_sha256(ABC)),
              "4f8b42c22dd3729b519ba6f68d2da7cc5b2d606d05daed5ad5128cc03e6c6358");
    EXPECT_EQ(HexUtils::encode(HashUtils::checksum(ABC)), "4f8b42c2");
}

// RFC 4231 test case 1
TEST(HashUtils, HmacSha512) {
    std::vector<uint8_t> key(20, 0x0b);
    std::string message = "Hi There";
    std::vector<uint8_t> data(message.begin(), message.end());

    EXPECT_EQ(HexUtils::encode(HashUtils::hmac_sha512(key, data)),
              "87aa7cdea5ef619d4ff0b4241a1d6cb02379f4e2ce4ec2787ad0b30545e17cde"
              "daa833b7d6b8a702038b274eaea3f4e4be9d914eeb61f1702e696c203a126854");
}

} // namespace hdwif
