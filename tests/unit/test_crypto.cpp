#include "Crypto.h"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace SkipKP;
using skp::SecureBuffer;

namespace {

SecureBuffer bytesFromHex(const std::string& hex) {
    std::vector<uint8_t> raw;
    EXPECT_TRUE(Crypto::fromHex(hex, raw));
    return SecureBuffer(std::move(raw));
}

std::string stringFromHex(const std::string& hex) {
    std::vector<uint8_t> raw;
    EXPECT_TRUE(Crypto::fromHex(hex, raw));
    return std::string(raw.begin(), raw.end());
}

SecureBuffer testKey() {
    return SecureBuffer::fromString("0123456789abcdef0123456789abcdef");
}

} // namespace

// RFC 4231, test case 2
TEST(CryptoTest, HmacSha256KnownAnswer) {
    auto key = SecureBuffer::fromString("Jefe");
    EXPECT_EQ(Crypto::hmacSHA256Hex(key, "what do ya want for nothing?"),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
    EXPECT_EQ(Crypto::hmacSHA256(key, "what do ya want for nothing?").size(), Crypto::HMAC_SIZE);
}

// RFC 5869, test case 1
TEST(CryptoTest, HkdfKnownAnswer) {
    auto ikm = bytesFromHex("0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b");
    std::string salt = stringFromHex("000102030405060708090a0b0c");
    std::string info = stringFromHex("f0f1f2f3f4f5f6f7f8f9");

    auto okm = Crypto::hkdfSHA256(ikm, salt, info, 42);
    EXPECT_EQ(Crypto::toHex(okm.bytes()),
              "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf34007208d5b887185865");
}

TEST(CryptoTest, ConstantTimeEquals) {
    EXPECT_TRUE(Crypto::constantTimeEquals("abcdef", "abcdef"));
    EXPECT_FALSE(Crypto::constantTimeEquals("abcdef", "abcdeg"));
    EXPECT_FALSE(Crypto::constantTimeEquals("abcdef", "abcde"));
    EXPECT_TRUE(Crypto::constantTimeEquals("", ""));
}

TEST(CryptoTest, AesGcmOpensWhatItSeals) {
    auto key = testKey();
    auto plaintext = SecureBuffer::fromString("{\"keyId\":\"00\"}\nsecret key bytes");

    auto sealed = Crypto::sealAesGcm(key, plaintext, "KP_A\nKP_B");
    EXPECT_EQ(sealed.size(), Crypto::GCM_IV_SIZE + plaintext.size() + Crypto::GCM_TAG_SIZE);

    auto opened = Crypto::openAesGcm(key, sealed, "KP_A\nKP_B");
    EXPECT_TRUE(opened == plaintext);
}

TEST(CryptoTest, AesGcmUsesFreshIv) {
    auto key = testKey();
    auto plaintext = SecureBuffer::fromString("same input");
    EXPECT_NE(Crypto::sealAesGcm(key, plaintext, ""), Crypto::sealAesGcm(key, plaintext, ""));
}

TEST(CryptoTest, AesGcmRejectsTampering) {
    auto key = testKey();
    auto plaintext = SecureBuffer::fromString("key material");
    auto sealed = Crypto::sealAesGcm(key, plaintext, "KP_A\nKP_B");

    auto flipped = sealed;
    flipped[Crypto::GCM_IV_SIZE] ^= 0x01;
    EXPECT_THROW(Crypto::openAesGcm(key, flipped, "KP_A\nKP_B"), std::runtime_error);

    // Bound to sender and receiver
    EXPECT_THROW(Crypto::openAesGcm(key, sealed, "KP_B\nKP_A"), std::runtime_error);

    auto otherKey = SecureBuffer::fromString("fedcba9876543210fedcba9876543210");
    EXPECT_THROW(Crypto::openAesGcm(otherKey, sealed, "KP_A\nKP_B"), std::runtime_error);

    std::vector<uint8_t> truncated(sealed.begin(), sealed.begin() + 10);
    EXPECT_THROW(Crypto::openAesGcm(key, truncated, "KP_A\nKP_B"), std::runtime_error);
}

TEST(CryptoTest, AesGcmRequires256BitKey) {
    auto shortKey = SecureBuffer::fromString("short");
    EXPECT_THROW(Crypto::sealAesGcm(shortKey, SecureBuffer::fromString("x"), ""), std::runtime_error);
}

TEST(CryptoTest, HexEncoding) {
    std::vector<uint8_t> data = {0x00, 0xab, 0x7f, 0xff};
    EXPECT_EQ(Crypto::toHex(data), "00ab7fff");
    EXPECT_EQ(Crypto::toHex(data, true), "00AB7FFF");

    std::vector<uint8_t> decoded;
    ASSERT_TRUE(Crypto::fromHex("00AB7fff", decoded));
    EXPECT_EQ(decoded, data);

    EXPECT_FALSE(Crypto::fromHex("abc", decoded));
    EXPECT_FALSE(Crypto::fromHex("zz", decoded));
    EXPECT_TRUE(Crypto::isHex("0123456789abcdefABCDEF"));
    EXPECT_FALSE(Crypto::isHex("12g4"));
}

TEST(CryptoTest, Base64Encoding) {
    std::string text = "foobar";
    std::vector<uint8_t> data(text.begin(), text.end());
    EXPECT_EQ(Crypto::base64Encode(data), "Zm9vYmFy");

    std::vector<uint8_t> decoded;
    ASSERT_TRUE(Crypto::base64Decode("Zm9vYg==", decoded));
    EXPECT_EQ(std::string(decoded.begin(), decoded.end()), "foob");

    EXPECT_FALSE(Crypto::base64Decode("Zm9vY", decoded));
    EXPECT_FALSE(Crypto::base64Decode("Zm9v!mFy", decoded));
}
