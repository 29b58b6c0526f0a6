#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <string>
#include <vector>

#include "ferry/common/errors.hpp"
#include "ferry/crypto/aead.hpp"
#include "ferry/crypto/crypto.hpp"
#include "ferry/crypto/hkdf.hpp"
#include "ferry/crypto/x25519.hpp"

namespace ferry::crypto {
namespace {

class CryptoTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(init());
    }

    static SymmetricKey random_key() {
        SymmetricKey key;
        do {
            random_bytes(key);
        } while (is_all_zero(key));
        return key;
    }
};

TEST_F(CryptoTest, RandomBytesGeneratesNonZero) {
    std::array<uint8_t, 32> buf{};
    random_bytes(buf);

    bool all_zero = std::all_of(buf.begin(), buf.end(), [](uint8_t b) { return b == 0; });
    EXPECT_FALSE(all_zero);
}

TEST_F(CryptoTest, ConstantTimeCompare) {
    std::vector<uint8_t> a = {1, 2, 3, 4};
    std::vector<uint8_t> b = {1, 2, 3, 4};
    std::vector<uint8_t> c = {1, 2, 3, 5};
    std::vector<uint8_t> d = {1, 2, 3};

    EXPECT_TRUE(constant_time_compare(a, b));
    EXPECT_FALSE(constant_time_compare(a, c));
    EXPECT_FALSE(constant_time_compare(a, d));
}

TEST_F(CryptoTest, Sha256KnownVector) {
    const std::string abc = "abc";
    auto digest = sha256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(abc.data()), abc.size()));

    EXPECT_EQ(digest[0], 0xba);
    EXPECT_EQ(digest[1], 0x78);
    EXPECT_EQ(digest[2], 0x16);
    EXPECT_EQ(digest[31], 0xad);
}

TEST_F(CryptoTest, X25519KeyGeneration) {
    auto kp1 = generate_keypair();
    auto kp2 = generate_keypair();

    EXPECT_NE(kp1.public_key, kp2.public_key);
    EXPECT_NE(kp1.secret_key, kp2.secret_key);
    EXPECT_EQ(derive_public_key(kp1.secret_key), kp1.public_key);
}

TEST_F(CryptoTest, X25519KeyExchange) {
    auto alice = generate_keypair();
    auto bob = generate_keypair();

    auto alice_shared = key_exchange(alice.secret_key, bob.public_key);
    auto bob_shared = key_exchange(bob.secret_key, alice.public_key);

    ASSERT_TRUE(alice_shared.has_value());
    ASSERT_TRUE(bob_shared.has_value());
    EXPECT_EQ(*alice_shared, *bob_shared);
}

TEST_F(CryptoTest, X25519WeakKeyRejected) {
    PublicKey weak_key{};

    auto kp = generate_keypair();
    auto shared = key_exchange(kp.secret_key, weak_key);

    EXPECT_FALSE(shared.has_value());
}

TEST_F(CryptoTest, WipeZeroesKeyPair) {
    auto kp = generate_keypair();
    wipe(kp);

    EXPECT_TRUE(is_all_zero(kp.secret_key));
    EXPECT_TRUE(is_all_zero(kp.public_key));
}

TEST_F(CryptoTest, HmacSha256DifferentKeys) {
    std::vector<uint8_t> key1 = {0x01, 0x02, 0x03, 0x04};
    std::vector<uint8_t> key2 = {0x05, 0x06, 0x07, 0x08};
    std::vector<uint8_t> message = {0x48, 0x65, 0x6c, 0x6c, 0x6f};

    EXPECT_EQ(hmac_sha256(key1, message), hmac_sha256(key1, message));
    EXPECT_NE(hmac_sha256(key1, message), hmac_sha256(key2, message));
}

TEST_F(CryptoTest, HkdfExpandPrefixConsistent) {
    std::vector<uint8_t> salt = {0x00, 0x01, 0x02, 0x03};
    std::vector<uint8_t> ikm = {0x0b, 0x0b, 0x0b, 0x0b, 0x0b, 0x0b};
    std::vector<uint8_t> info = {0xf0, 0xf1, 0xf2};

    auto prk = hkdf_extract(salt, ikm);

    std::array<uint8_t, 32> okm32;
    std::array<uint8_t, 64> okm64;
    hkdf_expand(prk, info, okm32);
    hkdf_expand(prk, info, okm64);

    EXPECT_TRUE(std::equal(okm32.begin(), okm32.end(), okm64.begin()));
}

TEST_F(CryptoTest, HkdfRfc5869TestCase1) {
    std::vector<uint8_t> ikm(22, 0x0b);
    std::vector<uint8_t> salt = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06,
                                 0x07, 0x08, 0x09, 0x0a, 0x0b, 0x0c};
    std::vector<uint8_t> info = {0xf0, 0xf1, 0xf2, 0xf3, 0xf4,
                                 0xf5, 0xf6, 0xf7, 0xf8, 0xf9};

    std::array<uint8_t, 42> okm;
    hkdf(salt, ikm, info, okm);

    EXPECT_EQ(okm[0], 0x3c);
    EXPECT_EQ(okm[1], 0xb2);
    EXPECT_EQ(okm[2], 0x5f);
    EXPECT_EQ(okm[41], 0x65);
}

TEST_F(CryptoTest, SessionKeyIndependentOfKeyOrder) {
    auto alice = generate_keypair();
    auto bob = generate_keypair();

    auto alice_shared = key_exchange(alice.secret_key, bob.public_key);
    auto bob_shared = key_exchange(bob.secret_key, alice.public_key);
    ASSERT_TRUE(alice_shared && bob_shared);

    auto alice_key = derive_session_key(*alice_shared, "session-1", alice.public_key, bob.public_key);
    auto bob_key = derive_session_key(*bob_shared, "session-1", bob.public_key, alice.public_key);

    ASSERT_TRUE(alice_key.has_value());
    ASSERT_TRUE(bob_key.has_value());
    EXPECT_EQ(*alice_key, *bob_key);
}

TEST_F(CryptoTest, SessionKeyBoundToSessionIdAndInfo) {
    auto alice = generate_keypair();
    auto bob = generate_keypair();
    auto shared = key_exchange(alice.secret_key, bob.public_key);
    ASSERT_TRUE(shared.has_value());

    auto k1 = derive_session_key(*shared, "session-1", alice.public_key, bob.public_key);
    auto k2 = derive_session_key(*shared, "session-2", alice.public_key, bob.public_key);

    const std::string custom = "custom-info";
    auto k3 = derive_session_key(*shared, "session-1", alice.public_key, bob.public_key,
                                 std::span<const uint8_t>(
                                     reinterpret_cast<const uint8_t*>(custom.data()),
                                     custom.size()));

    ASSERT_TRUE(k1 && k2 && k3);
    EXPECT_NE(*k1, *k2);
    EXPECT_NE(*k1, *k3);
}

TEST_F(CryptoTest, DefaultSessionInfo) {
    EXPECT_EQ(default_session_info("abc"), "ferry/v1/session:abc");
}

TEST_F(CryptoTest, SealOpenRoundTrip) {
    auto key = random_key();
    auto iv = generate_iv();
    std::vector<uint8_t> plaintext = {0x48, 0x65, 0x6c, 0x6c, 0x6f, 0x21};
    std::vector<uint8_t> aad = {0xad, 0xad};

    auto sealed = seal(key, iv, aad, plaintext);
    EXPECT_EQ(sealed.ciphertext.size(), plaintext.size());
    EXPECT_EQ(sealed.iv, iv);
    EXPECT_EQ(sealed.combined().size(), plaintext.size() + AEAD_TAG_SIZE);

    EXPECT_EQ(open(key, aad, sealed), plaintext);
}

TEST_F(CryptoTest, SealAcceptsAllZeroPlaintext) {
    auto key = random_key();
    std::vector<uint8_t> zeros(64, 0);

    auto sealed = seal(key, generate_iv(), {}, zeros);
    EXPECT_EQ(open(key, {}, sealed), zeros);
}

TEST_F(CryptoTest, SealRejectsInvalidInputs) {
    auto key = random_key();
    SymmetricKey zero_key{};
    Nonce zero_iv{};
    std::vector<uint8_t> plaintext = {1, 2, 3};
    std::vector<uint8_t> empty;

    EXPECT_THROW(seal(zero_key, generate_iv(), {}, plaintext), CryptoException);
    EXPECT_THROW(seal(key, zero_iv, {}, plaintext), CryptoException);
    EXPECT_THROW(seal(key, generate_iv(), {}, empty), CryptoException);
}

TEST_F(CryptoTest, OpenRejectsTamperedCiphertext) {
    auto key = random_key();
    std::vector<uint8_t> plaintext = {0x48, 0x65, 0x6c, 0x6c, 0x6f};

    auto sealed = seal(key, generate_iv(), {}, plaintext);
    sealed.ciphertext[0] ^= 0xFF;

    EXPECT_THROW(open(key, {}, sealed), CryptoException);
}

TEST_F(CryptoTest, OpenRejectsTamperedTag) {
    auto key = random_key();
    std::vector<uint8_t> plaintext = {0x48, 0x65, 0x6c, 0x6c, 0x6f};

    auto sealed = seal(key, generate_iv(), {}, plaintext);
    sealed.tag[AEAD_TAG_SIZE - 1] ^= 0x01;

    EXPECT_THROW(open(key, {}, sealed), CryptoException);
}

TEST_F(CryptoTest, OpenRejectsWrongAad) {
    auto key = random_key();
    std::vector<uint8_t> plaintext = {0x48, 0x65, 0x6c, 0x6c, 0x6f};
    std::vector<uint8_t> aad1 = {0x01, 0x02};
    std::vector<uint8_t> aad2 = {0x03, 0x04};

    auto sealed = seal(key, generate_iv(), aad1, plaintext);
    EXPECT_THROW(open(key, aad2, sealed), CryptoException);
}

TEST_F(CryptoTest, OpenRejectsWrongKey) {
    auto key1 = random_key();
    auto key2 = random_key();
    std::vector<uint8_t> plaintext = {0x48, 0x65, 0x6c, 0x6c, 0x6f};

    auto sealed = seal(key1, generate_iv(), {}, plaintext);
    EXPECT_THROW(open(key2, {}, sealed), CryptoException);
}

TEST_F(CryptoTest, CombinedSplitsBackIntoParts) {
    auto key = random_key();
    std::vector<uint8_t> plaintext(100, 0x5a);

    auto sealed = seal(key, generate_iv(), {}, plaintext);
    auto restored = AeadResult::from_combined(sealed.combined(), sealed.iv);

    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, sealed);

    std::vector<uint8_t> short_payload(AEAD_TAG_SIZE - 1, 0);
    EXPECT_FALSE(AeadResult::from_combined(short_payload, sealed.iv).has_value());
}

TEST_F(CryptoTest, GeneratedIvsDiffer) {
    auto a = generate_iv();
    auto b = generate_iv();

    EXPECT_FALSE(is_all_zero(a));
    EXPECT_NE(a, b);
}

}  // namespace
}  // namespace ferry::crypto
