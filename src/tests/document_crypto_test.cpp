#include <gtest/gtest.h>
#include <string>
#include "crypto/document_crypto.hpp"
#include "test_utils.hpp"

using namespace pastebox::crypto;
using namespace pastebox::utils;

class DocumentCryptoTest : public ::testing::Test {
protected:
  OpenSSLRandomSource random;
  const std::string id = "cornflake-peddling-bp0q";
  const TimePoint upload = TimePoint{} + std::chrono::seconds(1700000000);

  void SetUp() override {
    init_logging();
  }
};

TEST_F(DocumentCryptoTest, DerivedKeyIsDeterministic) {
  Key first = derive_key(id, upload);
  Key second = derive_key(id, upload);

  ASSERT_EQ(first.size(), KEY_SIZE);
  EXPECT_EQ(first, second);
}

TEST_F(DocumentCryptoTest, DerivedKeyDependsOnIdAndUpload) {
  Key base = derive_key(id, upload);

  EXPECT_NE(base, derive_key(id + "x", upload));
  EXPECT_NE(base, derive_key(id, upload + std::chrono::seconds(1)));
}

TEST_F(DocumentCryptoTest, RoundTripRestoresExactBytes) {
  const std::string plaintext = "<span class=\"k\">int</span> main() {}\n\xE2\x9C\x93\n";
  Key key = derive_key(id, upload);

  std::string ciphertext = encrypt(plaintext, key, random);
  ASSERT_EQ(ciphertext.size(), NONCE_SIZE + plaintext.size() + TAG_SIZE);
  EXPECT_EQ(ciphertext.find(plaintext), std::string::npos);

  EXPECT_EQ(decrypt(ciphertext, key), plaintext);
}

TEST_F(DocumentCryptoTest, NonceIsFreshForEveryEncryption) {
  Key key = derive_key(id, upload);
  EXPECT_NE(encrypt("same text\n", key, random), encrypt("same text\n", key, random));
}

TEST_F(DocumentCryptoTest, UploadOneSecondOffFailsAuthentication) {
  std::string ciphertext = encrypt("secret\n", derive_key(id, upload), random);
  Key wrong = derive_key(id, upload + std::chrono::seconds(1));

  EXPECT_THROW(decrypt(ciphertext, wrong), AuthenticationError);
}

TEST_F(DocumentCryptoTest, TamperedCiphertextFailsAuthentication) {
  Key key = derive_key(id, upload);
  std::string ciphertext = encrypt("secret content\n", key, random);
  ciphertext[NONCE_SIZE + 2] ^= 0x01;

  EXPECT_THROW(decrypt(ciphertext, key), AuthenticationError);
}

TEST_F(DocumentCryptoTest, TruncatedInputFailsAuthentication) {
  Key key = derive_key(id, upload);
  EXPECT_THROW(decrypt("short", key), AuthenticationError);
}

TEST_F(DocumentCryptoTest, RejectsWrongKeySize) {
  Key short_key(16, 0x42);
  EXPECT_THROW(encrypt("text\n", short_key, random), CryptoError);
  EXPECT_THROW(decrypt(std::string(64, 'a'), short_key), CryptoError);
}

TEST_F(DocumentCryptoTest, FailingRandomSourceAbortsEncryption) {
  FlakyRandomSource failing(1);
  EXPECT_THROW(encrypt("text\n", derive_key(id, upload), failing), EncryptionError);
}

TEST_F(DocumentCryptoTest, HashIdIsHexSha256) {
  EXPECT_EQ(hash_id("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(hash_id(id).size(), 64u);
  EXPECT_NE(hash_id(id), hash_id(id + "x"));
}
