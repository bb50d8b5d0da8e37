#include "crypto/document_crypto.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace pastebox::crypto {

//=================================================
// RAII WRAPPERS FOR OPENSSL CONTEXTS
//=================================================

namespace {

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw CryptoError("Document crypto: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  CipherContext(const CipherContext&) = delete;
  CipherContext& operator=(const CipherContext&) = delete;

  EVP_CIPHER_CTX* get() { return ctx; }
};

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw CryptoError("Document crypto: Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

void check_key(const Key& key) {
  if (key.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Document crypto: Invalid key size: " << key.size() << " bytes (expected " << KEY_SIZE << " bytes)";
    throw CryptoError("Invalid key size");
  }
}

} // namespace


//==============================================
// KEY MATERIAL
//==============================================

Key derive_key(const std::string& id, utils::TimePoint upload) {
  const std::string salt = utils::format_timestamp(upload);
  BOOST_LOG_TRIVIAL(debug) << "Document crypto: Deriving key with salt: " << salt;

  Key key(KEY_SIZE);
  if (EVP_PBE_scrypt(id.data(), id.size(),
                     reinterpret_cast<const unsigned char*>(salt.data()), salt.size(),
                     SCRYPT_N, SCRYPT_R, SCRYPT_P, SCRYPT_MAX_MEM,
                     key.data(), key.size()) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Document crypto: Invalid scrypt parameters";
    throw KeyDerivationError("scrypt failed");
  }
  return key;
}


//==============================================
// AUTHENTICATED ENCRYPTION
//==============================================

std::string encrypt(const std::string& plaintext, const Key& key, RandomSource& random) {
  check_key(key);

  std::string output(NONCE_SIZE + plaintext.size() + TAG_SIZE, '\0');
  auto* out = reinterpret_cast<unsigned char*>(&output[0]);

  // Fresh nonce for every encryption
  if (!random.fill(out, NONCE_SIZE)) {
    throw EncryptionError("Failed to generate nonce");
  }

  CipherContext context;
  if (!EVP_EncryptInit_ex(context.get(), EVP_aes_192_gcm(), nullptr, nullptr, nullptr) ||
      !EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) ||
      !EVP_EncryptInit_ex(context.get(), nullptr, nullptr, key.data(), out)) {
    throw EncryptionError("Failed to initialize encryption context");
  }

  int outlen = 0;
  if (!EVP_EncryptUpdate(context.get(), out + NONCE_SIZE, &outlen,
                         reinterpret_cast<const unsigned char*>(plaintext.data()),
                         static_cast<int>(plaintext.size()))) {
    throw EncryptionError("Failed to encrypt content");
  }

  int final_len = 0;
  if (!EVP_EncryptFinal_ex(context.get(), out + NONCE_SIZE + outlen, &final_len)) {
    throw EncryptionError("Failed to finalize encryption");
  }

  if (!EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE),
                           out + NONCE_SIZE + outlen + final_len)) {
    throw EncryptionError("Failed to read authentication tag");
  }

  BOOST_LOG_TRIVIAL(debug) << "Document crypto: Encrypted " << plaintext.size() << " bytes";
  return output;
}

std::string decrypt(const std::string& data, const Key& key) {
  check_key(key);

  if (data.size() < NONCE_SIZE + TAG_SIZE) {
    throw AuthenticationError("ciphertext too short");
  }

  const auto* in = reinterpret_cast<const unsigned char*>(data.data());
  const size_t body_size = data.size() - NONCE_SIZE - TAG_SIZE;

  CipherContext context;
  if (!EVP_DecryptInit_ex(context.get(), EVP_aes_192_gcm(), nullptr, nullptr, nullptr) ||
      !EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) ||
      !EVP_DecryptInit_ex(context.get(), nullptr, nullptr, key.data(), in)) {
    throw DecryptionError("Failed to initialize decryption context");
  }

  std::string plaintext(body_size, '\0');
  auto* out = reinterpret_cast<unsigned char*>(&plaintext[0]);

  int outlen = 0;
  if (!EVP_DecryptUpdate(context.get(), out, &outlen, in + NONCE_SIZE, static_cast<int>(body_size))) {
    throw DecryptionError("Failed to decrypt content");
  }

  // The tag is checked by the final call
  std::vector<unsigned char> tag(in + NONCE_SIZE + body_size, in + data.size());
  if (!EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE), tag.data())) {
    throw DecryptionError("Failed to set authentication tag");
  }

  int final_len = 0;
  if (EVP_DecryptFinal_ex(context.get(), out + outlen, &final_len) <= 0) {
    throw AuthenticationError("tag mismatch");
  }

  plaintext.resize(static_cast<size_t>(outlen + final_len));
  BOOST_LOG_TRIVIAL(debug) << "Document crypto: Decrypted " << plaintext.size() << " bytes";
  return plaintext;
}


//==============================================
// STORAGE KEY
//==============================================

std::string hash_id(const std::string& id) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  DigestContext context;
  if (!EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) ||
      !EVP_DigestUpdate(context.get(), id.data(), id.size()) ||
      !EVP_DigestFinal_ex(context.get(), hash, &hash_len)) {
    throw CryptoError("Document crypto: Failed to hash identifier");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') 
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}

} // namespace pastebox::crypto
