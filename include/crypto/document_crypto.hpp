#ifndef PASTEBOX_CRYPTO_DOCUMENT_CRYPTO_HPP
#define PASTEBOX_CRYPTO_DOCUMENT_CRYPTO_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "crypto/crypto_error.hpp"
#include "crypto/random_source.hpp"
#include "utils/timestamp.hpp"

namespace pastebox::crypto {

using Key = std::vector<uint8_t>;

// scrypt work factors
static constexpr uint64_t SCRYPT_N = 16384;
static constexpr uint64_t SCRYPT_R = 8;
static constexpr uint64_t SCRYPT_P = 1;
static constexpr uint64_t SCRYPT_MAX_MEM = 64 * 1024 * 1024;

static constexpr size_t KEY_SIZE = 24;     // 192 bits for AES-192
static constexpr size_t NONCE_SIZE = 12;   // 96 bit GCM nonce
static constexpr size_t TAG_SIZE = 16;     // 128 bit GCM tag


// ---- KEY MATERIAL ----
// Derives the content key from the identifier (password) and the formatted
// upload timestamp (salt). Never persisted, re-derived on every read.
Key derive_key(const std::string& id, utils::TimePoint upload);


// ---- AUTHENTICATED ENCRYPTION ----
// Output layout: nonce || ciphertext || tag
std::string encrypt(const std::string& plaintext, const Key& key, RandomSource& random);
// Throws AuthenticationError if the tag does not verify
std::string decrypt(const std::string& data, const Key& key);


// ---- STORAGE KEY ----
// Lowercase hex SHA-256 of the identifier
std::string hash_id(const std::string& id);

} // namespace pastebox::crypto

#endif // PASTEBOX_CRYPTO_DOCUMENT_CRYPTO_HPP
