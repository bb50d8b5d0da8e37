#ifndef PASTEBOX_CRYPTO_ERROR_HPP
#define PASTEBOX_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pastebox::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message) 
        : std::runtime_error(message) {}
};

class KeyDerivationError : public CryptoError {
public:
    explicit KeyDerivationError(const std::string& message) 
        : CryptoError("Key derivation error: " + message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message) 
        : CryptoError("Encryption error: " + message) {}
};

class DecryptionError : public CryptoError {
public:
    explicit DecryptionError(const std::string& message) 
        : CryptoError("Decryption error: " + message) {}
};

// Tag mismatch: tampered ciphertext or a key derived from the wrong inputs
class AuthenticationError : public DecryptionError {
public:
    explicit AuthenticationError(const std::string& message) 
        : DecryptionError("message authentication failed: " + message) {}
};

} // namespace pastebox::crypto

#endif // PASTEBOX_CRYPTO_ERROR_HPP
