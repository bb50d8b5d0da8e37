#ifndef PASTEBOX_CRYPTO_RANDOM_SOURCE_HPP
#define PASTEBOX_CRYPTO_RANDOM_SOURCE_HPP

#include <cstddef>
#include <cstdint>

namespace pastebox::crypto {

// Source of cryptographically secure random bytes
class RandomSource {
public:
  virtual ~RandomSource() = default;

  // Fills buffer with random bytes, returns false if the source failed
  virtual bool fill(uint8_t* buffer, size_t length) = 0;
};

// RAND_bytes backed source
class OpenSSLRandomSource : public RandomSource {
public:
  bool fill(uint8_t* buffer, size_t length) override;
};

} // namespace pastebox::crypto

#endif // PASTEBOX_CRYPTO_RANDOM_SOURCE_HPP
