#include "crypto/random_source.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>

namespace pastebox::crypto {

bool OpenSSLRandomSource::fill(uint8_t* buffer, size_t length) {
  if (RAND_bytes(buffer, static_cast<int>(length)) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Random source: RAND_bytes failed: " << ERR_get_error();
    return false;
  }
  return true;
}

} // namespace pastebox::crypto
