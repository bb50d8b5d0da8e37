#ifndef PASTEBOX_STORE_ERROR_HPP
#define PASTEBOX_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pastebox {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Missing key, reported quietly by the engine
class NotFoundError : public StoreError {
public:
  explicit NotFoundError(const std::string& key) : StoreError("Store: No record for key: " + key) {}
};

} // namespace store
} // namespace pastebox

#endif // PASTEBOX_STORE_ERROR_HPP
