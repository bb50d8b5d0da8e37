#ifndef PASTEBOX_ENGINE_ERROR_HPP
#define PASTEBOX_ENGINE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pastebox::engine {

class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& message) 
        : std::runtime_error(message) {}
};

// Content refused on write, surfaced to the caller verbatim
class InputRejectedError : public EngineError {
public:
    explicit InputRejectedError(const std::string& message) 
        : EngineError(message) {}
};

class SpamRejectedError : public InputRejectedError {
public:
    explicit SpamRejectedError(const std::string& reason) 
        : InputRejectedError("spam: " + reason) {}
};

class ExpiredError : public EngineError {
public:
    ExpiredError() 
        : EngineError("the document has expired") {}
};

} // namespace pastebox::engine

#endif // PASTEBOX_ENGINE_ERROR_HPP
