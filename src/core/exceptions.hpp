#pragma once

#include <stdexcept>
#include <string>

namespace webhunter {

class WebHunterException : public std::runtime_error {
public:
    explicit WebHunterException(const std::string& message) : std::runtime_error(message) {}
    explicit WebHunterException(const char* message) : std::runtime_error(message) {}
};

class ConfigurationError : public WebHunterException {
public:
    explicit ConfigurationError(const std::string& message)
        : WebHunterException("Configuration Error: " + message) {}
};

// Raised by source adapters. Always scoped to one cycle of one source.
class FetchError : public WebHunterException {
public:
    enum class Kind {
        TRANSIENT,
        PERMANENT
    };

    FetchError(Kind kind, const std::string& message)
        : WebHunterException("Fetch Error: " + message), kind_(kind) {}

    Kind kind() const { return kind_; }
    bool is_transient() const { return kind_ == Kind::TRANSIENT; }

private:
    Kind kind_;
};

} // namespace webhunter
