#pragma once

#include <string>
#include "../core/exceptions.hpp"

namespace webhunter {

// Transport-level failure of a single HTTP exchange. HTTP error statuses are
// not exceptions; callers classify them from the response.
class NetworkException : public WebHunterException {
public:
    explicit NetworkException(const std::string& message)
        : WebHunterException("Network Error: " + message) {}
};

class TimeoutException : public NetworkException {
public:
    using NetworkException::NetworkException;
};

class ConnectionException : public NetworkException {
public:
    using NetworkException::NetworkException;
};

// Transfer aborted because the process is shutting down
class CancelledException : public NetworkException {
public:
    using NetworkException::NetworkException;
};

} // namespace webhunter
