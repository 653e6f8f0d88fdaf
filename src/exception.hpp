#pragma once

#include <stdexcept>
#include <string>

class RdlException : public std::runtime_error {
public:
    explicit RdlException(const std::string& message)
        : std::runtime_error(message) {}
};

// Base for everything that went wrong on the wire.
class NetworkError : public RdlException {
public:
    using RdlException::RdlException;
};

// The path to the server went away mid-request (reset, truncated body, ...).
class ConnectivityLostError : public NetworkError {
public:
    using NetworkError::NetworkError;
};

// Name resolution or TCP connect failed. Whether this is an outage or a
// bad host is decided by asking the connectivity monitor.
class ConnectFailedError : public NetworkError {
public:
    using NetworkError::NetworkError;
};

// The server was reachable but the request did not succeed.
class RequestFailedError : public NetworkError {
public:
    explicit RequestFailedError(const std::string& message, long http_status = 0)
        : NetworkError(message), http_status_(http_status) {}

    long http_status() const { return http_status_; }

private:
    long http_status_;
};
