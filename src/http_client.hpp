#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

// Receives one GET response. on_response() is called exactly once with the
// final status before any body bytes are delivered.
class ResponseHandler {
public:
    virtual ~ResponseHandler() = default;
    virtual void on_response(long status) = 0;
    virtual void on_data(const char* data, std::size_t size) = 0;
};

// Narrow HTTP surface used by the downloader. Failures are reported by
// throwing one of the NetworkError subclasses from exception.hpp.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Metadata-only request. Returns the advertised Content-Length, if any.
    virtual std::optional<std::uint64_t> head(const std::string& url, std::chrono::seconds timeout) = 0;

    // GET, optionally with "Range: bytes=<range_start>-". Handler exceptions
    // abort the transfer and are rethrown to the caller.
    virtual long get(const std::string& url, std::optional<std::uint64_t> range_start,
                     std::chrono::seconds timeout, ResponseHandler& handler) = 0;

    // True unless the request failed at the connection level.
    virtual bool ping(const std::string& url, std::chrono::seconds timeout) = 0;
};
