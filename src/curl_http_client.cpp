#include "curl_http_client.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <exception>
#include <memory>
#include <string>

namespace {

// Custom deleter for the CURL handle
struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

constexpr const char* USER_AGENT = "rdl/" RDL_VERSION;

struct BodyContext {
    CURL* curl = nullptr;
    ResponseHandler* handler = nullptr;
    bool started = false;
    std::exception_ptr error;
};

void notify_response(BodyContext& ctx) {
    long status = 0;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &status);
    ctx.started = true;
    ctx.handler->on_response(status);
}

// Returning anything but the full size makes curl abort with CURLE_WRITE_ERROR.
size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<BodyContext*>(userdata);
    const size_t bytes = size * nmemb;
    try {
        if (!ctx->started) {
            notify_response(*ctx);
        }
        ctx->handler->on_data(ptr, bytes);
    } catch (...) {
        ctx->error = std::current_exception();
        return 0;
    }
    return bytes;
}

CurlHandle make_handle(const std::string& url) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw RequestFailedError(string_format("error.curl_init_failed", url));
    }
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, USER_AGENT);
    return curl;
}

[[noreturn]] void throw_curl_error(CURL* curl, CURLcode res, const std::string& url) {
    const std::string message = string_format("error.request_failed", url, curl_easy_strerror(res));
    switch (classify_curl_error(res)) {
        case CurlErrorKind::CONNECTIVITY_LOST:
            throw ConnectivityLostError(message);
        case CurlErrorKind::CONNECT_FAILED:
            throw ConnectFailedError(message);
        case CurlErrorKind::REQUEST_FAILED:
        default: {
            long status = 0;
            if (res == CURLE_HTTP_RETURNED_ERROR) {
                curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            }
            throw RequestFailedError(message, status);
        }
    }
}

} // anonymous namespace

CurlErrorKind classify_curl_error(CURLcode code) {
    switch (code) {
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return CurlErrorKind::CONNECTIVITY_LOST;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:
            return CurlErrorKind::CONNECT_FAILED;
        default:
            return CurlErrorKind::REQUEST_FAILED;
    }
}

bool probe_reached_network(CURLcode code, bool connected) {
    if (code == CURLE_OK) {
        return true;
    }
    switch (classify_curl_error(code)) {
        case CurlErrorKind::CONNECTIVITY_LOST:
        case CurlErrorKind::CONNECT_FAILED:
            return false;
        case CurlErrorKind::REQUEST_FAILED:
            break;
    }
    if (code == CURLE_OPERATION_TIMEDOUT) {
        return connected;
    }
    return true;
}

CurlHttpClient::CurlHttpClient(std::size_t buffer_size) : buffer_size_(buffer_size) {}

std::optional<std::uint64_t> CurlHttpClient::head(const std::string& url, std::chrono::seconds timeout) {
    CurlHandle curl = make_handle(url);
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw_curl_error(curl.get(), res, url);
    }

    curl_off_t length = -1;
    if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) != CURLE_OK || length < 0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(length);
}

long CurlHttpClient::get(const std::string& url, std::optional<std::uint64_t> range_start,
                         std::chrono::seconds timeout, ResponseHandler& handler) {
    CurlHandle curl = make_handle(url);
    BodyContext ctx;
    ctx.curl = curl.get();
    ctx.handler = &handler;

    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, static_cast<long>(buffer_size_));

    // No total timeout: a transfer may legitimately take hours. A connection
    // that cannot be opened, or stalls, within the window is a timeout.
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, static_cast<long>(timeout.count()));

    const std::string range = range_start ? std::to_string(*range_start) + "-" : std::string();
    if (range_start) {
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (ctx.error) {
        std::rethrow_exception(ctx.error);
    }
    if (res != CURLE_OK) {
        throw_curl_error(curl.get(), res, url);
    }
    if (!ctx.started) {
        // Empty body: the handler still has to see the status.
        notify_response(ctx);
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    return status;
}

bool CurlHttpClient::ping(const std::string& url, std::chrono::seconds timeout) {
    CurlHandle curl = make_handle(url);
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));

    // Any HTTP answer, even an error status or a bad certificate, proves
    // the network is up.
    const CURLcode res = curl_easy_perform(curl.get());
    curl_off_t connect_time = 0;
    const bool connected = curl_easy_getinfo(curl.get(), CURLINFO_CONNECT_TIME_T, &connect_time) == CURLE_OK
        && connect_time > 0;
    return probe_reached_network(res, connected);
}
