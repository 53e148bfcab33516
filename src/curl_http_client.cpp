#include "solrfetch/curl_http_client.hpp"
#include "solrfetch/errors.hpp"

#include <algorithm>
#include <exception>
#include <memory>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

namespace solrfetch {

namespace {

// curl_global_init is not thread safe; it runs once, before the first handle
// is created, and is undone at process exit.
class CurlGlobal {
public:
    CurlGlobal() : code_(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
    ~CurlGlobal() {
        if (code_ == CURLE_OK) {
            curl_global_cleanup();
        }
    }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    [[nodiscard]] CURLcode code() const { return code_; }

private:
    CURLcode code_;
};

void ensureCurlInitialized() {
    static const CurlGlobal global;
    if (global.code() != CURLE_OK) {
        throw TransportError(fmt::format("Failed to initialize libcurl: {}",
                                         curl_easy_strerror(global.code())));
    }
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

struct StreamContext {
    const ChunkSink* sink{nullptr};
    std::exception_ptr error;
};

// Exceptions must not cross the C callback boundary: park them and abort the
// transfer by reporting a short write.
size_t streamCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<StreamContext*>(userdata);
    const size_t total = size * nmemb;
    try {
        (*ctx->sink)(ptr, total);
    } catch (...) {
        ctx->error = std::current_exception();
        return 0;
    }
    return total;
}

CurlHandle openHandle(const std::string& url, std::size_t buffer_size) {
    ensureCurlInitialized();

    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw TransportError("Failed to allocate curl handle");
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE,
                     std::clamp<long>(static_cast<long>(buffer_size), 1024L, CURL_MAX_READ_SIZE));
    return curl;
}

long perform(CURL* curl, const std::string& url, StreamContext& ctx) {
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &streamCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);

    const CURLcode res = curl_easy_perform(curl);
    if (ctx.error) {
        std::rethrow_exception(ctx.error);
    }
    if (res != CURLE_OK) {
        throw TransportError(fmt::format("GET {} failed: {}", url, curl_easy_strerror(res)));
    }

    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    return code;
}

} // namespace

CurlHttpClient::CurlHttpClient(std::size_t receive_buffer_size)
    : receive_buffer_size_(receive_buffer_size) {
    ensureCurlInitialized();
}

HttpResponse CurlHttpClient::get(const std::string& url) {
    HttpResponse response;
    const ChunkSink sink = [&response](const char* data, std::size_t size) {
        response.body.append(data, size);
    };

    auto curl = openHandle(url, receive_buffer_size_);
    StreamContext ctx{&sink, nullptr};
    response.status_code = perform(curl.get(), url, ctx);
    return response;
}

long CurlHttpClient::stream(const std::string& url, const ChunkSink& sink) {
    auto curl = openHandle(url, receive_buffer_size_);
    StreamContext ctx{&sink, nullptr};
    return perform(curl.get(), url, ctx);
}

} // namespace solrfetch
