#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace solrfetch {

struct HttpResponse {
    long status_code{0};
    std::string body;
};

// Receives the response body piece by piece. May throw; the exception is
// rethrown from HttpClient::stream.
using ChunkSink = std::function<void(const char* data, std::size_t size)>;

// Implementations must allow concurrent calls from several workers.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Reads the whole body into memory. Only used for discovery responses.
    virtual HttpResponse get(const std::string& url) = 0;

    // Streams the body into sink and returns the HTTP status code.
    virtual long stream(const std::string& url, const ChunkSink& sink) = 0;
};

} // namespace solrfetch
