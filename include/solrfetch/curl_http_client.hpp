#pragma once

#include "http_client.hpp"

#include <cstddef>
#include <string>

namespace solrfetch {

// libcurl easy-interface client. Every request gets its own handle, so one
// instance is shared by all workers.
class CurlHttpClient final : public HttpClient {
public:
    // receive_buffer_size is handed to CURLOPT_BUFFERSIZE and caps the size of
    // a single chunk passed to a ChunkSink.
    explicit CurlHttpClient(std::size_t receive_buffer_size);

    HttpResponse get(const std::string& url) override;
    long stream(const std::string& url, const ChunkSink& sink) override;

private:
    std::size_t receive_buffer_size_;
};

} // namespace solrfetch
