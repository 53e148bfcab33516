#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace solrfetch {

enum class ErrorKind {
    UrlParse,
    Transport,
    ProtocolStatus,
    Decode,
    LocalIo,
};

const char* toString(ErrorKind kind);

class FetchError : public std::runtime_error {
public:
    FetchError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class UrlParseError : public FetchError {
public:
    explicit UrlParseError(const std::string& message)
        : FetchError(ErrorKind::UrlParse, message) {}
};

class TransportError : public FetchError {
public:
    explicit TransportError(const std::string& message)
        : FetchError(ErrorKind::Transport, message) {}
};

// Server answered with a parseable body whose header status is not "0".
class ProtocolStatusError : public FetchError {
public:
    ProtocolStatusError(const std::string& message, std::string status)
        : FetchError(ErrorKind::ProtocolStatus, message), status_(std::move(status)) {}

    [[nodiscard]] const std::string& status() const noexcept { return status_; }

private:
    std::string status_;
};

class DecodeError : public FetchError {
public:
    explicit DecodeError(const std::string& message)
        : FetchError(ErrorKind::Decode, message) {}
};

class LocalIoError : public FetchError {
public:
    explicit LocalIoError(const std::string& message)
        : FetchError(ErrorKind::LocalIo, message) {}
};

} // namespace solrfetch
