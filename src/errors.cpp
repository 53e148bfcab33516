#include "solrfetch/errors.hpp"

namespace solrfetch {

const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::UrlParse:
        return "url parse error";
    case ErrorKind::Transport:
        return "transport error";
    case ErrorKind::ProtocolStatus:
        return "protocol status error";
    case ErrorKind::Decode:
        return "decode error";
    case ErrorKind::LocalIo:
        return "local io error";
    }
    return "unknown error";
}

} // namespace solrfetch
