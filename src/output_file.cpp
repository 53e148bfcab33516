#include "solrfetch/output_file.hpp"
#include "solrfetch/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>

#include <fmt/format.h>

namespace solrfetch {

OutputFile::OutputFile(std::filesystem::path path, std::size_t buffer_size)
    : path_(std::move(path)), buffer_(std::max<std::size_t>(1, buffer_size)) {
    file_.reset(std::fopen(path_.c_str(), "wb"));
    if (!file_) {
        throw LocalIoError(fmt::format("Cannot create destination file {}: {}",
                                       path_.string(), std::strerror(errno)));
    }
    // The transfer buffer is the only buffer between the network and the disk.
    std::setvbuf(file_.get(), nullptr, _IONBF, 0);
}

void OutputFile::write(const char* data, std::size_t size) {
    if (!file_) {
        throw LocalIoError(fmt::format("Write to closed file {}", path_.string()));
    }

    while (size > 0) {
        const std::size_t n = std::min(size, buffer_.size() - used_);
        std::memcpy(buffer_.data() + used_, data, n);
        used_ += n;
        peak_buffered_ = std::max(peak_buffered_, used_);
        data += n;
        size -= n;

        if (used_ == buffer_.size()) {
            flush();
        }
    }
}

void OutputFile::flush() {
    if (used_ == 0) {
        return;
    }
    const std::size_t written = std::fwrite(buffer_.data(), 1, used_, file_.get());
    if (written != used_) {
        throw LocalIoError(fmt::format("Failed to write output file {}: {}",
                                       path_.string(), std::strerror(errno)));
    }
    bytes_written_ += written;
    used_ = 0;
}

void OutputFile::close() {
    if (!file_) {
        return;
    }
    flush();
    if (std::fclose(file_.release()) != 0) {
        throw LocalIoError(fmt::format("Failed to close output file {}: {}",
                                       path_.string(), std::strerror(errno)));
    }
}

} // namespace solrfetch
