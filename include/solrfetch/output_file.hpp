#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <vector>

namespace solrfetch {

// Local destination of one transfer. Incoming bytes go through a buffer of
// fixed capacity, so memory use does not depend on the size of the file.
class OutputFile {
public:
    // Creates or truncates path. Throws LocalIoError.
    OutputFile(std::filesystem::path path, std::size_t buffer_size);

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    void write(const char* data, std::size_t size);
    // Flushes and closes the file; the destructor closes silently without
    // reporting errors, so successful transfers must call this.
    void close();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t bytesWritten() const noexcept { return bytes_written_; }
    [[nodiscard]] std::size_t bufferCapacity() const noexcept { return buffer_.size(); }
    [[nodiscard]] std::size_t peakBuffered() const noexcept { return peak_buffered_; }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    void flush();

    std::filesystem::path path_;
    std::unique_ptr<FILE, FileDeleter> file_{};
    std::vector<char> buffer_;
    std::size_t used_{0};
    std::size_t peak_buffered_{0};
    std::uint64_t bytes_written_{0};
};

} // namespace solrfetch
