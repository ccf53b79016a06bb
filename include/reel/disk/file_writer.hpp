// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace reel::disk {

// Destination of a byte stream. Decorators (limiter, progress counter) wrap
// another sink; the file writer terminates the chain.
class ByteSink {
public:
    virtual ~ByteSink() = default;

    [[nodiscard]] virtual std::error_code write(std::span<const std::byte> data) noexcept = 0;
    [[nodiscard]] virtual std::error_code flush() noexcept = 0;
};

enum class OpenMode : std::uint8_t {
    truncate,   // Fresh download
    append      // Resume after existing bytes
};

// Fixed-capacity staging buffer
class WriteBuffer {
public:
    explicit WriteBuffer(std::size_t capacity);

    [[nodiscard]] const std::byte* data() const noexcept { return buffer_.data(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return buffer_.size(); }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] bool full() const noexcept { return size_ == buffer_.size(); }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    void reset() noexcept { size_ = 0; }

    // Copy as much of data as fits; returns the count taken
    std::size_t append(std::span<const std::byte> data) noexcept;

private:
    std::vector<std::byte> buffer_;
    std::size_t size_{0};
};

// Sequential file sink with bounded buffering
class FileWriter final : public ByteSink {
public:
    explicit FileWriter(std::size_t buffer_size = core::WRITE_BUFFER_SIZE);
    ~FileWriter() override;

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    [[nodiscard]] std::error_code open(std::string_view path, OpenMode mode) noexcept;

    [[nodiscard]] std::error_code write(std::span<const std::byte> data) noexcept override;

    // Push buffered bytes to the file
    [[nodiscard]] std::error_code flush() noexcept override;

    // Flush, sync and close; safe to call twice
    [[nodiscard]] std::error_code close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    // Bytes accepted since open (buffered or written)
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return bytes_written_; }

private:
    [[nodiscard]] std::error_code write_all(const std::byte* data, std::size_t size) noexcept;

    int fd_{-1};
    std::string path_;
    WriteBuffer buffer_;
    std::uint64_t bytes_written_{0};
};

} // namespace reel::disk
