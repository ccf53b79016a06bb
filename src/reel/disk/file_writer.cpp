// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace reel::disk {

//=============================================================================
// WriteBuffer
//=============================================================================

WriteBuffer::WriteBuffer(std::size_t capacity) {
    buffer_.resize(std::max<std::size_t>(capacity, 1));
}

std::size_t WriteBuffer::append(std::span<const std::byte> data) noexcept {
    std::size_t n = std::min(data.size(), buffer_.size() - size_);
    if (n > 0) {
        std::memcpy(buffer_.data() + size_, data.data(), n);
        size_ += n;
    }
    return n;
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::FileWriter(std::size_t buffer_size)
    : buffer_(buffer_size) {}

FileWriter::~FileWriter() {
    if (auto ec = close()) {
        spdlog::warn("Closing {} failed: {}", path_, ec.message());
    }
}

std::error_code FileWriter::open(std::string_view path, OpenMode mode) noexcept {
    if (fd_ >= 0) {
        return make_error_code(DiskErrc::file_exists);
    }

    try {
        path_ = path;
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::invalid_path);
    }

    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    flags |= (mode == OpenMode::append) ? O_APPEND : O_TRUNC;

    int fd = ::open(path_.c_str(), flags, 0644);
    if (fd < 0) {
        return posix_error_to_error_code(errno);
    }

    fd_ = fd;
    buffer_.reset();
    bytes_written_ = 0;
    return {};
}

std::error_code FileWriter::write(std::span<const std::byte> data) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    while (!data.empty()) {
        std::size_t taken = buffer_.append(data);
        data = data.subspan(taken);
        bytes_written_ += taken;

        if (buffer_.full()) {
            if (auto ec = flush()) return ec;
        }
    }
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (buffer_.empty()) return {};

    auto ec = write_all(buffer_.data(), buffer_.size());
    buffer_.reset();
    return ec;
}

std::error_code FileWriter::close() noexcept {
    if (fd_ < 0) return {};

    auto ec = flush();
    if (!ec && ::fsync(fd_) != 0) {
        ec = posix_error_to_error_code(errno);
    }
    if (::close(fd_) != 0 && !ec) {
        ec = posix_error_to_error_code(errno);
    }
    fd_ = -1;
    return ec;
}

std::error_code FileWriter::write_all(const std::byte* data, std::size_t size) noexcept {
    while (size > 0) {
        ssize_t n = ::write(fd_, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return posix_error_to_error_code(errno);
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
    return {};
}

} // namespace reel::disk
