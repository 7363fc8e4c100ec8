/**
 * @file log_writers.hpp
 * @brief Buffered output writer used by sink workers
 * @author nexuslog contributors
 * @copyright Copyright (c) 2026 nexuslog contributors. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <unistd.h> // For write() and STDOUT_FILENO
#include <fcntl.h>

#include "log_types.hpp"

namespace nexuslog
{

/**
 * @brief Buffered writer over a file descriptor
 *
 * Bytes accumulate in a WRITER_BUFFER_SIZE buffer and reach the descriptor
 * when the buffer fills or on flush(). Failures are reported as
 * std::system_error. The writer is only used from its sink's worker thread.
 */
class file_writer
{
  public:
    file_writer() = default;

    /**
     * @brief Wrap an existing descriptor
     * @param fd Descriptor to write to
     * @param close_fd Whether the writer owns and closes @p fd
     */
    explicit file_writer(int fd, bool close_fd = false, std::string filename = {})
    : filename_(std::move(filename)), fd_(fd), close_fd_(close_fd), buffer_(std::make_unique<char[]>(WRITER_BUFFER_SIZE))
    {
    }

    /**
     * @brief Open @p path for appending, creating it and its parent directories
     * @throws std::system_error if the file cannot be opened
     * @throws std::filesystem::filesystem_error if a parent directory cannot be created
     */
    static file_writer open_append(const std::filesystem::path &path)
    {
        if (path.has_parent_path()) { std::filesystem::create_directories(path.parent_path()); }

        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (fd < 0)
        {
            throw std::system_error(errno, std::generic_category(), "Failed to open log file: " + path.string());
        }
        return file_writer(fd, true, path.string());
    }

    file_writer(file_writer &&other) noexcept
    : filename_(std::move(other.filename_)),
      fd_(std::exchange(other.fd_, -1)),
      close_fd_(std::exchange(other.close_fd_, false)),
      buffer_(std::move(other.buffer_)),
      used_(std::exchange(other.used_, 0))
    {
    }

    file_writer &operator=(file_writer &&other) noexcept
    {
        if (this != &other)
        {
            close_fd();
            filename_ = std::move(other.filename_);
            fd_       = std::exchange(other.fd_, -1);
            close_fd_ = std::exchange(other.close_fd_, false);
            buffer_   = std::move(other.buffer_);
            used_     = std::exchange(other.used_, 0);
        }
        return *this;
    }

    file_writer(const file_writer &)            = delete;
    file_writer &operator=(const file_writer &) = delete;

    // Buffered bytes not flushed before destruction are lost
    ~file_writer() { close_fd(); }

    bool is_open() const noexcept { return fd_ >= 0; }
    const std::string &filename() const noexcept { return filename_; }
    size_t buffered() const noexcept { return used_; }

    void write(const char *data, size_t len)
    {
        if (used_ + len > WRITER_BUFFER_SIZE)
        {
            flush();
            if (len > WRITER_BUFFER_SIZE)
            {
                write_all(data, len);
                return;
            }
        }
        std::memcpy(buffer_.get() + used_, data, len);
        used_ += len;
    }

    void flush()
    {
        if (used_ == 0) return;
        size_t len = std::exchange(used_, 0);
        write_all(buffer_.get(), len);
    }

  private:
    void write_all(const char *data, size_t len)
    {
        size_t total_written = 0;
        while (total_written < len)
        {
            ssize_t written = ::write(fd_, data + total_written, len - total_written);
            if (written < 0)
            {
                if (errno == EINTR) { continue; }
                throw std::system_error(errno, std::generic_category(), "Failed to write log output");
            }
            total_written += static_cast<size_t>(written);
        }
    }

    void close_fd() noexcept
    {
        if (close_fd_ && fd_ >= 0) { ::close(fd_); }
        fd_       = -1;
        close_fd_ = false;
    }

    std::string filename_;
    int fd_{-1};
    bool close_fd_{false};
    std::unique_ptr<char[]> buffer_;
    size_t used_{0};
};

} // namespace nexuslog
