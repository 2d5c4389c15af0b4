/**
 * @file log_buffered_writer.hpp
 * @brief Write buffer in front of a file descriptor
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

// Platform-specific sync implementation
inline int log_fdatasync(int fd)
{
#if defined(__APPLE__)
    // fsync on macOS does not reach permanent storage
    return ::fcntl(fd, F_FULLFSYNC);
#else
    return ::fdatasync(fd);
#endif
}

namespace rotolog
{

/**
 * @brief Fixed size byte buffer that writes through to a descriptor when full
 *
 * Not thread safe; file_sink serializes all access under its mutex. Errors
 * are returned as -1 with errno set, the writer never throws.
 */
class buffered_writer
{
    int fd_;
    std::vector<char> buffer_;
    size_t used_{0};

  public:
    buffered_writer(int fd, size_t capacity) : fd_(fd), buffer_(capacity) {}

    int fd() const { return fd_; }
    size_t capacity() const { return buffer_.size(); }
    size_t buffered() const { return used_; }
    size_t available() const { return buffer_.size() - used_; }

    /**
     * @brief Rebind to another descriptor, dropping anything still buffered
     */
    void reset(int fd)
    {
        fd_   = fd;
        used_ = 0;
    }

    /**
     * @brief Append @p len bytes
     *
     * Data that does not fit is pushed out by flushing; a chunk larger than an
     * empty buffer bypasses it.
     *
     * @return @p len on success, -1 on failure
     */
    ssize_t write(const char *data, size_t len)
    {
        const size_t total = len;

        while (len > available())
        {
            if (used_ == 0)
            {
                if (write_fully(fd_, data, len) < 0) { return -1; }
                return static_cast<ssize_t>(total);
            }

            size_t n = available();
            std::memcpy(buffer_.data() + used_, data, n);
            used_ += n;
            data += n;
            len -= n;

            if (flush() < 0) { return -1; }
        }

        std::memcpy(buffer_.data() + used_, data, len);
        used_ += len;
        return static_cast<ssize_t>(total);
    }

    /**
     * @brief Write buffered bytes to the descriptor
     *
     * The buffer is emptied even on failure; the lost bytes are not retried.
     *
     * @return 0 on success, -1 on failure
     */
    int flush()
    {
        if (used_ == 0) { return 0; }

        size_t pending = used_;
        used_          = 0;
        return write_fully(fd_, buffer_.data(), pending) < 0 ? -1 : 0;
    }

    // Push data to the storage device, EINVAL (pipes, ttys) is not an error
    int sync()
    {
        if (fd_ < 0)
        {
            errno = EBADF;
            return -1;
        }
        if (log_fdatasync(fd_) != 0 && errno != EINVAL && errno != EROFS) { return -1; }
        return 0;
    }

  private:
    static ssize_t write_fully(int fd, const char *data, size_t len)
    {
        if (fd < 0)
        {
            errno = EBADF;
            return -1;
        }

        size_t total_written = 0;
        while (total_written < len)
        {
            ssize_t written = ::write(fd, data + total_written, len - total_written);
            if (written < 0)
            {
                if (errno == EINTR) { continue; }
                return -1;
            }
            total_written += static_cast<size_t>(written);
        }
        return static_cast<ssize_t>(total_written);
    }
};

} // namespace rotolog
