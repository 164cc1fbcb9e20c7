#include "bpkit/byte_source.h"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace bpkit {

MemoryByteSource::MemoryByteSource(std::span<const std::byte> bytes,
                                   size_t chunk_size) noexcept
    : bytes_(bytes)
    , chunk_size_(chunk_size == 0U ? 1U : chunk_size)
{
}


ReadResult
MemoryByteSource::read(std::span<std::byte> out,
                       const std::atomic<bool>* cancelled)
{
    read_calls_ += 1;
    ReadResult res;
    if (cancelled && cancelled->load(std::memory_order_acquire)) {
        res.status = ReadStatus::Cancelled;
        return res;
    }
    if (closed_ || offset_ >= bytes_.size()) {
        res.status = ReadStatus::End;
        return res;
    }

    size_t n = bytes_.size() - offset_;
    if (n > chunk_size_) {
        n = chunk_size_;
    }
    if (n > out.size()) {
        n = out.size();
    }
    if (n != 0U) {
        std::memcpy(out.data(), bytes_.data() + offset_, n);
    }
    offset_ += n;
    res.size = n;
    return res;
}


void
MemoryByteSource::close() noexcept
{
    closed_ = true;
}


FdByteSource::FdByteSource(int fd, bool owns_fd) noexcept
    : fd_(fd)
    , owns_fd_(owns_fd)
{
}


FdByteSource::~FdByteSource() noexcept
{
    close();
}


FdByteSource::FdByteSource(FdByteSource&& other) noexcept
{
    *this = std::move(other);
}


FdByteSource&
FdByteSource::operator=(FdByteSource&& other) noexcept
{
    if (this == &other) {
        return *this;
    }
    close();
    fd_               = other.fd_;
    owns_fd_          = other.owns_fd_;
    poll_interval_ms_ = other.poll_interval_ms_;
    other.fd_         = -1;
    other.owns_fd_    = false;
    return *this;
}


bool
FdByteSource::open(const char* path) noexcept
{
    close();
    if (!path || !*path) {
        return false;
    }
    const int fd = ::open(path, O_RDONLY);
    if (fd < 0) {
        return false;
    }
    fd_      = fd;
    owns_fd_ = true;
    return true;
}


ReadResult
FdByteSource::read(std::span<std::byte> out, const std::atomic<bool>* cancelled)
{
    ReadResult res;
    if (fd_ < 0) {
        res.status = ReadStatus::End;
        return res;
    }

    for (;;) {
        if (cancelled && cancelled->load(std::memory_order_acquire)) {
            res.status = ReadStatus::Cancelled;
            return res;
        }

        pollfd pfd {};
        pfd.fd     = fd_;
        pfd.events = POLLIN;
        const int ready = ::poll(&pfd, 1, poll_interval_ms_);
        if (ready == 0) {
            continue;
        }
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            res.status = ReadStatus::Error;
            return res;
        }

        const ssize_t n = ::read(fd_, out.data(), out.size());
        if (n > 0) {
            res.size = static_cast<size_t>(n);
            return res;
        }
        if (n == 0) {
            res.status = ReadStatus::End;
            return res;
        }
        if (errno == EINTR || errno == EAGAIN) {
            continue;
        }
        res.status = ReadStatus::Error;
        return res;
    }
}


void
FdByteSource::close() noexcept
{
    if (fd_ >= 0 && owns_fd_) {
        (void)::close(fd_);
    }
    fd_      = -1;
    owns_fd_ = false;
}

}  // namespace bpkit
