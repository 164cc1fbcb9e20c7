#include "bpkit/file_io.h"

#include <cerrno>
#include <limits>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace bpkit {
namespace {

    class ScopedFd final {
    public:
        explicit ScopedFd(int fd) noexcept
            : fd_(fd)
        {
        }
        ~ScopedFd() noexcept
        {
            if (fd_ >= 0) {
                (void)::close(fd_);
            }
        }

        ScopedFd(const ScopedFd&)            = delete;
        ScopedFd& operator=(const ScopedFd&) = delete;

        int get() const noexcept { return fd_; }

        /// Closes now and reports whether the close succeeded.
        bool close() noexcept
        {
            const int fd = fd_;
            fd_          = -1;
            return fd < 0 || ::close(fd) == 0;
        }

    private:
        int fd_ = -1;
    };

}  // namespace

FileStatus
read_file_bytes(const char* path, uint64_t max_file_bytes,
                std::vector<std::byte>* out)
{
    out->clear();
    if (!path || !*path) {
        return FileStatus::OpenFailed;
    }

    ScopedFd fd(::open(path, O_RDONLY));
    if (fd.get() < 0) {
        return FileStatus::OpenFailed;
    }

    struct stat st {};
    if (::fstat(fd.get(), &st) != 0 || st.st_size < 0) {
        return FileStatus::StatFailed;
    }

    const uint64_t size_u64 = static_cast<uint64_t>(st.st_size);
    if (max_file_bytes != 0U && size_u64 > max_file_bytes) {
        return FileStatus::TooLarge;
    }
    if (size_u64 > static_cast<uint64_t>(
                       std::numeric_limits<size_t>::max())) {
        return FileStatus::TooLarge;
    }

    out->resize(static_cast<size_t>(size_u64));
    size_t done = 0;
    while (done < out->size()) {
        const ssize_t n = ::read(fd.get(), out->data() + done,
                                 out->size() - done);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            out->clear();
            return FileStatus::ReadFailed;
        }
        if (n == 0) {
            // Shrunk while reading.
            out->resize(done);
            break;
        }
        done += static_cast<size_t>(n);
    }
    return FileStatus::Ok;
}


FileStatus
write_file_bytes(const char* path, std::span<const std::byte> bytes) noexcept
{
    if (!path || !*path) {
        return FileStatus::OpenFailed;
    }
    ScopedFd fd(::open(path, O_WRONLY | O_CREAT | O_TRUNC, 0644));
    if (fd.get() < 0) {
        return FileStatus::OpenFailed;
    }

    size_t done = 0;
    while (done < bytes.size()) {
        const ssize_t n = ::write(fd.get(), bytes.data() + done,
                                  bytes.size() - done);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return FileStatus::WriteFailed;
        }
        done += static_cast<size_t>(n);
    }
    return fd.close() ? FileStatus::Ok : FileStatus::WriteFailed;
}


bool
file_exists(const char* path) noexcept
{
    if (!path || !*path) {
        return false;
    }
    const int fd = ::open(path, O_RDONLY);
    if (fd < 0) {
        return false;
    }
    (void)::close(fd);
    return true;
}

}  // namespace bpkit
