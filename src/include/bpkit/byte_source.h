#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file byte_source.h
 * \brief Pull-based byte sources for the event stream reader.
 */

namespace bpkit {

enum class ReadStatus : uint8_t {
    Ok,
    /// End of stream; no bytes were produced.
    End,
    /// The cancel flag was observed before data arrived.
    Cancelled,
    /// An I/O error occurred.
    Error,
};

struct ReadResult final {
    ReadStatus status = ReadStatus::Ok;
    size_t size       = 0;
};

/**
 * \brief A stream of bytes delivered in arbitrary-sized pieces.
 *
 * `read` may block. Implementations that can block check \p cancelled
 * periodically so another thread can abandon the read.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Reads at most `out.size()` bytes into \p out.
    virtual ReadResult read(std::span<std::byte> out,
                            const std::atomic<bool>* cancelled)
        = 0;

    /// Releases the underlying handle. Called once the reader is done.
    virtual void close() noexcept = 0;
};

/// Serves a borrowed buffer in pieces of at most `chunk_size` bytes.
class MemoryByteSource final : public ByteSource {
public:
    explicit MemoryByteSource(std::span<const std::byte> bytes,
                              size_t chunk_size = 4096U) noexcept;

    ReadResult read(std::span<std::byte> out,
                    const std::atomic<bool>* cancelled) override;
    void close() noexcept override;

    /// Number of `read` calls issued so far.
    uint32_t read_calls() const noexcept { return read_calls_; }
    /// Bytes handed out so far.
    size_t consumed() const noexcept { return offset_; }
    bool closed() const noexcept { return closed_; }

private:
    std::span<const std::byte> bytes_;
    size_t chunk_size_   = 4096U;
    size_t offset_       = 0;
    uint32_t read_calls_ = 0;
    bool closed_         = false;
};

/**
 * \brief Reads a POSIX file descriptor (pipe, socket or file).
 *
 * Waits with `poll` in slices of `poll_interval_ms` so a pending
 * cancellation is noticed without new data arriving.
 */
class FdByteSource final : public ByteSource {
public:
    FdByteSource() noexcept = default;
    FdByteSource(int fd, bool owns_fd) noexcept;
    ~FdByteSource() noexcept override;

    FdByteSource(const FdByteSource&)            = delete;
    FdByteSource& operator=(const FdByteSource&) = delete;

    FdByteSource(FdByteSource&& other) noexcept;
    FdByteSource& operator=(FdByteSource&& other) noexcept;

    /// Opens \p path read-only; the descriptor is owned.
    bool open(const char* path) noexcept;

    ReadResult read(std::span<std::byte> out,
                    const std::atomic<bool>* cancelled) override;
    void close() noexcept override;

    bool is_open() const noexcept { return fd_ >= 0; }
    void set_poll_interval_ms(int ms) noexcept { poll_interval_ms_ = ms; }

private:
    int fd_               = -1;
    bool owns_fd_         = false;
    int poll_interval_ms_ = 50;
};

}  // namespace bpkit
