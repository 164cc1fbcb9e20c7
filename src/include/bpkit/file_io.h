#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file file_io.h
 * \brief Bounded whole-file reads and writes.
 */

namespace bpkit {

/// Status code for the file helpers.
enum class FileStatus : uint8_t {
    Ok,
    OpenFailed,
    StatFailed,
    /// The file exceeds the caller's cap; nothing was read.
    TooLarge,
    ReadFailed,
    WriteFailed,
};

/**
 * \brief Reads \p path into \p out.
 *
 * The size is checked against \p max_file_bytes (0 = unlimited) before any
 * byte is read or allocated.
 */
FileStatus
read_file_bytes(const char* path, uint64_t max_file_bytes,
                std::vector<std::byte>* out);

/// Creates or truncates \p path and writes \p bytes.
FileStatus
write_file_bytes(const char* path, std::span<const std::byte> bytes) noexcept;

/// True if \p path can be opened for reading.
bool
file_exists(const char* path) noexcept;

}  // namespace bpkit
