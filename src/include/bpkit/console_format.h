#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace bpkit {

// Appends `s` to `out` so untrusted chunk text cannot drive the terminal.
// Printable ASCII passes through with `\` and `"` backslash-escaped;
// newline, CR and tab become `\n`, `\r`, `\t`; any other control or
// high byte becomes `\xNN`. At most `max_bytes` input bytes are shown
// (0 = all), then "...".
//
// Returns true if a control or high byte was escaped or input was cut.
bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept;

// Hex dump without separators, e.g. "89504E47". Cut like the above.
void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept;

// Appends a chunk type as four characters, escaping bytes that are not
// printable ASCII (scanned types are letters, hand-built ones may not be).
void
append_chunk_type(uint32_t type, std::string* out) noexcept;

// Appends a byte count with a binary unit suffix ("512 B", "1.5 KiB").
void
append_byte_size(uint64_t bytes, std::string* out) noexcept;

}  // namespace bpkit
