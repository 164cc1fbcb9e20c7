#include "bpkit/console_format.h"

#include <cstdio>

namespace bpkit {
namespace {

    constexpr char kHexDigits[] = "0123456789ABCDEF";


    static void push_hex(uint8_t v, std::string* out)
    {
        out->push_back(kHexDigits[v >> 4]);
        out->push_back(kHexDigits[v & 0x0FU]);
    }


    static size_t clamp_count(size_t size, uint32_t max_bytes) noexcept
    {
        return (max_bytes != 0U && size > max_bytes) ? max_bytes : size;
    }


    // Returns true when c is a control or non-ASCII byte.
    static bool push_escaped(uint8_t c, std::string* out)
    {
        switch (c) {
        case '\\':
        case '"':
            out->push_back('\\');
            out->push_back(static_cast<char>(c));
            return false;
        case '\n': out->append("\\n"); return true;
        case '\r': out->append("\\r"); return true;
        case '\t': out->append("\\t"); return true;
        default: break;
        }
        if (c >= 0x20U && c < 0x7FU) {
            out->push_back(static_cast<char>(c));
            return false;
        }
        out->append("\\x");
        push_hex(c, out);
        return true;
    }

}  // namespace

bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept
{
    const size_t n = clamp_count(s.size(), max_bytes);
    out->reserve(out->size() + n);

    bool changed = false;
    for (size_t i = 0; i < n; ++i) {
        changed |= push_escaped(static_cast<uint8_t>(s[i]), out);
    }
    if (n != s.size()) {
        out->append("...");
        changed = true;
    }
    return changed;
}


void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept
{
    const std::span<const std::byte> shown
        = bytes.first(clamp_count(bytes.size(), max_bytes));
    out->reserve(out->size() + shown.size() * 2U);
    for (std::byte b : shown) {
        push_hex(static_cast<uint8_t>(b), out);
    }
    if (shown.size() != bytes.size()) {
        out->append("...");
    }
}


void
append_chunk_type(uint32_t type, std::string* out) noexcept
{
    for (int shift = 24; shift >= 0; shift -= 8) {
        (void)push_escaped(static_cast<uint8_t>(type >> shift), out);
    }
}


void
append_byte_size(uint64_t bytes, std::string* out) noexcept
{
    static constexpr const char* kUnits[] = { "KiB", "MiB", "GiB", "TiB" };

    char buf[32];
    if (bytes < 1024U) {
        std::snprintf(buf, sizeof(buf), "%llu B",
                      static_cast<unsigned long long>(bytes));
        out->append(buf);
        return;
    }
    double v     = static_cast<double>(bytes) / 1024.0;
    uint32_t idx = 0;
    while (v >= 1024.0 && idx + 1U < 4U) {
        v /= 1024.0;
        idx += 1;
    }
    std::snprintf(buf, sizeof(buf), "%.1f %s", v, kUnits[idx]);
    out->append(buf);
}

}  // namespace bpkit
