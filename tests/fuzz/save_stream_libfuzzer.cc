#include "bpkit/save_stream.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

namespace bpkit {

[[noreturn]] static void
fuzz_trap() noexcept
{
#if defined(__clang__) || defined(__GNUC__)
    __builtin_trap();
#else
    std::abort();
#endif
}

}  // namespace bpkit

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace bpkit;

    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data),
                                           size);

    // First byte picks the read size so line splitting is exercised too.
    const size_t chunk = (size == 0U) ? 1U
                                      : static_cast<size_t>(data[0] % 31U) + 1U;
    MemoryByteSource source(bytes, chunk);

    SaveStreamOptions options;
    options.stream.limits.max_line_bytes         = 1U << 16;
    options.save_data.compact.limits.max_depth   = 32;
    options.save_data.compact.limits.max_records = 1U << 16;

    Json doc;
    const SaveStreamResult res = read_save_stream(source, options,
                                                  ProgressFn {}, &doc);
    if (!source.closed()) {
        fuzz_trap();
    }
    if (res.status == SaveStreamStatus::Ok && !doc.is_object()) {
        fuzz_trap();
    }
    if (res.status != SaveStreamStatus::Ok && !doc.is_null()) {
        fuzz_trap();
    }
    if (res.last_progress > 100) {
        fuzz_trap();
    }
    return 0;
}
