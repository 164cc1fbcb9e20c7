#include "bpkit/blueprint_extract.h"
#include "bpkit/build_info.h"
#include "bpkit/console_format.h"
#include "bpkit/file_io.h"
#include "bpkit/png_inspect.h"
#include "bpkit/resource_policy.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace bpkit {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <file> [file...]\n"
            "       %s [options] --combine <image.png> <data.png> -o <out>\n"
            "\n"
            "Lists PNG chunks, reports blueprint payload statistics and splits\n"
            "or recombines blueprint files.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print bpkit build info\n"
            "  --no-build-info        Hide build info header\n"
            "  --no-chunks            Do not list chunks\n"
            "  --extract              Write <name>.data.<ext> and <name>.preview.png\n"
            "  --combine              Recombine an image file and a data file\n"
            "  --brand <badge.png>    Embed a branding badge (writes <name>.branded.<ext>)\n"
            "  --inspect              Print IHDR fields and structure warnings\n"
            "  --verify-pixels        Inflate IDAT and check its size (implies --inspect)\n"
            "  -o, --out <path>       Output path (--combine, or a single --brand input)\n"
            "  --out-dir <dir>        Output directory (default: alongside input)\n"
            "  --force                Overwrite existing files\n"
            "  --no-crc               Do not verify chunk CRCs (diagnostics only)\n"
            "  --no-trailer           Ignore blueprint data appended after IEND\n"
            "  --max-file-bytes N     Input size cap in bytes (default: 20971520, 0=unlimited)\n"
            "  --max-chunks N         Max chunks per file (default: 65536)\n"
            "  --max-payload-bytes N  Max aggregate payload bytes (default: 67108864)\n"
            "  --max-inflate-bytes N  Max decompressed pixel bytes (default: 536870912)\n",
            argv0 ? argv0 : "bpread", argv0 ? argv0 : "bpread");
    }


    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end       = nullptr;
        unsigned long v = std::strtoul(s, &end, 10);
        if (!end || *end != '\0' || v > 0xFFFFFFFFUL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }


    static const char* file_status_name(FileStatus status) noexcept
    {
        switch (status) {
        case FileStatus::Ok: return "ok";
        case FileStatus::OpenFailed: return "open_failed";
        case FileStatus::StatFailed: return "stat_failed";
        case FileStatus::TooLarge: return "too_large";
        case FileStatus::ReadFailed: return "read_failed";
        case FileStatus::WriteFailed: return "write_failed";
        }
        return "unknown";
    }


    static const char* scan_status_name(ScanStatus status) noexcept
    {
        switch (status) {
        case ScanStatus::Ok: return "ok";
        case ScanStatus::OutputTruncated: return "output_truncated";
        case ScanStatus::Malformed: return "malformed";
        case ScanStatus::CorruptChunk: return "corrupt_chunk";
        case ScanStatus::Truncated: return "truncated";
        case ScanStatus::LimitExceeded: return "limit_exceeded";
        }
        return "unknown";
    }


    static const char* extract_status_name(ExtractStatus status) noexcept
    {
        switch (status) {
        case ExtractStatus::Ok: return "ok";
        case ExtractStatus::NotBlueprint: return "not_blueprint";
        case ExtractStatus::Malformed: return "malformed";
        case ExtractStatus::CorruptChunk: return "corrupt_chunk";
        case ExtractStatus::Truncated: return "truncated";
        case ExtractStatus::LimitExceeded: return "limit_exceeded";
        }
        return "unknown";
    }


    static const char* combine_status_name(CombineStatus status) noexcept
    {
        switch (status) {
        case CombineStatus::Ok: return "ok";
        case CombineStatus::ImageMalformed: return "image_malformed";
        case CombineStatus::DataMalformed: return "data_malformed";
        case CombineStatus::NotBlueprint: return "not_blueprint";
        case CombineStatus::ImageHasPayload: return "image_has_payload";
        case CombineStatus::LimitExceeded: return "limit_exceeded";
        }
        return "unknown";
    }


    static const char* branding_status_name(BrandingStatus status) noexcept
    {
        switch (status) {
        case BrandingStatus::Ok: return "ok";
        case BrandingStatus::Malformed: return "malformed";
        case BrandingStatus::BadgeMalformed: return "badge_malformed";
        case BrandingStatus::NotFound: return "not_found";
        }
        return "unknown";
    }


    static const char* inspect_status_name(InspectStatus status) noexcept
    {
        switch (status) {
        case InspectStatus::Ok: return "ok";
        case InspectStatus::Malformed: return "malformed";
        case InspectStatus::PixelDataInvalid: return "pixel_data_invalid";
        case InspectStatus::LimitExceeded: return "limit_exceeded";
        }
        return "unknown";
    }


    static const char* chunk_role_name(ChunkRole role) noexcept
    {
        switch (role) {
        case ChunkRole::Structural: return "structural";
        case ChunkRole::Payload: return "payload";
        case ChunkRole::Image: return "image";
        }
        return "unknown";
    }


    static const char* layout_name(PayloadLayout layout) noexcept
    {
        switch (layout) {
        case PayloadLayout::None: return "none";
        case PayloadLayout::Chunks: return "chunks";
        case PayloadLayout::Trailer: return "trailer";
        }
        return "unknown";
    }


    static std::string basename_only(const std::string& path)
    {
        const size_t sep = path.find_last_of("/\\");
        if (sep == std::string::npos) {
            return path;
        }
        return path.substr(sep + 1);
    }


    static std::string join_path(const std::string& dir,
                                 const std::string& name)
    {
        if (dir.empty()) {
            return name;
        }
        const char back = dir.back();
        if (back == '/' || back == '\\') {
            return dir + name;
        }
        return dir + "/" + name;
    }


    static std::string sanitize_filename(std::string s)
    {
        for (size_t i = 0; i < s.size(); ++i) {
            const unsigned char c = static_cast<unsigned char>(s[i]);
            const bool ok         = std::isalnum(c) != 0 || c == '.' || c == '_'
                            || c == '-';
            if (!ok) {
                s[i] = '_';
            }
        }
        if (s.empty()) {
            return "file";
        }
        return s;
    }


    /// `dir/stem.<tag><ext>`, where \p ext defaults to the input's extension.
    static std::string build_output_path(const std::string& input_path,
                                         const std::string& out_dir,
                                         std::string_view tag,
                                         std::string_view forced_ext)
    {
        std::string dir;
        std::string name = basename_only(input_path);
        if (out_dir.empty()) {
            dir = input_path.substr(0, input_path.size() - name.size());
        } else {
            dir  = out_dir;
            name = sanitize_filename(name);
        }

        std::string ext;
        const size_t dot = name.find_last_of('.');
        if (dot != std::string::npos && dot != 0) {
            ext = name.substr(dot);
            name.resize(dot);
        }
        if (!forced_ext.empty()) {
            ext.assign(forced_ext);
        }

        std::string out = name;
        out.push_back('.');
        out.append(tag);
        out.append(ext);
        return dir.empty() ? out : join_path(dir, out);
    }


    static bool write_output(const std::string& path,
                             std::span<const std::byte> bytes, bool force)
    {
        if (!force && file_exists(path.c_str())) {
            std::fprintf(stderr, "bpread: %s: exists (use --force)\n",
                         path.c_str());
            return false;
        }
        const FileStatus st = write_file_bytes(path.c_str(), bytes);
        if (st != FileStatus::Ok) {
            std::fprintf(stderr, "bpread: %s: %s\n", path.c_str(),
                         file_status_name(st));
            return false;
        }
        return true;
    }


    static void print_warnings(InspectWarnings w)
    {
        struct Named final {
            InspectWarnings flag;
            const char* name;
        };
        static constexpr Named kNames[] = {
            { InspectWarnings::UnusualDimensions, "unusual_dimensions" },
            { InspectWarnings::UnknownCriticalChunk, "unknown_critical_chunk" },
            { InspectWarnings::MissingPixelData, "missing_pixel_data" },
            { InspectWarnings::MultiplePayloadLayouts,
              "multiple_payload_layouts" },
            { InspectWarnings::BrandingPresent, "branding_present" },
            { InspectWarnings::MissingPalette, "missing_palette" },
        };

        std::printf("  warnings=");
        bool first = true;
        for (const Named& n : kNames) {
            if (!any(w, n.flag)) {
                continue;
            }
            std::printf("%s%s", first ? "" : ",", n.name);
            first = false;
        }
        std::printf("%s\n", first ? "none" : "");
    }


    static void print_chunks(const PngContainer& container)
    {
        for (size_t i = 0; i < container.chunks.size(); ++i) {
            const PngChunkRef& c = container.chunks[i];
            std::string type;
            append_chunk_type(c.type, &type);
            std::printf("  [%zu] %s off=%llu len=%u crc=%08X role=%s\n", i,
                        type.c_str(), static_cast<unsigned long long>(c.offset),
                        c.data_size, c.crc,
                        chunk_role_name(classify_chunk(c.type)));
        }
        if (container.trailer_size != 0U) {
            std::string head;
            append_hex_bytes(container.trailer(), 17U, &head);
            std::printf("  trailer off=%llu size=%llu head=%s\n",
                        static_cast<unsigned long long>(
                            container.trailer_offset),
                        static_cast<unsigned long long>(container.trailer_size),
                        head.c_str());
        }
    }


    static bool print_inspection(const PngContainer& container,
                                 const InspectOptions& options)
    {
        PngInspection info;
        const InspectStatus st = inspect_png(container, &info, options);
        std::printf("  inspect=%s", inspect_status_name(st));
        if (st == InspectStatus::Malformed) {
            std::printf("\n");
            return false;
        }
        std::printf(" %ux%u depth=%u color=%u interlace=%u idat=%u/%llu\n",
                    info.width, info.height, info.bit_depth, info.color_type,
                    info.interlace, info.idat_chunks,
                    static_cast<unsigned long long>(info.idat_bytes));
        print_warnings(info.warnings);
        if (options.verify_pixels && info.idat_chunks != 0U) {
            std::printf("  pixels expected=%llu inflated=%llu\n",
                        static_cast<unsigned long long>(
                            info.expected_raw_bytes),
                        static_cast<unsigned long long>(info.inflated_bytes));
        }
        return st == InspectStatus::Ok;
    }


    static int run_combine(const std::string& image_path,
                           const std::string& data_path,
                           const std::string& out_path, bool force,
                           const BpkitResourcePolicy& policy,
                           const ExtractOptions& options)
    {
        std::vector<std::byte> image;
        std::vector<std::byte> data;
        FileStatus fst = read_file_bytes(image_path.c_str(),
                                         policy.max_file_bytes, &image);
        if (fst != FileStatus::Ok) {
            std::fprintf(stderr, "bpread: %s: %s\n", image_path.c_str(),
                         file_status_name(fst));
            return 1;
        }
        fst = read_file_bytes(data_path.c_str(), policy.max_file_bytes, &data);
        if (fst != FileStatus::Ok) {
            std::fprintf(stderr, "bpread: %s: %s\n", data_path.c_str(),
                         file_status_name(fst));
            return 1;
        }

        std::vector<std::byte> combined;
        const CombineStatus st = combine_blueprint(image, data, &combined,
                                                   options);
        if (st != CombineStatus::Ok) {
            std::fprintf(stderr, "bpread: combine=%s\n",
                         combine_status_name(st));
            return 1;
        }
        if (!write_output(out_path, combined, force)) {
            return 1;
        }
        std::printf("combined %s + %s -> %s (%llu bytes)\n",
                    image_path.c_str(), data_path.c_str(), out_path.c_str(),
                    static_cast<unsigned long long>(combined.size()));
        return 0;
    }

}  // namespace
}  // namespace bpkit


int
main(int argc, char** argv)
{
    using namespace bpkit;

    bool show_build_info = true;
    bool show_chunks     = true;
    bool extract         = false;
    bool combine         = false;
    bool inspect         = false;
    bool verify_pixels   = false;
    bool force           = false;
    bool verify_crc      = true;
    bool accept_trailer  = true;
    std::string brand_path;
    std::string out_path;
    std::string out_dir;
    BpkitResourcePolicy policy;

    int first_path = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            show_build_info = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--no-chunks") == 0) {
            show_chunks = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--extract") == 0) {
            extract = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--combine") == 0) {
            combine = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--inspect") == 0) {
            inspect = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--verify-pixels") == 0) {
            inspect       = true;
            verify_pixels = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--force") == 0) {
            force = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--no-crc") == 0) {
            verify_crc = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--no-trailer") == 0) {
            accept_trailer = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--brand") == 0 && i + 1 < argc) {
            brand_path = argv[i + 1];
            i += 1;
            first_path += 2;
            continue;
        }
        if ((std::strcmp(arg, "-o") == 0 || std::strcmp(arg, "--out") == 0)
            && i + 1 < argc) {
            out_path = argv[i + 1];
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--out-dir") == 0 && i + 1 < argc) {
            out_dir = argv[i + 1];
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1], &policy.max_file_bytes)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-chunks") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1], &policy.scan_limits.max_chunks)
                || policy.scan_limits.max_chunks == 0U) {
                std::fprintf(stderr, "invalid --max-chunks value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-payload-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1], &policy.max_payload_bytes)) {
                std::fprintf(stderr, "invalid --max-payload-bytes value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-inflate-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1], &policy.max_inflate_bytes)) {
                std::fprintf(stderr, "invalid --max-inflate-bytes value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        break;
    }

    std::vector<std::string> input_paths;
    for (int i = first_path; i < argc; ++i) {
        if (argv[i] && argv[i][0] != '\0') {
            input_paths.emplace_back(argv[i]);
        }
    }
    if (input_paths.empty()) {
        usage(argv[0]);
        return 2;
    }

    ExtractOptions extract_options;
    apply_resource_policy(policy, &extract_options);
    extract_options.scan.verify_crc       = verify_crc;
    extract_options.locate.accept_trailer = accept_trailer;
    extract_options.build_image           = extract;

    InspectOptions inspect_options;
    apply_resource_policy(policy, nullptr, &inspect_options);
    inspect_options.verify_pixels = verify_pixels;

    if (combine) {
        if (input_paths.size() != 2U || out_path.empty()) {
            std::fprintf(stderr,
                         "bpread: --combine needs <image> <data> and --out\n");
            return 2;
        }
        if (show_build_info) {
            print_build_info_header();
        }
        return run_combine(input_paths[0], input_paths[1], out_path, force,
                           policy, extract_options);
    }

    if (!out_path.empty() && (brand_path.empty() || input_paths.size() != 1U)) {
        std::fprintf(stderr,
                     "bpread: --out requires --brand and exactly one input\n");
        return 2;
    }

    std::vector<std::byte> badge;
    if (!brand_path.empty()) {
        const FileStatus st = read_file_bytes(brand_path.c_str(),
                                              policy.max_file_bytes, &badge);
        if (st != FileStatus::Ok) {
            std::fprintf(stderr, "bpread: %s: %s\n", brand_path.c_str(),
                         file_status_name(st));
            return 1;
        }
    }

    if (show_build_info) {
        print_build_info_header();
    }

    bool any_failed = false;
    for (const std::string& path : input_paths) {
        std::vector<std::byte> bytes;
        const FileStatus fst = read_file_bytes(path.c_str(),
                                               policy.max_file_bytes, &bytes);
        if (fst != FileStatus::Ok) {
            std::fprintf(stderr, "bpread: %s: %s\n", path.c_str(),
                         file_status_name(fst));
            any_failed = true;
            continue;
        }

        PngContainer container;
        const ScanResult scan = scan_png_container(bytes, &container,
                                                   extract_options.scan);
        std::printf("== %s\n", path.c_str());
        if (scan.status != ScanStatus::Ok) {
            std::printf("  scan=%s offset=%llu\n",
                        scan_status_name(scan.status),
                        static_cast<unsigned long long>(scan.error_offset));
            any_failed = true;
            continue;
        }
        std::printf("  scan=ok chunks=%zu size=%zu\n", container.chunks.size(),
                    bytes.size());
        if (show_chunks) {
            print_chunks(container);
        }
        if (inspect && !print_inspection(container, inspect_options)) {
            any_failed = true;
        }

        const ExtractionResult res = extract_blueprint(container,
                                                       extract_options);
        if (res.status == ExtractStatus::NotBlueprint) {
            std::printf("  blueprint=none\n");
        } else if (res.status != ExtractStatus::Ok) {
            std::printf("  blueprint=%s\n", extract_status_name(res.status));
            any_failed = true;
            continue;
        } else {
            std::string payload_size;
            std::string stripped_size;
            append_byte_size(res.payload_size, &payload_size);
            append_byte_size(res.stripped_size, &stripped_size);
            std::printf("  blueprint=%s payload=%s data_only=%s saved=%.1f%%\n",
                        layout_name(res.layout), payload_size.c_str(),
                        stripped_size.c_str(), res.compression_ratio);
        }

        if (extract && res.status == ExtractStatus::Ok) {
            const std::string data_out = build_output_path(path, out_dir,
                                                           "data", "");
            if (write_output(data_out, res.stripped, force)) {
                std::printf("  wrote %s\n", data_out.c_str());
            } else {
                any_failed = true;
            }
            if (res.has_image) {
                const std::string image_out
                    = build_output_path(path, out_dir, "preview", ".png");
                if (write_output(image_out, res.image, force)) {
                    std::printf("  wrote %s\n", image_out.c_str());
                } else {
                    any_failed = true;
                }
            }
        }

        if (!badge.empty()) {
            std::vector<std::byte> branded;
            const BrandingStatus bst = embed_branding(bytes, badge, &branded,
                                                      extract_options.scan);
            if (bst != BrandingStatus::Ok) {
                std::printf("  brand=%s\n", branding_status_name(bst));
                any_failed = true;
                continue;
            }
            const std::string branded_out
                = out_path.empty()
                      ? build_output_path(path, out_dir, "branded", "")
                      : out_path;
            if (write_output(branded_out, branded, force)) {
                std::printf("  wrote %s\n", branded_out.c_str());
            } else {
                any_failed = true;
            }
        }
    }

    return any_failed ? 1 : 0;
}
