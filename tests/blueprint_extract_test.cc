#include "bpkit/blueprint_extract.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace bpkit {
namespace {

    static void append_bytes(std::vector<std::byte>* out, std::string_view s)
    {
        for (char c : s) {
            out->push_back(std::byte { static_cast<uint8_t>(c) });
        }
    }


    static std::vector<std::byte> bytes_of(std::string_view s)
    {
        std::vector<std::byte> out;
        append_bytes(&out, s);
        return out;
    }


    static std::vector<std::byte> pattern_bytes(size_t size, uint32_t seed)
    {
        std::vector<std::byte> out(size);
        uint32_t x = seed;
        for (size_t i = 0; i < size; ++i) {
            x      = x * 1664525U + 1013904223U;
            out[i] = std::byte { static_cast<uint8_t>(x >> 24) };
        }
        return out;
    }


    static std::vector<std::byte> make_ihdr()
    {
        std::vector<std::byte> ihdr(13U, std::byte { 0 });
        ihdr[2] = std::byte { 0x04 };  // width 1024
        ihdr[6] = std::byte { 0x04 };  // height 1024
        ihdr[8] = std::byte { 8 };
        ihdr[9] = std::byte { 6 };
        return ihdr;
    }


    static std::vector<uint32_t> chunk_types(std::span<const std::byte> png)
    {
        std::vector<uint32_t> types;
        PngContainer c;
        if (scan_png_container(png, &c).status != ScanStatus::Ok) {
            return types;
        }
        for (const PngChunkRef& chunk : c.chunks) {
            types.push_back(chunk.type);
        }
        return types;
    }


    static std::vector<std::byte> payload_of(std::span<const std::byte> png)
    {
        std::vector<std::byte> payload;
        PngContainer c;
        if (scan_png_container(png, &c).status != ScanStatus::Ok) {
            return payload;
        }
        PayloadLocation loc;
        if (locate_payload(c, &loc) != LocateStatus::Ok) {
            return payload;
        }
        (void)gather_payload(c, loc, &payload);
        return payload;
    }


    // IHDR, tEXt, PLTE, IDAT, afBP, IDAT, tRNS, IEND.
    static std::vector<std::byte> make_mixed_blueprint()
    {
        std::vector<std::byte> png;
        append_png_signature(&png);
        append_png_chunk(&png, kChunkIhdr, make_ihdr());
        append_png_chunk(&png, fourcc('t', 'E', 'X', 't'),
                         bytes_of("Title"));
        append_png_chunk(&png, kChunkPlte, pattern_bytes(12U, 1U));
        append_png_chunk(&png, kChunkIdat, pattern_bytes(3000U, 2U));
        append_png_chunk(&png, kChunkBlueprint, bytes_of("blueprint payload"));
        append_png_chunk(&png, kChunkIdat, pattern_bytes(500U, 3U));
        append_png_chunk(&png, kChunkTrns, pattern_bytes(4U, 4U));
        append_png_chunk(&png, kChunkIend, {});
        return png;
    }


    TEST(BlueprintExtract, StripsPixelDataFromLargeContainer)
    {
        const std::vector<std::byte> payload = pattern_bytes(20U * 1024U, 7U);

        std::vector<std::byte> png;
        append_png_signature(&png);
        append_png_chunk(&png, kChunkIhdr, make_ihdr());
        append_png_chunk(&png, kChunkIdat, pattern_bytes(4U << 20, 8U));
        append_png_chunk(&png, kChunkIdat, pattern_bytes(1U << 20, 9U));
        append_png_chunk(&png, kChunkBlueprint, payload);
        append_png_chunk(&png, kChunkIend, {});
        ASSERT_GT(png.size(), 5U * 1000U * 1000U);

        const ExtractionResult res = extract_blueprint(png);
        ASSERT_EQ(res.status, ExtractStatus::Ok);
        EXPECT_EQ(res.layout, PayloadLayout::Chunks);
        EXPECT_EQ(res.original_size, png.size());
        EXPECT_EQ(res.payload_size, payload.size());
        EXPECT_EQ(res.stripped_size, res.stripped.size());
        EXPECT_LT(res.stripped_size, 100U * 1024U);
        EXPECT_GT(res.stripped_size, payload.size());
        EXPECT_GT(res.compression_ratio, 95.0);
        EXPECT_LE(res.compression_ratio, 100.0);

        EXPECT_EQ(payload_of(res.stripped), payload);
        EXPECT_TRUE(res.has_image);
        EXPECT_EQ(res.image.size(), png.size() - payload.size() - 12U);
    }


    TEST(BlueprintExtract, KeepsChunkOrderInBothOutputs)
    {
        const std::vector<std::byte> png = make_mixed_blueprint();

        const ExtractionResult res = extract_blueprint(png);
        ASSERT_EQ(res.status, ExtractStatus::Ok);

        const std::vector<uint32_t> stripped = chunk_types(res.stripped);
        const std::vector<uint32_t> want_stripped = {
            kChunkIhdr, fourcc('t', 'E', 'X', 't'), kChunkBlueprint,
            kChunkIend
        };
        EXPECT_EQ(stripped, want_stripped);

        ASSERT_TRUE(res.has_image);
        const std::vector<uint32_t> image      = chunk_types(res.image);
        const std::vector<uint32_t> want_image = {
            kChunkIhdr, fourcc('t', 'E', 'X', 't'),
            kChunkPlte, kChunkIdat,
            kChunkIdat, kChunkTrns,
            kChunkIend,
        };
        EXPECT_EQ(image, want_image);

        PngContainer c;
        ASSERT_EQ(scan_png_container(res.image, &c).status, ScanStatus::Ok);
        PayloadLocation loc;
        EXPECT_EQ(locate_payload(c, &loc), LocateStatus::NotBlueprint);
    }


    TEST(BlueprintExtract, RoundTripKeepsPayloadAndStrippedIsFixedPoint)
    {
        const std::vector<std::byte> png = make_mixed_blueprint();

        const ExtractionResult first = extract_blueprint(png);
        ASSERT_EQ(first.status, ExtractStatus::Ok);
        EXPECT_EQ(payload_of(first.stripped), bytes_of("blueprint payload"));
        EXPECT_TRUE(first.has_image);

        const ExtractionResult second = extract_blueprint(first.stripped);
        ASSERT_EQ(second.status, ExtractStatus::Ok);
        EXPECT_EQ(second.stripped, first.stripped);
        EXPECT_FALSE(second.has_image);
        EXPECT_TRUE(second.image.empty());
        EXPECT_EQ(second.compression_ratio, 0.0);
    }


    TEST(BlueprintExtract, OutputIsDeterministic)
    {
        const std::vector<std::byte> png = make_mixed_blueprint();

        const ExtractionResult a = extract_blueprint(png);
        const ExtractionResult b = extract_blueprint(png);
        ASSERT_EQ(a.status, ExtractStatus::Ok);
        EXPECT_EQ(a.stripped, b.stripped);
        EXPECT_EQ(a.image, b.image);
        EXPECT_EQ(a.compression_ratio, b.compression_ratio);
    }


    TEST(BlueprintExtract, StrippedNeverExceedsOriginal)
    {
        // Many tiny payload chunks collapse into one.
        std::vector<std::byte> small;
        append_png_signature(&small);
        append_png_chunk(&small, kChunkIhdr, make_ihdr());
        for (uint32_t i = 0; i < 50; ++i) {
            append_png_chunk(&small, kChunkBlueprint, pattern_bytes(100U, i));
        }
        append_png_chunk(&small, kChunkIend, {});

        ExtractionResult res = extract_blueprint(small);
        ASSERT_EQ(res.status, ExtractStatus::Ok);
        EXPECT_LE(res.stripped_size, res.original_size);
        EXPECT_EQ(chunk_types(res.stripped).size(), 3U);
        EXPECT_EQ(res.payload_size, 5000U);

        // A payload chunk larger than the default split is not re-split.
        std::vector<std::byte> large;
        append_png_signature(&large);
        append_png_chunk(&large, kChunkIhdr, make_ihdr());
        append_png_chunk(&large, kChunkBlueprint,
                         pattern_bytes(kMaxPayloadChunkBytes + 4096U, 5U));
        append_png_chunk(&large, kChunkIend, {});

        res = extract_blueprint(large);
        ASSERT_EQ(res.status, ExtractStatus::Ok);
        EXPECT_EQ(res.stripped_size, res.original_size);
        EXPECT_EQ(res.stripped, large);
    }


    TEST(BlueprintExtract, LargePayloadIsSplitAtDefaultSize)
    {
        std::vector<std::byte> png;
        append_png_signature(&png);
        append_png_chunk(&png, kChunkIhdr, make_ihdr());
        const std::vector<std::byte> half
            = pattern_bytes(kMaxPayloadChunkBytes, 11U);
        append_png_chunk(&png, kChunkBlueprint, half);
        append_png_chunk(&png, kChunkBlueprint, half);
        append_png_chunk(&png, kChunkBlueprint, bytes_of("tail"));
        append_png_chunk(&png, kChunkIend, {});

        const ExtractionResult res = extract_blueprint(png);
        ASSERT_EQ(res.status, ExtractStatus::Ok);
        EXPECT_EQ(res.stripped_size, res.original_size);
        EXPECT_EQ(chunk_types(res.stripped).size(), 5U);
    }


    TEST(BlueprintExtract, PlainImageIsNotBlueprint)
    {
        std::vector<std::byte> png;
        append_png_signature(&png);
        append_png_chunk(&png, kChunkIhdr, make_ihdr());
        append_png_chunk(&png, kChunkIdat, pattern_bytes(64U, 1U));
        append_png_chunk(&png, kChunkIend, {});

        const ExtractionResult res = extract_blueprint(png);
        EXPECT_EQ(res.status, ExtractStatus::NotBlueprint);
        EXPECT_TRUE(res.stripped.empty());
        EXPECT_TRUE(res.image.empty());
    }


    TEST(BlueprintExtract, MapsScanFailures)
    {
        std::vector<std::byte> png = make_mixed_blueprint();

        std::vector<std::byte> corrupt = png;
        PngContainer c;
        ASSERT_EQ(scan_png_container(png, &c).status, ScanStatus::Ok);
        const PngChunkRef payload_chunk = c.chunks[4];
        corrupt[payload_chunk.data_offset] ^= std::byte { 0x10 };

        ExtractionResult res = extract_blueprint(corrupt);
        EXPECT_EQ(res.status, ExtractStatus::CorruptChunk);
        EXPECT_EQ(res.error_offset, payload_chunk.offset);
        EXPECT_TRUE(res.stripped.empty());

        const std::vector<std::byte> cut(png.begin(), png.end() - 6);
        EXPECT_EQ(extract_blueprint(cut).status, ExtractStatus::Truncated);

        const std::vector<std::byte> text = bytes_of("not a png at all");
        EXPECT_EQ(extract_blueprint(text).status, ExtractStatus::Malformed);

        ExtractOptions options;
        options.locate.max_payload_bytes = 4;
        EXPECT_EQ(extract_blueprint(png, options).status,
                  ExtractStatus::LimitExceeded);
    }


    TEST(BlueprintExtract, TrailerLayoutKeepsTrailerInStrippedFile)
    {
        std::vector<std::byte> png;
        append_png_signature(&png);
        append_png_chunk(&png, kChunkIhdr, make_ihdr());
        append_png_chunk(&png, kChunkIdat, pattern_bytes(2048U, 3U));
        append_png_chunk(&png, kChunkIend, {});
        const size_t end = png.size();
        std::vector<std::byte> trailer(kBlueprintTrailerSignature.begin(),
                                       kBlueprintTrailerSignature.end());
        append_bytes(&trailer, "legacy blueprint body");
        png.insert(png.end(), trailer.begin(), trailer.end());

        const ExtractionResult res = extract_blueprint(png);
        ASSERT_EQ(res.status, ExtractStatus::Ok);
        EXPECT_EQ(res.layout, PayloadLayout::Trailer);
        EXPECT_EQ(res.payload_size, trailer.size());

        const std::vector<uint32_t> want = { kChunkIhdr, kChunkIend };
        EXPECT_EQ(chunk_types(res.stripped), want);
        EXPECT_EQ(payload_of(res.stripped), trailer);

        ASSERT_TRUE(res.has_image);
        EXPECT_EQ(res.image.size(), end);
    }


    TEST(BlueprintExtract, CompressionRatioIsClamped)
    {
        EXPECT_EQ(compression_ratio_percent(0U, 0U), 0.0);
        EXPECT_EQ(compression_ratio_percent(100U, 100U), 0.0);
        EXPECT_EQ(compression_ratio_percent(100U, 200U), 0.0);
        EXPECT_DOUBLE_EQ(compression_ratio_percent(200U, 50U), 75.0);
        EXPECT_DOUBLE_EQ(compression_ratio_percent(200U, 0U), 100.0);
    }


    TEST(BlueprintCombine, RestoresPayloadIntoImage)
    {
        const std::vector<std::byte> png = make_mixed_blueprint();
        const ExtractionResult res       = extract_blueprint(png);
        ASSERT_EQ(res.status, ExtractStatus::Ok);
        ASSERT_TRUE(res.has_image);

        std::vector<std::byte> combined;
        ASSERT_EQ(combine_blueprint(res.image, res.stripped, &combined),
                  CombineStatus::Ok);
        EXPECT_EQ(payload_of(combined), bytes_of("blueprint payload"));

        const std::vector<uint32_t> types = chunk_types(combined);
        ASSERT_GE(types.size(), 2U);
        EXPECT_EQ(types[types.size() - 2], kChunkBlueprint);
        EXPECT_EQ(types.back(), kChunkIend);

        const ExtractionResult again = extract_blueprint(combined);
        ASSERT_EQ(again.status, ExtractStatus::Ok);
        EXPECT_EQ(again.stripped, res.stripped);
        EXPECT_EQ(again.image, res.image);
    }


    TEST(BlueprintCombine, RestoresTrailerPayload)
    {
        std::vector<std::byte> png;
        append_png_signature(&png);
        append_png_chunk(&png, kChunkIhdr, make_ihdr());
        append_png_chunk(&png, kChunkIdat, pattern_bytes(256U, 3U));
        append_png_chunk(&png, kChunkIend, {});
        png.insert(png.end(), kBlueprintTrailerSignature.begin(),
                   kBlueprintTrailerSignature.end());
        append_bytes(&png, "body");

        const ExtractionResult res = extract_blueprint(png);
        ASSERT_EQ(res.status, ExtractStatus::Ok);

        std::vector<std::byte> combined;
        ASSERT_EQ(combine_blueprint(res.image, res.stripped, &combined),
                  CombineStatus::Ok);
        EXPECT_EQ(combined, png);
    }


    TEST(BlueprintCombine, RejectsBadInputs)
    {
        const std::vector<std::byte> png = make_mixed_blueprint();
        const ExtractionResult res       = extract_blueprint(png);
        ASSERT_EQ(res.status, ExtractStatus::Ok);

        std::vector<std::byte> out;
        EXPECT_EQ(combine_blueprint(png, res.stripped, &out),
                  CombineStatus::ImageHasPayload);
        EXPECT_TRUE(out.empty());
        EXPECT_EQ(combine_blueprint(res.image, res.image, &out),
                  CombineStatus::NotBlueprint);
        EXPECT_EQ(combine_blueprint(bytes_of("junk"), res.stripped, &out),
                  CombineStatus::ImageMalformed);
        EXPECT_EQ(combine_blueprint(res.image, bytes_of("junk"), &out),
                  CombineStatus::DataMalformed);
    }


    TEST(Branding, EmbedsAndReplacesBadge)
    {
        std::vector<std::byte> badge;
        append_png_signature(&badge);
        append_png_chunk(&badge, kChunkIhdr, make_ihdr());
        append_png_chunk(&badge, kChunkIend, {});

        const std::vector<std::byte> png = make_mixed_blueprint();
        std::vector<std::byte> branded;
        ASSERT_EQ(embed_branding(png, badge, &branded), BrandingStatus::Ok);

        PngContainer c;
        ASSERT_EQ(scan_png_container(branded, &c).status, ScanStatus::Ok);
        std::span<const std::byte> found;
        ASSERT_EQ(find_branding(c, &found), BrandingStatus::Ok);
        EXPECT_EQ(std::vector<std::byte>(found.begin(), found.end()), badge);
        EXPECT_EQ(payload_of(branded), bytes_of("blueprint payload"));

        // Branding is structural: it survives into the stripped file.
        const ExtractionResult res = extract_blueprint(branded);
        ASSERT_EQ(res.status, ExtractStatus::Ok);
        ASSERT_EQ(scan_png_container(res.stripped, &c).status, ScanStatus::Ok);
        EXPECT_EQ(find_branding(c, &found), BrandingStatus::Ok);

        std::vector<std::byte> rebranded;
        ASSERT_EQ(embed_branding(branded, badge, &rebranded),
                  BrandingStatus::Ok);
        EXPECT_EQ(rebranded, branded);

        uint32_t branding_chunks = 0;
        for (uint32_t type : chunk_types(rebranded)) {
            if (type == kChunkBranding) {
                branding_chunks += 1;
            }
        }
        EXPECT_EQ(branding_chunks, 1U);
    }


    TEST(Branding, ReportsFailures)
    {
        const std::vector<std::byte> png = make_mixed_blueprint();
        std::vector<std::byte> out;
        EXPECT_EQ(embed_branding(png, bytes_of("badge"), &out),
                  BrandingStatus::BadgeMalformed);
        EXPECT_EQ(embed_branding(bytes_of("junk"), png, &out),
                  BrandingStatus::Malformed);

        PngContainer c;
        ASSERT_EQ(scan_png_container(png, &c).status, ScanStatus::Ok);
        std::span<const std::byte> found;
        EXPECT_EQ(find_branding(c, &found), BrandingStatus::NotFound);
        EXPECT_TRUE(found.empty());
    }

}  // namespace
}  // namespace bpkit
