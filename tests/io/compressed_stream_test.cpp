// =============================================================================
// vq-tiers - Compressed Stream Tests
// =============================================================================
// Unit tests for format detection and transparent decompression of inputs.
// =============================================================================

#include "vqt/io/compressed_stream.h"

#include <gtest/gtest.h>

#include <bzlib.h>
#include <lzma.h>
#include <zlib.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace vqt::io::test {
namespace {

// =============================================================================
// Test Utilities
// =============================================================================

/// @brief Generate a temporary file path for testing.
[[nodiscard]] std::filesystem::path tempFilePath(const std::string& suffix) {
    static std::atomic<int> counter{0};
    return std::filesystem::temp_directory_path() /
           ("vqt_stream_test_" + std::to_string(counter++) + "_" +
            std::to_string(std::random_device{}()) + suffix);
}

/// @brief RAII cleanup for temporary files.
class TempFileGuard {
public:
    explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

void writeFile(const std::filesystem::path& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

/// @brief One gzip member holding @p text.
[[nodiscard]] std::string gzipCompress(const std::string& text) {
    z_stream stream{};
    // 15 + 16: zlib window with a gzip wrapper
    EXPECT_EQ(deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8,
                           Z_DEFAULT_STRATEGY),
              Z_OK);

    std::string out(deflateBound(&stream, static_cast<uLong>(text.size())) + 32, '\0');
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(text.data()));
    stream.avail_in = static_cast<uInt>(text.size());
    stream.next_out = reinterpret_cast<Bytef*>(out.data());
    stream.avail_out = static_cast<uInt>(out.size());

    EXPECT_EQ(deflate(&stream, Z_FINISH), Z_STREAM_END);
    out.resize(stream.total_out);
    deflateEnd(&stream);
    return out;
}

[[nodiscard]] std::string bzip2Compress(const std::string& text) {
    std::string out(text.size() + text.size() / 100 + 600, '\0');
    auto length = static_cast<unsigned int>(out.size());
    EXPECT_EQ(BZ2_bzBuffToBuffCompress(out.data(), &length, const_cast<char*>(text.data()),
                                       static_cast<unsigned int>(text.size()), 9, 0, 0),
              BZ_OK);
    out.resize(length);
    return out;
}

[[nodiscard]] std::string xzCompress(const std::string& text) {
    std::string out(lzma_stream_buffer_bound(text.size()), '\0');
    std::size_t position = 0;
    EXPECT_EQ(lzma_easy_buffer_encode(6, LZMA_CHECK_CRC64, nullptr,
                                      reinterpret_cast<const std::uint8_t*>(text.data()),
                                      text.size(), reinterpret_cast<std::uint8_t*>(out.data()),
                                      &position, out.size()),
              LZMA_OK);
    out.resize(position);
    return out;
}

[[nodiscard]] std::string readAll(std::istream& stream) {
    return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
}

[[nodiscard]] std::string sampleVcf() {
    std::string text = "##fileformat=VCFv4.2\n#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\n";
    for (int i = 1; i <= 2000; ++i) {
        text += "chr1\t" + std::to_string(i * 10) + "\t.\tA\tG\t50\tPASS\tDP=" +
                std::to_string(i) + "\n";
    }
    return text;
}

// =============================================================================
// Detection Tests
// =============================================================================

TEST(CompressionDetectionTest, MagicBytes) {
    const std::uint8_t gzip[] = {0x1f, 0x8b, 0x08, 0x00};
    const std::uint8_t bzip2[] = {'B', 'Z', 'h', '9'};
    const std::uint8_t xz[] = {0xfd, '7', 'z', 'X', 'Z', 0x00};
    const std::uint8_t text[] = {'#', '#', 'f', 'i'};

    EXPECT_EQ(detectCompressionFormat(gzip), CompressionFormat::kGzip);
    EXPECT_EQ(detectCompressionFormat(bzip2), CompressionFormat::kBzip2);
    EXPECT_EQ(detectCompressionFormat(xz), CompressionFormat::kXz);
    EXPECT_EQ(detectCompressionFormat(text), CompressionFormat::kNone);
}

TEST(CompressionDetectionTest, Extensions) {
    EXPECT_EQ(detectCompressionFormatFromExtension("calls.vcf.gz"), CompressionFormat::kGzip);
    EXPECT_EQ(detectCompressionFormatFromExtension("calls.vcf.bgz"), CompressionFormat::kGzip);
    EXPECT_EQ(detectCompressionFormatFromExtension("calls.vcf.bz2"), CompressionFormat::kBzip2);
    EXPECT_EQ(detectCompressionFormatFromExtension("calls.vcf.xz"), CompressionFormat::kXz);
    EXPECT_EQ(detectCompressionFormatFromExtension("calls.vcf"), CompressionFormat::kNone);
    EXPECT_EQ(compressionFormatName(CompressionFormat::kGzip), "gzip");
}

// =============================================================================
// Decompression Tests
// =============================================================================

TEST(CompressedInputStreamTest, PlainFilePassesThrough) {
    TempFileGuard guard(tempFilePath(".vcf"));
    writeFile(guard.path(), sampleVcf());

    auto stream = openInputFile(guard.path());
    EXPECT_EQ(readAll(*stream), sampleVcf());
}

TEST(CompressedInputStreamTest, GzipFile) {
    TempFileGuard guard(tempFilePath(".vcf.gz"));
    writeFile(guard.path(), gzipCompress(sampleVcf()));

    CompressedInputStream stream(guard.path());
    EXPECT_EQ(stream.format(), CompressionFormat::kGzip);
    EXPECT_TRUE(stream.isCompressed());
    EXPECT_EQ(readAll(stream), sampleVcf());
}

TEST(CompressedInputStreamTest, GzipMembersAreConcatenated) {
    std::string first = "##fileformat=VCFv4.2\n";
    std::string second = "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\n";

    auto bytes = std::make_unique<std::stringstream>(gzipCompress(first) + gzipCompress(second));
    CompressedInputStream stream(std::move(bytes));

    EXPECT_EQ(stream.format(), CompressionFormat::kGzip);
    EXPECT_EQ(readAll(stream), first + second);
}

TEST(CompressedInputStreamTest, Bzip2File) {
    TempFileGuard guard(tempFilePath(".vcf.bz2"));
    writeFile(guard.path(), bzip2Compress(sampleVcf()));

    auto stream = openInputFile(guard.path());
    EXPECT_EQ(readAll(*stream), sampleVcf());
}

TEST(CompressedInputStreamTest, XzFile) {
    TempFileGuard guard(tempFilePath(".vcf.xz"));
    writeFile(guard.path(), xzCompress(sampleVcf()));

    auto stream = openInputFile(guard.path());
    EXPECT_EQ(readAll(*stream), sampleVcf());
}

TEST(CompressedInputStreamTest, LineReadingAcrossBufferBoundaries) {
    auto bytes = std::make_unique<std::stringstream>(gzipCompress(sampleVcf()));
    CompressedInputStream stream(std::move(bytes));

    std::string line;
    int lines = 0;
    while (std::getline(stream, line)) {
        ++lines;
    }
    EXPECT_EQ(lines, 2002);
}

TEST(CompressedInputStreamTest, MissingFileIsIOError) {
    EXPECT_THROW((void)openInputFile("/nonexistent/vqt/calls.vcf"), IOError);
}

}  // namespace
}  // namespace vqt::io::test
