// =============================================================================
// vq-tiers - Compressed Stream Support
// =============================================================================
// Transparent decompression of VCF and tranches inputs.
//
// This module provides:
// - Format detection from magic bytes, with extension fallback
// - GzipStreamBuf: zlib decompression, multi-member aware (BGZF files are
//   a series of gzip members)
// - Bzip2StreamBuf / XzStreamBuf: libbz2 and liblzma decompression
// - CompressedInputStream: std::istream over any of the above
//
// Usage:
//   auto stream = openInputFile("calls.vcf.gz");
//   std::string line;
//   while (std::getline(*stream, line)) { ... }
// =============================================================================

#ifndef VQT_IO_COMPRESSED_STREAM_H
#define VQT_IO_COMPRESSED_STREAM_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <span>
#include <streambuf>
#include <string>
#include <string_view>
#include <vector>

#include "vqt/common/error.h"

namespace vqt::io {

// =============================================================================
// Compression Format Detection
// =============================================================================

/// @brief Supported compression formats.
enum class CompressionFormat : std::uint8_t {
    kNone = 0,   ///< Uncompressed (plain text)
    kGzip = 1,   ///< gzip or BGZF (.gz, .bgz)
    kBzip2 = 2,  ///< bzip2 (.bz2)
    kXz = 3,     ///< xz/lzma (.xz)
    kUnknown = 255
};

/// @brief Detect compression format from leading magic bytes.
[[nodiscard]] CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data);

/// @brief Detect compression format from file extension.
[[nodiscard]] CompressionFormat detectCompressionFormatFromExtension(
    const std::filesystem::path& path);

/// @brief Get human-readable name for compression format (e.g. "gzip").
[[nodiscard]] std::string_view compressionFormatName(CompressionFormat format);

/// @brief Default size of the compressed and decompressed buffers.
inline constexpr std::size_t kDefaultStreamBufferSize = 64 * 1024;

// =============================================================================
// GzipStreamBuf
// =============================================================================

/// @brief Stream buffer for gzip decompression.
/// @note Concatenated members are decoded back to back.
class GzipStreamBuf : public std::streambuf {
public:
    explicit GzipStreamBuf(std::istream& source,
                           std::size_t bufferSize = kDefaultStreamBufferSize);
    ~GzipStreamBuf() override;

    GzipStreamBuf(const GzipStreamBuf&) = delete;
    GzipStreamBuf& operator=(const GzipStreamBuf&) = delete;

    /// @brief Number of gzip members fully decoded so far.
    [[nodiscard]] std::size_t membersDecoded() const noexcept { return members_; }

protected:
    int_type underflow() override;

private:
    void initZlib();
    void cleanupZlib();

    /// @brief Refill the compressed buffer; returns false at end of source.
    bool refill();

    /// @brief Decompress more data into the output buffer.
    std::size_t decompress();

    std::istream* source_ = nullptr;
    std::vector<std::uint8_t> inputBuffer_;
    std::vector<char> outputBuffer_;

    /// @brief zlib stream state (opaque pointer).
    void* zlibStream_ = nullptr;

    bool streamEnd_ = false;
    std::size_t members_ = 0;
};

// =============================================================================
// Bzip2StreamBuf
// =============================================================================

/// @brief Stream buffer for bzip2 decompression.
/// @note Concatenated bzip2 streams are decoded back to back.
class Bzip2StreamBuf : public std::streambuf {
public:
    explicit Bzip2StreamBuf(std::istream& source,
                            std::size_t bufferSize = kDefaultStreamBufferSize);
    ~Bzip2StreamBuf() override;

    Bzip2StreamBuf(const Bzip2StreamBuf&) = delete;
    Bzip2StreamBuf& operator=(const Bzip2StreamBuf&) = delete;

protected:
    int_type underflow() override;

private:
    void initBzip2();
    void cleanupBzip2();
    bool refill();
    std::size_t decompress();

    std::istream* source_ = nullptr;
    std::vector<char> inputBuffer_;
    std::vector<char> outputBuffer_;

    /// @brief bzip2 stream state (opaque pointer).
    void* bzStream_ = nullptr;

    bool streamEnd_ = false;
};

// =============================================================================
// XzStreamBuf
// =============================================================================

/// @brief Stream buffer for xz/lzma decompression.
class XzStreamBuf : public std::streambuf {
public:
    explicit XzStreamBuf(std::istream& source,
                         std::size_t bufferSize = kDefaultStreamBufferSize);
    ~XzStreamBuf() override;

    XzStreamBuf(const XzStreamBuf&) = delete;
    XzStreamBuf& operator=(const XzStreamBuf&) = delete;

protected:
    int_type underflow() override;

private:
    void initLzma();
    void cleanupLzma();
    std::size_t decompress();

    std::istream* source_ = nullptr;
    std::vector<std::uint8_t> inputBuffer_;
    std::vector<char> outputBuffer_;

    /// @brief lzma stream state (opaque pointer).
    void* lzmaStream_ = nullptr;

    bool streamEnd_ = false;
};

// =============================================================================
// CompressedInputStream
// =============================================================================

/// @brief Input stream with transparent decompression.
class CompressedInputStream : public std::istream {
public:
    /// @brief Open a file, detecting its compression.
    /// @throws IOError if the file cannot be opened.
    explicit CompressedInputStream(const std::filesystem::path& path);

    /// @brief Wrap an existing stream.
    /// @param format Compression format (auto-detect if kUnknown).
    explicit CompressedInputStream(std::unique_ptr<std::istream> source,
                                   CompressionFormat format = CompressionFormat::kUnknown);

    ~CompressedInputStream() override;

    CompressedInputStream(const CompressedInputStream&) = delete;
    CompressedInputStream& operator=(const CompressedInputStream&) = delete;

    [[nodiscard]] CompressionFormat format() const noexcept { return format_; }

    [[nodiscard]] bool isCompressed() const noexcept { return format_ != CompressionFormat::kNone; }

private:
    void setup();

    std::unique_ptr<std::ifstream> fileStream_;
    std::unique_ptr<std::istream> sourceStream_;
    std::unique_ptr<std::streambuf> decompressBuf_;
    CompressionFormat format_ = CompressionFormat::kUnknown;
};

// =============================================================================
// Factory Functions
// =============================================================================

/// @brief Open a file or stdin ("-") with automatic decompression.
/// @throws IOError if the file cannot be opened.
[[nodiscard]] std::unique_ptr<std::istream> openInputFile(const std::filesystem::path& path);

}  // namespace vqt::io

#endif  // VQT_IO_COMPRESSED_STREAM_H
