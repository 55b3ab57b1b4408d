// =============================================================================
// vq-tiers - Compressed Stream Implementation
// =============================================================================

#include "vqt/io/compressed_stream.h"

#include <bzlib.h>
#include <lzma.h>
#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iostream>
#include <sstream>

#include <fmt/format.h>

#include "vqt/common/logger.h"

namespace vqt::io {

// =============================================================================
// Magic Bytes for Format Detection
// =============================================================================

namespace {

// Gzip magic: 0x1f 0x8b
constexpr std::uint8_t kGzipMagic[] = {0x1f, 0x8b};

// Bzip2 magic: 'B' 'Z' 'h'
constexpr std::uint8_t kBzip2Magic[] = {0x42, 0x5a, 0x68};

// XZ magic: 0xfd '7' 'z' 'X' 'Z' 0x00
constexpr std::uint8_t kXzMagic[] = {0xfd, 0x37, 0x7a, 0x58, 0x5a, 0x00};

template <std::size_t N>
[[nodiscard]] bool startsWith(std::span<const std::uint8_t> data, const std::uint8_t (&magic)[N]) {
    return data.size() >= N && std::memcmp(data.data(), magic, N) == 0;
}

}  // namespace

// =============================================================================
// Format Detection
// =============================================================================

CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data) {
    if (startsWith(data, kGzipMagic)) {
        return CompressionFormat::kGzip;
    }
    if (startsWith(data, kBzip2Magic)) {
        return CompressionFormat::kBzip2;
    }
    if (startsWith(data, kXzMagic)) {
        return CompressionFormat::kXz;
    }
    return CompressionFormat::kNone;
}

CompressionFormat detectCompressionFormatFromExtension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".gz" || ext == ".bgz" || ext == ".gzip") {
        return CompressionFormat::kGzip;
    }
    if (ext == ".bz2" || ext == ".bzip2") {
        return CompressionFormat::kBzip2;
    }
    if (ext == ".xz" || ext == ".lzma") {
        return CompressionFormat::kXz;
    }
    return CompressionFormat::kNone;
}

std::string_view compressionFormatName(CompressionFormat format) {
    switch (format) {
        case CompressionFormat::kGzip:
            return "gzip";
        case CompressionFormat::kBzip2:
            return "bzip2";
        case CompressionFormat::kXz:
            return "xz";
        case CompressionFormat::kNone:
            return "none";
        case CompressionFormat::kUnknown:
        default:
            return "unknown";
    }
}

// =============================================================================
// GzipStreamBuf Implementation
// =============================================================================

GzipStreamBuf::GzipStreamBuf(std::istream& source, std::size_t bufferSize)
    : source_(&source), inputBuffer_(bufferSize), outputBuffer_(bufferSize) {
    initZlib();
}

GzipStreamBuf::~GzipStreamBuf() { cleanupZlib(); }

void GzipStreamBuf::initZlib() {
    auto* stream = new z_stream;
    std::memset(stream, 0, sizeof(z_stream));

    // 16 + MAX_WBITS selects the gzip wrapper
    int ret = inflateInit2(stream, 16 + MAX_WBITS);
    if (ret != Z_OK) {
        delete stream;
        throw IOError(fmt::format("Failed to initialize zlib: {}", zError(ret)));
    }
    zlibStream_ = stream;
}

void GzipStreamBuf::cleanupZlib() {
    if (zlibStream_ != nullptr) {
        auto* stream = static_cast<z_stream*>(zlibStream_);
        inflateEnd(stream);
        delete stream;
        zlibStream_ = nullptr;
    }
}

GzipStreamBuf::int_type GzipStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    if (streamEnd_) {
        return traits_type::eof();
    }

    std::size_t decompressed = decompress();
    if (decompressed == 0) {
        return traits_type::eof();
    }

    setg(outputBuffer_.data(), outputBuffer_.data(), outputBuffer_.data() + decompressed);
    return traits_type::to_int_type(*gptr());
}

bool GzipStreamBuf::refill() {
    auto* stream = static_cast<z_stream*>(zlibStream_);
    if (stream->avail_in > 0) {
        return true;
    }
    source_->read(reinterpret_cast<char*>(inputBuffer_.data()),
                  static_cast<std::streamsize>(inputBuffer_.size()));
    auto bytesRead = static_cast<std::size_t>(source_->gcount());
    if (bytesRead == 0) {
        return false;
    }
    stream->avail_in = static_cast<uInt>(bytesRead);
    stream->next_in = inputBuffer_.data();
    return true;
}

std::size_t GzipStreamBuf::decompress() {
    auto* stream = static_cast<z_stream*>(zlibStream_);
    stream->avail_out = static_cast<uInt>(outputBuffer_.size());
    stream->next_out = reinterpret_cast<Bytef*>(outputBuffer_.data());

    while (stream->avail_out == outputBuffer_.size() && !streamEnd_) {
        if (!refill()) {
            if (stream->total_in == 0) {
                // Clean end: nothing of a new member was consumed
                streamEnd_ = true;
                break;
            }
            throw IOError("Gzip decompression failed: unexpected end of compressed data");
        }

        int ret = inflate(stream, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            ++members_;
            if (!refill()) {
                streamEnd_ = true;
                break;
            }
            inflateReset(stream);
            continue;
        }
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            throw IOError(fmt::format("Gzip decompression failed: {}",
                                      stream->msg != nullptr ? stream->msg : zError(ret)));
        }
    }

    return outputBuffer_.size() - stream->avail_out;
}

// =============================================================================
// Bzip2StreamBuf Implementation
// =============================================================================

Bzip2StreamBuf::Bzip2StreamBuf(std::istream& source, std::size_t bufferSize)
    : source_(&source), inputBuffer_(bufferSize), outputBuffer_(bufferSize) {
    initBzip2();
}

Bzip2StreamBuf::~Bzip2StreamBuf() { cleanupBzip2(); }

void Bzip2StreamBuf::initBzip2() {
    auto* stream = new bz_stream;
    std::memset(stream, 0, sizeof(bz_stream));

    int ret = BZ2_bzDecompressInit(stream, 0, 0);
    if (ret != BZ_OK) {
        delete stream;
        throw IOError(fmt::format("Failed to initialize bzip2 (code {})", ret));
    }
    bzStream_ = stream;
}

void Bzip2StreamBuf::cleanupBzip2() {
    if (bzStream_ != nullptr) {
        auto* stream = static_cast<bz_stream*>(bzStream_);
        BZ2_bzDecompressEnd(stream);
        delete stream;
        bzStream_ = nullptr;
    }
}

Bzip2StreamBuf::int_type Bzip2StreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    if (streamEnd_) {
        return traits_type::eof();
    }

    std::size_t decompressed = decompress();
    if (decompressed == 0) {
        return traits_type::eof();
    }

    setg(outputBuffer_.data(), outputBuffer_.data(), outputBuffer_.data() + decompressed);
    return traits_type::to_int_type(*gptr());
}

bool Bzip2StreamBuf::refill() {
    auto* stream = static_cast<bz_stream*>(bzStream_);
    if (stream->avail_in > 0) {
        return true;
    }
    source_->read(inputBuffer_.data(), static_cast<std::streamsize>(inputBuffer_.size()));
    auto bytesRead = static_cast<std::size_t>(source_->gcount());
    if (bytesRead == 0) {
        return false;
    }
    stream->avail_in = static_cast<unsigned int>(bytesRead);
    stream->next_in = inputBuffer_.data();
    return true;
}

std::size_t Bzip2StreamBuf::decompress() {
    auto* stream = static_cast<bz_stream*>(bzStream_);
    stream->avail_out = static_cast<unsigned int>(outputBuffer_.size());
    stream->next_out = outputBuffer_.data();

    bool consumedAny = stream->total_in_lo32 != 0 || stream->total_in_hi32 != 0;
    while (stream->avail_out == outputBuffer_.size() && !streamEnd_) {
        if (!refill()) {
            if (!consumedAny) {
                streamEnd_ = true;
                break;
            }
            throw IOError("Bzip2 decompression failed: unexpected end of compressed data");
        }
        consumedAny = true;

        int ret = BZ2_bzDecompress(stream);
        if (ret == BZ_STREAM_END) {
            if (!refill()) {
                streamEnd_ = true;
                break;
            }
            // Concatenated stream: restart the decoder on the remaining input
            char* nextIn = stream->next_in;
            unsigned int availIn = stream->avail_in;
            char* nextOut = stream->next_out;
            unsigned int availOut = stream->avail_out;
            cleanupBzip2();
            initBzip2();
            stream = static_cast<bz_stream*>(bzStream_);
            stream->next_in = nextIn;
            stream->avail_in = availIn;
            stream->next_out = nextOut;
            stream->avail_out = availOut;
            consumedAny = false;
            continue;
        }
        if (ret != BZ_OK) {
            throw IOError(fmt::format("Bzip2 decompression failed (code {})", ret));
        }
    }

    return outputBuffer_.size() - stream->avail_out;
}

// =============================================================================
// XzStreamBuf Implementation
// =============================================================================

XzStreamBuf::XzStreamBuf(std::istream& source, std::size_t bufferSize)
    : source_(&source), inputBuffer_(bufferSize), outputBuffer_(bufferSize) {
    initLzma();
}

XzStreamBuf::~XzStreamBuf() { cleanupLzma(); }

void XzStreamBuf::initLzma() {
    auto* stream = new lzma_stream;
    *stream = LZMA_STREAM_INIT;

    lzma_ret ret = lzma_stream_decoder(stream, UINT64_MAX, LZMA_CONCATENATED);
    if (ret != LZMA_OK) {
        delete stream;
        throw IOError(fmt::format("Failed to initialize liblzma (code {})",
                                  static_cast<int>(ret)));
    }
    lzmaStream_ = stream;
}

void XzStreamBuf::cleanupLzma() {
    if (lzmaStream_ != nullptr) {
        auto* stream = static_cast<lzma_stream*>(lzmaStream_);
        lzma_end(stream);
        delete stream;
        lzmaStream_ = nullptr;
    }
}

XzStreamBuf::int_type XzStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    if (streamEnd_) {
        return traits_type::eof();
    }

    std::size_t decompressed = decompress();
    if (decompressed == 0) {
        return traits_type::eof();
    }

    setg(outputBuffer_.data(), outputBuffer_.data(), outputBuffer_.data() + decompressed);
    return traits_type::to_int_type(*gptr());
}

std::size_t XzStreamBuf::decompress() {
    auto* stream = static_cast<lzma_stream*>(lzmaStream_);
    stream->avail_out = outputBuffer_.size();
    stream->next_out = reinterpret_cast<std::uint8_t*>(outputBuffer_.data());

    while (stream->avail_out == outputBuffer_.size() && !streamEnd_) {
        if (stream->avail_in == 0 && !source_->eof()) {
            source_->read(reinterpret_cast<char*>(inputBuffer_.data()),
                          static_cast<std::streamsize>(inputBuffer_.size()));
            stream->avail_in = static_cast<std::size_t>(source_->gcount());
            stream->next_in = inputBuffer_.data();
        }

        // LZMA_CONCATENATED only reports the end once told the input is finished
        lzma_action action = (stream->avail_in == 0 && source_->eof()) ? LZMA_FINISH : LZMA_RUN;
        lzma_ret ret = lzma_code(stream, action);
        if (ret == LZMA_STREAM_END) {
            streamEnd_ = true;
            break;
        }
        if (ret != LZMA_OK) {
            throw IOError(fmt::format("XZ decompression failed (code {})", static_cast<int>(ret)));
        }
    }

    return outputBuffer_.size() - stream->avail_out;
}

// =============================================================================
// CompressedInputStream Implementation
// =============================================================================

CompressedInputStream::CompressedInputStream(const std::filesystem::path& path)
    : std::istream(nullptr) {
    fileStream_ = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!fileStream_->is_open()) {
        throw IOError("Failed to open file: " + path.string(),
                      std::make_error_code(std::errc::no_such_file_or_directory));
    }

    std::uint8_t magic[8];
    fileStream_->read(reinterpret_cast<char*>(magic), sizeof(magic));
    auto bytesRead = static_cast<std::size_t>(fileStream_->gcount());

    fileStream_->clear();
    fileStream_->seekg(0, std::ios::beg);

    format_ = detectCompressionFormat({magic, bytesRead});

    // Too short for magic bytes: trust the extension
    if (format_ == CompressionFormat::kNone && bytesRead < 2) {
        format_ = detectCompressionFormatFromExtension(path);
    }

    setup();
}

CompressedInputStream::CompressedInputStream(std::unique_ptr<std::istream> source,
                                             CompressionFormat format)
    : std::istream(nullptr), sourceStream_(std::move(source)), format_(format) {
    if (format_ == CompressionFormat::kUnknown && sourceStream_) {
        auto start = sourceStream_->tellg();
        std::uint8_t magic[8];
        sourceStream_->read(reinterpret_cast<char*>(magic), sizeof(magic));
        auto bytesRead = static_cast<std::size_t>(sourceStream_->gcount());

        sourceStream_->clear();
        sourceStream_->seekg(start);

        format_ = detectCompressionFormat({magic, bytesRead});
    }

    setup();
}

CompressedInputStream::~CompressedInputStream() = default;

void CompressedInputStream::setup() {
    std::istream* source = fileStream_ ? fileStream_.get() : sourceStream_.get();
    if (source == nullptr) {
        throw IOError("No source stream available");
    }

    switch (format_) {
        case CompressionFormat::kNone:
            rdbuf(source->rdbuf());
            break;
        case CompressionFormat::kGzip:
            decompressBuf_ = std::make_unique<GzipStreamBuf>(*source);
            rdbuf(decompressBuf_.get());
            break;
        case CompressionFormat::kBzip2:
            decompressBuf_ = std::make_unique<Bzip2StreamBuf>(*source);
            rdbuf(decompressBuf_.get());
            break;
        case CompressionFormat::kXz:
            decompressBuf_ = std::make_unique<XzStreamBuf>(*source);
            rdbuf(decompressBuf_.get());
            break;
        default:
            throw IOError("Unknown compression format");
    }

    VQT_LOG_DEBUG("Opened input stream (compression: {})",
                  std::string(compressionFormatName(format_)));
}

// =============================================================================
// Factory Functions
// =============================================================================

std::unique_ptr<std::istream> openInputFile(const std::filesystem::path& path) {
    if (path == "-") {
        // stdin cannot seek back over the magic bytes, so it is buffered whole
        VQT_LOG_DEBUG("Opening stdin for input");
        auto buffered = std::make_unique<std::stringstream>();
        *buffered << std::cin.rdbuf();
        buffered->clear();
        buffered->seekg(0);
        return std::make_unique<CompressedInputStream>(std::move(buffered));
    }

    return std::make_unique<CompressedInputStream>(path);
}

}  // namespace vqt::io
