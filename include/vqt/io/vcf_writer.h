// =============================================================================
// vq-tiers - VCF Writer
// =============================================================================
// Record sinks for annotated records.
//
// This module provides:
// - RecordSink: Interface accepting records in emission order
// - VectorRecordSink: In-memory sink
// - VcfWriter: Writes a VCF header and data lines to a file or stdout
// =============================================================================

#ifndef VQT_IO_VCF_WRITER_H
#define VQT_IO_VCF_WRITER_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "vqt/common/types.h"
#include "vqt/io/vcf_reader.h"

namespace vqt::io {

/// @brief Accepts records in the order they are produced.
class RecordSink {
public:
    virtual ~RecordSink() = default;

    /// @brief Append one record.
    virtual void add(const VariantRecord& record) = 0;
};

/// @brief Sink collecting records in memory.
class VectorRecordSink final : public RecordSink {
public:
    void add(const VariantRecord& record) override { records_.push_back(record); }

    [[nodiscard]] const std::vector<VariantRecord>& records() const noexcept { return records_; }

private:
    std::vector<VariantRecord> records_;
};

/// @brief Writes VCF text.
class VcfWriter final : public RecordSink {
public:
    /// @brief Write to a file, or to stdout for "-".
    /// @throws IOError if the file cannot be created.
    explicit VcfWriter(const std::filesystem::path& path);

    /// @brief Write to a caller-owned stream.
    explicit VcfWriter(std::ostream& stream, std::string name = "<stream>");

    ~VcfWriter() override;

    VcfWriter(const VcfWriter&) = delete;
    VcfWriter& operator=(const VcfWriter&) = delete;

    /// @brief Write the header; must precede the first record.
    void writeHeader(const VcfHeader& header);

    void add(const VariantRecord& record) override;

    /// @brief Copy already formatted data lines from @p body.
    /// @param records Number of records in @p body
    void appendBody(std::istream& body, std::uint64_t records);

    /// @brief Flush buffered output.
    /// @throws IOError on write failure.
    void flush();

    [[nodiscard]] std::uint64_t recordsWritten() const noexcept { return recordsWritten_; }

private:
    void checkStream();

    std::ofstream file_;
    std::ostream* out_ = nullptr;
    std::string name_;
    std::string line_;
    std::uint64_t recordsWritten_ = 0;
};

}  // namespace vqt::io

#endif  // VQT_IO_VCF_WRITER_H
