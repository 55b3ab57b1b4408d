// =============================================================================
// vq-tiers - VCF Writer Implementation
// =============================================================================

#include "vqt/io/vcf_writer.h"

#include <iostream>

#include "vqt/common/error.h"
#include "vqt/common/logger.h"

namespace vqt::io {

VcfWriter::VcfWriter(const std::filesystem::path& path) : name_(path.string()) {
    if (path == "-") {
        out_ = &std::cout;
        name_ = "<stdout>";
        return;
    }

    file_.open(path, std::ios::out | std::ios::trunc);
    if (!file_.is_open()) {
        throw IOError("Failed to create output file: " + path.string(),
                      std::make_error_code(std::errc::io_error));
    }
    out_ = &file_;
}

VcfWriter::VcfWriter(std::ostream& stream, std::string name)
    : out_(&stream), name_(std::move(name)) {}

VcfWriter::~VcfWriter() {
    if (out_ != nullptr) {
        out_->flush();
    }
}

void VcfWriter::writeHeader(const VcfHeader& header) {
    *out_ << header.toString();
    checkStream();
}

void VcfWriter::add(const VariantRecord& record) {
    line_ = record.toVcfLine();
    line_ += '\n';
    out_->write(line_.data(), static_cast<std::streamsize>(line_.size()));
    checkStream();
    ++recordsWritten_;
}

void VcfWriter::appendBody(std::istream& body, std::uint64_t records) {
    if (body.peek() != std::char_traits<char>::eof()) {
        *out_ << body.rdbuf();
    }
    if (body.bad()) {
        throw IOError("Read failure while copying into " + name_);
    }
    checkStream();
    recordsWritten_ += records;
}

void VcfWriter::flush() {
    out_->flush();
    checkStream();
    VQT_LOG_DEBUG("{}: {} records written", name_, recordsWritten_);
}

void VcfWriter::checkStream() {
    if (!*out_) {
        throw IOError("Write failure on " + name_);
    }
}

}  // namespace vqt::io
