// =============================================================================
// vq-tiers - VCF Reader Implementation
// =============================================================================

#include "vqt/io/vcf_reader.h"

#include <algorithm>
#include <charconv>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "vqt/common/logger.h"
#include "vqt/io/compressed_stream.h"

namespace vqt::io {

namespace {

/// @brief Split on a delimiter, keeping empty fields.
std::vector<std::string_view> split(std::string_view text, char delim) {
    std::vector<std::string_view> fields;
    std::size_t begin = 0;
    while (true) {
        auto pos = text.find(delim, begin);
        if (pos == std::string_view::npos) {
            fields.push_back(text.substr(begin));
            return fields;
        }
        fields.push_back(text.substr(begin, pos - begin));
        begin = pos + 1;
    }
}

/// @brief Trim a trailing carriage return.
void chompCarriageReturn(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

/// @brief Value of "ID=" inside a structured meta line "##KEY=<ID=...,...>".
std::optional<std::string_view> structuredId(std::string_view line) {
    auto open = line.find("=<");
    if (open == std::string_view::npos) {
        return std::nullopt;
    }
    auto body = line.substr(open + 2);
    if (!body.starts_with("ID=")) {
        auto pos = body.find(",ID=");
        if (pos == std::string_view::npos) {
            return std::nullopt;
        }
        body = body.substr(pos + 1);
    }
    body.remove_prefix(3);
    auto end = body.find_first_of(",>");
    return body.substr(0, end);
}

}  // namespace

// =============================================================================
// VcfHeader
// =============================================================================

std::vector<std::string> VcfHeader::sampleNames() const {
    constexpr std::size_t kFirstSampleColumn = std::size(kVcfFixedColumns) + 1;
    if (columns_.size() <= kFirstSampleColumn) {
        return {};
    }
    return {columns_.begin() + static_cast<std::ptrdiff_t>(kFirstSampleColumn), columns_.end()};
}

std::vector<std::string> VcfHeader::contigs() const {
    std::vector<std::string> names;
    for (const auto& line : metaLines_) {
        if (line.starts_with("##contig=")) {
            if (auto id = structuredId(line)) {
                names.emplace_back(*id);
            }
        }
    }
    return names;
}

std::string VcfHeader::metaLineKey(std::string_view line) {
    auto eq = line.find('=');
    if (!line.starts_with("##") || eq == std::string_view::npos) {
        return std::string(line);
    }
    if (auto id = structuredId(line)) {
        return fmt::format("{}/{}", line.substr(2, eq - 2), *id);
    }
    return std::string(line);
}

void VcfHeader::addMetaLine(std::string line) {
    auto key = metaLineKey(line);
    for (auto& existing : metaLines_) {
        if (metaLineKey(existing) == key) {
            existing = std::move(line);
            return;
        }
    }
    metaLines_.push_back(std::move(line));
}

void VcfHeader::mergeMetaLines(const VcfHeader& other) {
    for (const auto& line : other.metaLines_) {
        auto key = metaLineKey(line);
        bool present = std::any_of(metaLines_.begin(), metaLines_.end(),
                                   [&key](const std::string& existing) {
                                       return metaLineKey(existing) == key;
                                   });
        if (!present) {
            metaLines_.push_back(line);
        }
    }
}

std::string VcfHeader::columnLine() const {
    if (columns_.empty()) {
        return fmt::format("{}", fmt::join(kVcfFixedColumns, "\t"));
    }
    return fmt::format("{}", fmt::join(columns_, "\t"));
}

std::string VcfHeader::toString() const {
    std::string out;
    for (const auto& line : metaLines_) {
        out += line;
        out += '\n';
    }
    out += columnLine();
    out += '\n';
    return out;
}

// =============================================================================
// VcfReader
// =============================================================================

VcfReader::VcfReader(const std::filesystem::path& path, ContigDictionary& dictionary,
                     VcfReaderOptions options)
    : VcfReader(openInputFile(path), dictionary, [&] {
          if (options.name.empty()) {
              options.name = path.string();
          }
          return std::move(options);
      }()) {}

VcfReader::VcfReader(std::unique_ptr<std::istream> stream, ContigDictionary& dictionary,
                     VcfReaderOptions options)
    : stream_(std::move(stream)),
      dictionary_(dictionary),
      options_(std::move(options)),
      name_(options_.name.empty() ? std::string("<stream>") : options_.name) {
    if (!stream_) {
        throw IOError("No input stream for " + name_);
    }
    readHeader();

    if (options_.interval) {
        VQT_LOG_DEBUG("{}: restricted to {}", name_, options_.interval->toString());
    }
}

VcfReader::~VcfReader() = default;

ErrorContext VcfReader::context() const {
    return ErrorContext{name_}.withLine(lineNumber_);
}

void VcfReader::readHeader() {
    bool sawColumns = false;
    while (std::getline(*stream_, line_)) {
        ++lineNumber_;
        chompCarriageReturn(line_);
        if (line_.empty()) {
            continue;
        }

        if (line_.starts_with("##")) {
            header_.addMetaLine(line_);
            continue;
        }

        if (line_.starts_with("#")) {
            std::vector<std::string> columns;
            for (auto field : split(line_, '\t')) {
                columns.emplace_back(field);
            }
            for (std::size_t i = 0; i < std::size(kVcfFixedColumns); ++i) {
                if (i >= columns.size() || columns[i] != kVcfFixedColumns[i]) {
                    throw FormatError(
                        fmt::format("Malformed column header line; expected column '{}'",
                                    kVcfFixedColumns[i]),
                        context());
                }
            }
            header_.setColumns(std::move(columns));
            sawColumns = true;
            continue;
        }

        // First data line; parsed on the first readRecord()
        pendingLine_ = line_;
        break;
    }

    if (!sawColumns && (pendingLine_ || lineNumber_ > 0)) {
        throw FormatError("Missing #CHROM column header line", context());
    }

    if (!dictionary_.isFrozen()) {
        for (const auto& contig : header_.contigs()) {
            dictionary_.add(contig);
        }
    }
}

VariantRecord VcfReader::parseDataLine(std::string_view line) {
    auto fields = split(line, '\t');
    if (fields.size() < std::size(kVcfFixedColumns)) {
        throw FormatError(fmt::format("Data line has {} columns, expected at least {}",
                                      fields.size(), std::size(kVcfFixedColumns)),
                          context());
    }

    std::string contig(fields[0]);
    if (contig.empty()) {
        throw FormatError("Data line has an empty CHROM column", context());
    }

    Position pos = 0;
    auto posText = fields[1];
    auto [ptr, ec] = std::from_chars(posText.data(), posText.data() + posText.size(), pos);
    if (ec != std::errc{} || ptr != posText.data() + posText.size() || pos < 1) {
        throw FormatError(fmt::format("Invalid POS value '{}'", posText), context());
    }

    std::vector<std::string> alts;
    if (fields[4] != kMissingValue) {
        for (auto alt : split(fields[4], ',')) {
            alts.emplace_back(alt);
        }
    }

    std::string samples;
    if (fields.size() > std::size(kVcfFixedColumns)) {
        auto offset = static_cast<std::size_t>(fields[std::size(kVcfFixedColumns)].data() -
                                               line.data());
        samples = std::string(line.substr(offset));
    }

    ContigRank rank = 0;
    try {
        rank = dictionary_.rankOf(contig);
    } catch (const FormatError& ex) {
        throw FormatError(ex.message(), context());
    }

    try {
        return VariantRecordBuilder()
            .locus(std::move(contig), rank, pos)
            .id(std::string(fields[2]))
            .alleles(std::string(fields[3]), std::move(alts))
            .qual(std::string(fields[5]))
            .filters(FilterStatus::parse(fields[6]))
            .info(InfoFields::parse(fields[7]))
            .sampleColumns(std::move(samples))
            .make();
    } catch (const FormatError& ex) {
        throw FormatError(ex.message(), context());
    }
}

void VcfReader::checkOrder(const VariantRecord& record) {
    const auto& coordinate = record.coordinate();
    if (lastCoordinate_) {
        bool backwards = coordinate.rank() < lastCoordinate_->rank() ||
                         (coordinate.rank() == lastCoordinate_->rank() &&
                          coordinate.start() < lastCoordinate_->start());
        if (backwards) {
            throw SequenceOrderViolation(
                fmt::format("Input is not coordinate sorted: {}:{} follows {}:{}",
                            coordinate.contig(), coordinate.start(), lastCoordinate_->contig(),
                            lastCoordinate_->start()),
                context().withLocus(coordinate.toString()));
        }
    }
    lastCoordinate_ = coordinate;
}

bool VcfReader::onIntervalContig(std::string_view line) {
    if (!options_.interval) {
        return true;
    }
    // Lines on other contigs are skipped unparsed, so a frozen dictionary
    // never sees their contig names.
    auto contig = line.substr(0, line.find('\t'));
    if (contig == options_.interval->contig) {
        seenIntervalContig_ = true;
        return true;
    }
    if (options_.requireDeclaredContigs && !dictionary_.find(std::string(contig))) {
        throw FormatError(fmt::format("Contig '{}' has no ##contig header line; scattering "
                                      "by contig needs every contig declared",
                                      contig),
                          context());
    }
    ++recordsSkipped_;
    if (seenIntervalContig_) {
        passedInterval_ = true;
    }
    return false;
}

std::optional<VariantRecord> VcfReader::readNextInRange() {
    while (!passedInterval_) {
        std::optional<VariantRecord> record;
        if (pendingLine_) {
            std::string line = std::move(*pendingLine_);
            pendingLine_.reset();
            if (!onIntervalContig(line)) {
                continue;
            }
            record = parseDataLine(line);
        } else {
            if (!std::getline(*stream_, line_)) {
                if (stream_->bad()) {
                    throw IOError("Read failure on " + name_);
                }
                return std::nullopt;
            }
            ++lineNumber_;
            chompCarriageReturn(line_);
            if (line_.empty()) {
                continue;
            }
            if (line_.starts_with("#")) {
                throw FormatError("Header line found after data lines", context());
            }
            if (!onIntervalContig(line_)) {
                continue;
            }
            record = parseDataLine(line_);
        }

        checkOrder(*record);

        if (!options_.interval || options_.interval->containsStart(record->coordinate())) {
            return record;
        }

        ++recordsSkipped_;
        const auto& interval = *options_.interval;
        const auto& coordinate = record->coordinate();
        if (coordinate.contig() == interval.contig && coordinate.start() > interval.end) {
            passedInterval_ = true;
        }
    }
    return std::nullopt;
}

std::optional<VariantRecord> VcfReader::readRecord() {
    if (lookahead_) {
        auto record = std::move(lookahead_);
        lookahead_.reset();
        return record;
    }
    auto record = readNextInRange();
    if (record) {
        ++recordsRead_;
    }
    return record;
}

const VariantRecord* VcfReader::peek() {
    if (!lookahead_) {
        lookahead_ = readNextInRange();
        if (lookahead_) {
            ++recordsRead_;
        }
    }
    return lookahead_ ? &*lookahead_ : nullptr;
}

std::optional<VariantRecord> VcfReader::pop() {
    return readRecord();
}

// =============================================================================
// FeatureSiteSource
// =============================================================================

std::optional<Coordinate> FeatureSiteSource::next() {
    while (const VariantRecord* record = source_.peek()) {
        const auto& coordinate = record->coordinate();
        bool alreadyEmitted = last_ && coordinate.rank() == last_->rank() &&
                              coordinate.start() <= last_->start();
        if (alreadyEmitted) {
            (void)source_.pop();
            continue;
        }
        last_ = Coordinate(coordinate.contig(), coordinate.rank(), coordinate.start());
        return last_;
    }
    return std::nullopt;
}

}  // namespace vqt::io
