// =============================================================================
// vq-tiers - Common Type Implementations
// =============================================================================

#include "vqt/common/types.h"

#include <algorithm>
#include <cctype>
#include <charconv>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "vqt/common/error.h"

namespace vqt {

namespace {

/// @brief Split on a single delimiter, keeping empty fields.
std::vector<std::string_view> splitView(std::string_view text, char delim) {
    std::vector<std::string_view> fields;
    std::size_t begin = 0;
    while (true) {
        auto pos = text.find(delim, begin);
        if (pos == std::string_view::npos) {
            fields.push_back(text.substr(begin));
            break;
        }
        fields.push_back(text.substr(begin, pos - begin));
        begin = pos + 1;
    }
    return fields;
}

[[nodiscard]] bool isSymbolicAllele(std::string_view allele) noexcept {
    if (allele.empty()) {
        return false;
    }
    return allele.front() == '<' || allele == "*" ||
           allele.find('[') != std::string_view::npos ||
           allele.find(']') != std::string_view::npos;
}

}  // namespace

// =============================================================================
// Coordinate
// =============================================================================

std::string Coordinate::toString() const {
    return fmt::format("{}:{}-{}", contig_, start_, end_);
}

// =============================================================================
// ContigDictionary
// =============================================================================

ContigDictionary::ContigDictionary(const std::vector<std::string>& names) {
    for (const auto& name : names) {
        add(name);
    }
}

ContigRank ContigDictionary::rankOf(const std::string& name) {
    if (auto rank = find(name)) {
        return *rank;
    }
    if (frozen_) {
        throw FormatError("Contig '" + name + "' is not in the sequence dictionary");
    }
    add(name);
    return ranks_.at(name);
}

std::optional<ContigRank> ContigDictionary::find(const std::string& name) const {
    auto it = ranks_.find(name);
    if (it == ranks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ContigDictionary::add(const std::string& name) {
    if (ranks_.contains(name)) {
        return;
    }
    ranks_.emplace(name, static_cast<ContigRank>(names_.size()));
    names_.push_back(name);
}

const std::string& ContigDictionary::nameOf(ContigRank rank) const {
    return names_.at(rank);
}

// =============================================================================
// FilterStatus
// =============================================================================

FilterStatus FilterStatus::pass() {
    FilterStatus status;
    status.pass_ = true;
    return status;
}

FilterStatus FilterStatus::filtered(const std::vector<std::string>& names) {
    FilterStatus status;
    for (const auto& name : names) {
        if (name.empty() || name == kMissingValue) {
            continue;
        }
        if (std::find(status.names_.begin(), status.names_.end(), name) == status.names_.end()) {
            status.names_.push_back(name);
        }
    }
    return status;
}

FilterStatus FilterStatus::parse(std::string_view text) {
    if (text.empty() || text == kMissingValue) {
        return unfiltered();
    }
    if (text == kPassFilter) {
        return pass();
    }
    std::vector<std::string> names;
    for (auto field : splitView(text, ';')) {
        names.emplace_back(field);
    }
    return filtered(names);
}

std::string FilterStatus::toString() const {
    if (!names_.empty()) {
        return fmt::format("{}", fmt::join(names_, ";"));
    }
    return std::string(pass_ ? kPassFilter : kMissingValue);
}

// =============================================================================
// Variant Classification
// =============================================================================

std::string_view variantTypeToString(VariantType type) noexcept {
    switch (type) {
        case VariantType::kNoVariation:
            return "NO_VARIATION";
        case VariantType::kSnp:
            return "SNP";
        case VariantType::kMnp:
            return "MNP";
        case VariantType::kIndel:
            return "INDEL";
        case VariantType::kMixed:
            return "MIXED";
        case VariantType::kSymbolic:
            return "SYMBOLIC";
    }
    return "UNKNOWN";
}

std::string_view variantModeToString(VariantMode mode) noexcept {
    switch (mode) {
        case VariantMode::kSnp:
            return "SNP";
        case VariantMode::kIndel:
            return "INDEL";
        case VariantMode::kBoth:
            return "BOTH";
    }
    return "UNKNOWN";
}

std::optional<VariantMode> parseVariantMode(std::string_view text) noexcept {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "SNP") {
        return VariantMode::kSnp;
    }
    if (upper == "INDEL") {
        return VariantMode::kIndel;
    }
    if (upper == "BOTH") {
        return VariantMode::kBoth;
    }
    return std::nullopt;
}

VariantType classifyAlleles(std::string_view ref, const std::vector<std::string>& alts) {
    std::optional<VariantType> combined;

    for (const auto& alt : alts) {
        if (alt.empty() || alt == kMissingValue) {
            continue;
        }

        VariantType alleleType;
        if (isSymbolicAllele(alt)) {
            alleleType = VariantType::kSymbolic;
        } else if (alt.size() == ref.size()) {
            alleleType = ref.size() == 1 ? VariantType::kSnp : VariantType::kMnp;
        } else {
            alleleType = VariantType::kIndel;
        }

        if (!combined) {
            combined = alleleType;
        } else if (*combined != alleleType) {
            return VariantType::kMixed;
        }
    }

    return combined.value_or(VariantType::kNoVariation);
}

// =============================================================================
// InfoFields
// =============================================================================

InfoFields InfoFields::parse(std::string_view text) {
    InfoFields fields;
    if (text.empty() || text == kMissingValue) {
        return fields;
    }

    for (auto item : splitView(text, ';')) {
        if (item.empty()) {
            continue;
        }
        auto eq = item.find('=');
        if (eq == std::string_view::npos) {
            fields.set(std::string(item), std::nullopt);
        } else {
            fields.set(std::string(item.substr(0, eq)), std::string(item.substr(eq + 1)));
        }
    }
    return fields;
}

std::optional<std::string_view> InfoFields::get(std::string_view key) const {
    for (const auto& [name, value] : entries_) {
        if (name == key) {
            return value ? std::string_view(*value) : std::string_view{};
        }
    }
    return std::nullopt;
}

bool InfoFields::contains(std::string_view key) const {
    return get(key).has_value();
}

void InfoFields::set(std::string key, std::optional<std::string> value) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(std::move(key), std::move(value));
}

std::string InfoFields::toString() const {
    if (entries_.empty()) {
        return std::string(kMissingValue);
    }

    std::string out;
    for (const auto& [key, value] : entries_) {
        if (!out.empty()) {
            out += ';';
        }
        out += key;
        if (value) {
            out += '=';
            out += *value;
        }
    }
    return out;
}

// =============================================================================
// VariantRecord
// =============================================================================

std::string VariantRecord::toVcfLine() const {
    std::string altColumn =
        alts_.empty() ? std::string(kMissingValue) : fmt::format("{}", fmt::join(alts_, ","));

    std::string line = fmt::format("{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}", contig(), position(), id_,
                                   ref_, altColumn, qual_, filters_.toString(), info_.toString());
    if (!sampleColumns_.empty()) {
        line += '\t';
        line += sampleColumns_;
    }
    return line;
}

// =============================================================================
// VariantRecordBuilder
// =============================================================================

VariantRecordBuilder::VariantRecordBuilder(const VariantRecord& record)
    : contig_(record.contig()),
      rank_(record.coordinate().rank()),
      pos_(record.position()),
      record_(record) {}

VariantRecordBuilder& VariantRecordBuilder::locus(std::string contig, ContigRank rank,
                                                  Position pos) {
    contig_ = std::move(contig);
    rank_ = rank;
    pos_ = pos;
    return *this;
}

VariantRecordBuilder& VariantRecordBuilder::id(std::string value) {
    record_.id_ = std::move(value);
    return *this;
}

VariantRecordBuilder& VariantRecordBuilder::alleles(std::string ref,
                                                    std::vector<std::string> alts) {
    record_.ref_ = std::move(ref);
    record_.alts_ = std::move(alts);
    return *this;
}

VariantRecordBuilder& VariantRecordBuilder::qual(std::string value) {
    record_.qual_ = std::move(value);
    return *this;
}

VariantRecordBuilder& VariantRecordBuilder::filters(FilterStatus status) {
    record_.filters_ = std::move(status);
    return *this;
}

VariantRecordBuilder& VariantRecordBuilder::filter(std::string name) {
    record_.filters_ = FilterStatus::filtered({std::move(name)});
    return *this;
}

VariantRecordBuilder& VariantRecordBuilder::passFilters() {
    record_.filters_ = FilterStatus::pass();
    return *this;
}

VariantRecordBuilder& VariantRecordBuilder::info(InfoFields fields) {
    record_.info_ = std::move(fields);
    return *this;
}

VariantRecordBuilder& VariantRecordBuilder::attribute(std::string key,
                                                      std::optional<std::string> value) {
    record_.info_.set(std::move(key), std::move(value));
    return *this;
}

VariantRecordBuilder& VariantRecordBuilder::sampleColumns(std::string value) {
    record_.sampleColumns_ = std::move(value);
    return *this;
}

VariantRecord VariantRecordBuilder::make() const {
    if (record_.ref_.empty()) {
        throw FormatError(fmt::format("Record at {}:{} has an empty REF allele", contig_, pos_));
    }

    Position end = pos_ + static_cast<Position>(record_.ref_.size()) - 1;
    if (auto endText = record_.info_.get(kEndKey); endText && !endText->empty()) {
        Position parsed = 0;
        auto [ptr, ec] =
            std::from_chars(endText->data(), endText->data() + endText->size(), parsed);
        if (ec != std::errc{} || ptr != endText->data() + endText->size() || parsed < pos_) {
            throw FormatError(fmt::format("Record at {}:{} has an invalid END value '{}'",
                                          contig_, pos_, *endText));
        }
        end = parsed;
    }

    VariantRecord record = record_;
    record.coordinate_ = Coordinate(contig_, rank_, pos_, end);
    record.type_ = classifyAlleles(record.ref_, record.alts_);
    return record;
}

}  // namespace vqt
