// =============================================================================
// vq-tiers - Coordinate Join Implementation
// =============================================================================

#include "vqt/traversal/coordinate_join.h"

#include <charconv>
#include <cstdlib>
#include <string>
#include <string_view>

#include "vqt/common/error.h"

namespace vqt::traversal {

namespace {

[[nodiscard]] std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

ScoredAnnotation ScoredAnnotation::fromRecord(const VariantRecord& record) {
    ScoredAnnotation annotation;
    annotation.locus = record.coordinate();
    if (auto score = record.attribute(kScoreKey); score && !score->empty()) {
        annotation.scoreText = std::string(*score);
    }
    if (auto culprit = record.attribute(kCulpritKey); culprit && !culprit->empty()) {
        annotation.culprit = std::string(*culprit);
    }
    return annotation;
}

const ScoredAnnotation* findMatchingScore(const Coordinate& record,
                                          std::span<const ScoredAnnotation> candidates) noexcept {
    for (const auto& candidate : candidates) {
        if (candidate.locus.rank() == record.rank() && candidate.locus.end() == record.end()) {
            return &candidate;
        }
    }
    return nullptr;
}

const ScoredAnnotation& requireMatchingScore(const Coordinate& record,
                                             std::span<const ScoredAnnotation> candidates,
                                             const std::string& recordLocus) {
    if (const auto* match = findMatchingScore(record, candidates)) {
        return *match;
    }
    throw JoinMismatchError(
        "Encountered input variant which isn't found in the input recal file. Please make "
        "sure the recal file and the input were produced from the same set of input "
        "variants. First seen at: " + recordLocus,
        ErrorContext{}.withLocus(record.toString()));
}

double parseScore(const ScoredAnnotation& annotation, const std::string& recordLocus) {
    if (!annotation.scoreText) {
        throw JoinMismatchError(
            "Encountered a malformed record in the input recal file. There is no lod for "
            "the record at: " + recordLocus,
            ErrorContext{}.withLocus(annotation.locus.toString()));
    }

    auto text = trim(*annotation.scoreText);
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    bool complete = !text.empty() && ptr == text.data() + text.size();
    if (complete && ec == std::errc::result_out_of_range) {
        // Overflow reads as +-infinity and underflow as (signed) zero.
        value = std::strtod(std::string(text).c_str(), nullptr);
        ec = std::errc{};
    }
    if (!complete || ec != std::errc{}) {
        throw JoinMismatchError(
            "Encountered a malformed record in the input recal file. The lod is unreadable "
            "for the record at: " + recordLocus,
            ErrorContext{}.withLocus(annotation.locus.toString()));
    }
    return value;
}

}  // namespace vqt::traversal
