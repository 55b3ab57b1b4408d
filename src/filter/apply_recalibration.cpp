// =============================================================================
// vq-tiers - Apply Recalibration Implementation
// =============================================================================

#include "vqt/filter/apply_recalibration.h"

#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "vqt/common/logger.h"
#include "vqt/tier/tier_classifier.h"

namespace vqt::filter {

using traversal::ScoredAnnotation;

ApplyRecalibration::ApplyRecalibration(const tier::ThresholdTable& table,
                                       RecalibrationSettings settings, io::RecordSink& sink)
    : table_(table), settings_(std::move(settings)), sink_(sink) {
    VQT_LOG_DEBUG("Recalibrating in {} mode, {} ignored input filters",
                  std::string(variantModeToString(settings_.mode)),
                  settings_.ignoreFilters.size());
}

bool ApplyRecalibration::shouldRecalibrate(const VariantRecord& record) const {
    if (!isCompatibleWithMode(record.type(), settings_.mode)) {
        return false;
    }
    const auto& filters = record.filters();
    if (filters.isNotFiltered()) {
        return true;
    }
    return std::all_of(filters.names().begin(), filters.names().end(),
                       [this](const std::string& name) {
                           return settings_.ignoreFilters.contains(name);
                       });
}

VariantRecord ApplyRecalibration::recalibrate(const VariantRecord& record,
                                              std::span<const ScoredAnnotation> recals,
                                              TierTally& tally) const {
    auto locus = describeRecord(record);
    const auto& match = traversal::requireMatchingScore(record.coordinate(), recals, locus);
    double score = traversal::parseScore(match, locus);

    // The score text is kept verbatim so output precision matches the recal file
    VariantRecordBuilder builder(record);
    builder.attribute(std::string(kScoreKey), *match.scoreText);
    if (match.culprit) {
        builder.attribute(std::string(kCulpritKey), *match.culprit);
    }

    auto decision = tier::classify(score, table_);
    if (decision.isUnfiltered()) {
        builder.passFilters();
    } else {
        builder.filter(decision.label);
    }

    tally.countDecision(decision);
    return builder.make();
}

TierTally ApplyRecalibration::map(const traversal::SiteContext<VariantRecord>& context) {
    TierTally tally;
    tally.sitesVisited = 1;

    auto records = context.startingAt(kInputSource);
    if (records.empty()) {
        return tally;
    }

    std::vector<ScoredAnnotation> recals;
    if (context.sourceCount() > kRecalSource) {
        for (const auto& recal : context.startingAt(kRecalSource)) {
            recals.push_back(ScoredAnnotation::fromRecord(recal));
        }
    }

    for (const auto& record : records) {
        if (shouldRecalibrate(record)) {
            sink_.add(recalibrate(record, recals, tally));
        } else {
            ++tally.recordsPassedThrough;
            sink_.add(record);
        }
    }
    return tally;
}

traversal::TraversalCallbacks<VariantRecord, TierTally> ApplyRecalibration::callbacks() {
    traversal::TraversalCallbacks<VariantRecord, TierTally> callbacks;
    callbacks.zero = [] { return TierTally{}; };
    callbacks.map = [this](const traversal::SiteContext<VariantRecord>& context) {
        return map(context);
    };
    callbacks.combine = [](TierTally lhs, TierTally rhs) {
        return TierTally::combine(std::move(lhs), rhs);
    };
    return callbacks;
}

std::vector<std::string> recalibrationHeaderLines(const tier::ThresholdTable& table) {
    std::vector<std::string> lines;
    for (const auto& [name, description] : table.filterDescriptions()) {
        lines.push_back(fmt::format("##FILTER=<ID={},Description=\"{}\">", name, description));
    }
    lines.push_back(fmt::format(
        "##INFO=<ID={},Number=1,Type=Integer,Description=\"Stop position of the interval\">",
        kEndKey));
    lines.push_back(fmt::format(
        "##INFO=<ID={},Number=1,Type=Float,Description=\"Log odds ratio of being a true "
        "variant versus being false under the trained gaussian mixture model\">",
        kScoreKey));
    lines.push_back(fmt::format(
        "##INFO=<ID={},Number=1,Type=String,Description=\"The annotation which was the worst "
        "performing in the Gaussian mixture model, likely the reason why the variant was "
        "filtered out\">",
        kCulpritKey));
    return lines;
}

io::VcfHeader buildOutputHeader(const std::vector<const io::VcfHeader*>& inputs,
                                const tier::ThresholdTable& table) {
    io::VcfHeader header;
    if (inputs.empty()) {
        header.addMetaLine("##fileformat=VCFv4.2");
    } else {
        header.setColumns(inputs.front()->columns());
        for (const auto* input : inputs) {
            header.mergeMetaLines(*input);
        }
    }
    for (auto& line : recalibrationHeaderLines(table)) {
        header.addMetaLine(std::move(line));
    }
    return header;
}

std::string describeRecord(const VariantRecord& record) {
    return fmt::format("{} {}>{}", record.coordinate().toString(), record.ref(),
                       record.alts().empty() ? std::string(kMissingValue)
                                             : fmt::format("{}", fmt::join(record.alts(), ",")));
}

}  // namespace vqt::filter
