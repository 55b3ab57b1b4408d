// =============================================================================
// vq-tiers - Threshold Table Implementation
// =============================================================================

#include "vqt/tier/threshold_table.h"

#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "vqt/common/error.h"
#include "vqt/common/logger.h"

namespace vqt::tier {

std::string Tranche::toString() const {
    return fmt::format("Tranche ts={:.2f} minVQSLod={:.4f} filterName={} model={}",
                       truthSensitivity, minScore, name, variantModeToString(model));
}

ThresholdTable ThresholdTable::load(const std::vector<Tranche>& source,
                                    double truthSensitivityLevel) {
    std::vector<Tranche> retained;
    retained.reserve(source.size());

    for (const auto& tranche : source) {
        if (tranche.truthSensitivity >= truthSensitivityLevel) {
            retained.push_back(tranche);
        }
        VQT_LOG_INFO("Read tranche {}", tranche.toString());
    }

    if (retained.empty()) {
        throw ConfigurationError(fmt::format(
            "No tranches were found in the file or were above the truth sensitivity filter "
            "level {}",
            truthSensitivityLevel));
    }

    // Most inclusive first, then reversed: index 0 is the retained tranche
    // nearest the level, the last index the most inclusive one.
    std::stable_sort(retained.begin(), retained.end(), [](const Tranche& lhs, const Tranche& rhs) {
        return lhs.truthSensitivity > rhs.truthSensitivity;
    });
    std::reverse(retained.begin(), retained.end());

    VQT_LOG_INFO("Keeping all variants in tranche {}", retained.back().toString());

    return ThresholdTable(std::move(retained), truthSensitivityLevel);
}

std::vector<std::pair<std::string, std::string>> ThresholdTable::filterDescriptions() const {
    std::vector<std::pair<std::string, std::string>> lines;
    lines.reserve(tranches_.size());

    for (std::size_t i = 0; i + 1 < tranches_.size(); ++i) {
        const auto& tranche = tranches_[i];
        lines.emplace_back(
            tranche.name,
            fmt::format("Truth sensitivity tranche level for {} model at VQS Lod: {} <= x < {}",
                        variantModeToString(tranche.model), tranche.minScore,
                        tranches_[i + 1].minScore));
    }

    const auto& lowest = tranches_.front();
    lines.emplace_back(belowLowestName(),
                       fmt::format("Truth sensitivity tranche level for {} model at VQS Lod < {}",
                                   variantModeToString(lowest.model), lowest.minScore));
    return lines;
}

std::string ThresholdTable::toString() const {
    std::vector<std::string> parts;
    parts.reserve(tranches_.size());
    for (const auto& tranche : tranches_) {
        parts.push_back(fmt::format("{} >= {}", tranche.name, tranche.minScore));
    }
    return fmt::format("{}", fmt::join(parts, ", "));
}

}  // namespace vqt::tier
