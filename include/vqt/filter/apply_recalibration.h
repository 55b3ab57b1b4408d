// =============================================================================
// vq-tiers - Apply Recalibration
// =============================================================================
// Filtering walker: annotates each input record with its VQSLOD and culprit
// and sets its FILTER column from the threshold table.
//
// The walker runs inside a CoordinateTraversalEngine with two auxiliary
// sources: the input records (kInputSource) and the recal records
// (kRecalSource). At each site, every input record starting there is either
// - recalibrated: its type suits the mode and it is unfiltered or only
//   carries ignored filters; it is joined by end coordinate to a recal
//   record, annotated, classified and emitted; or
// - passed through: emitted untouched.
// Records are emitted in input order.
// =============================================================================

#ifndef VQT_FILTER_APPLY_RECALIBRATION_H
#define VQT_FILTER_APPLY_RECALIBRATION_H

#include <cstddef>
#include <set>
#include <span>
#include <string>
#include <vector>

#include "vqt/common/types.h"
#include "vqt/filter/tier_tally.h"
#include "vqt/io/vcf_reader.h"
#include "vqt/io/vcf_writer.h"
#include "vqt/tier/threshold_table.h"
#include "vqt/traversal/coordinate_join.h"
#include "vqt/traversal/traversal_engine.h"

namespace vqt::filter {

/// @brief Recalibration settings.
struct RecalibrationSettings {
    /// @brief Variant types to recalibrate.
    VariantMode mode = VariantMode::kSnp;

    /// @brief Input filters that do not prevent recalibration.
    std::set<std::string> ignoreFilters;
};

/// @brief The filtering walker.
class ApplyRecalibration {
public:
    /// @brief Auxiliary source index of the input records.
    static constexpr std::size_t kInputSource = 0;

    /// @brief Auxiliary source index of the recal records.
    static constexpr std::size_t kRecalSource = 1;

    /// @note @p table and @p sink must outlive the walker.
    ApplyRecalibration(const tier::ThresholdTable& table, RecalibrationSettings settings,
                       io::RecordSink& sink);

    /// @brief Check whether @p record is classified rather than passed through.
    [[nodiscard]] bool shouldRecalibrate(const VariantRecord& record) const;

    /// @brief Join, annotate and classify one record.
    /// @throws JoinMismatchError if no recal record matches or its score is unusable.
    [[nodiscard]] VariantRecord recalibrate(const VariantRecord& record,
                                            std::span<const traversal::ScoredAnnotation> recals,
                                            TierTally& tally) const;

    /// @brief Process one site, emitting its input records to the sink.
    [[nodiscard]] TierTally map(const traversal::SiteContext<VariantRecord>& context);

    /// @brief Closures for a CoordinateTraversalEngine.
    /// @note The closures refer to this walker.
    [[nodiscard]] traversal::TraversalCallbacks<VariantRecord, TierTally> callbacks();

    [[nodiscard]] const RecalibrationSettings& settings() const noexcept { return settings_; }

private:
    const tier::ThresholdTable& table_;
    RecalibrationSettings settings_;
    io::RecordSink& sink_;
};

/// @brief Header lines added by recalibration (FILTER, END, VQSLOD, culprit).
[[nodiscard]] std::vector<std::string> recalibrationHeaderLines(const tier::ThresholdTable& table);

/// @brief Output header: merged input meta lines plus the recalibration lines.
[[nodiscard]] io::VcfHeader buildOutputHeader(const std::vector<const io::VcfHeader*>& inputs,
                                              const tier::ThresholdTable& table);

/// @brief Short rendering of a record for messages ("chr1:100-100 A>G").
[[nodiscard]] std::string describeRecord(const VariantRecord& record);

}  // namespace vqt::filter

#endif  // VQT_FILTER_APPLY_RECALIBRATION_H
