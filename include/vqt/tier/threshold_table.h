// =============================================================================
// vq-tiers - Threshold Table
// =============================================================================
// Ordered tranche definitions used to turn a VQSLOD score into a filter.
//
// This module provides:
// - Tranche: One tier (name, minimum score, truth sensitivity, model)
// - ThresholdTable: Tranches retained at a truth sensitivity filter level,
//   ordered from the most exclusive retained tranche (index 0) to the most
//   inclusive one (last index)
//
// Usage:
//   auto table = ThresholdTable::load(io::readTranchesFile(path), 99.0);
//   auto decision = classify(score, table);
// =============================================================================

#ifndef VQT_TIER_THRESHOLD_TABLE_H
#define VQT_TIER_THRESHOLD_TABLE_H

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "vqt/common/types.h"

namespace vqt::tier {

// =============================================================================
// Constants
// =============================================================================

/// @brief Default truth sensitivity level at which filtering starts.
inline constexpr double kDefaultTruthSensitivityLevel = 99.0;

// =============================================================================
// Tranche
// =============================================================================

/// @brief One quality tier as written by the recalibration training step.
struct Tranche {
    /// @brief Filter name applied to records that fall in this tranche.
    std::string name;

    /// @brief Inclusion threshold: records with score >= minScore meet it.
    double minScore = 0.0;

    /// @brief Target truth sensitivity (coverage percentage) of the tranche.
    double truthSensitivity = 0.0;

    /// @brief Model the tranche was trained for.
    VariantMode model = VariantMode::kSnp;

    /// @brief Human-readable description for logging.
    [[nodiscard]] std::string toString() const;

    friend bool operator==(const Tranche&, const Tranche&) = default;
};

// =============================================================================
// ThresholdTable
// =============================================================================

/// @brief Immutable, non-empty, ordered set of retained tranches.
class ThresholdTable {
public:
    /// @brief Build a table from raw tranches at a truth sensitivity level.
    ///
    /// Keeps tranches with truthSensitivity >= @p truthSensitivityLevel,
    /// orders them from the most to the least inclusive (stable for equal
    /// sensitivities), then reverses them so that index 0 is the tranche
    /// closest to the level and the last index is the most inclusive one.
    ///
    /// @throws ConfigurationError if no tranche is retained.
    [[nodiscard]] static ThresholdTable load(const std::vector<Tranche>& source,
                                             double truthSensitivityLevel);

    [[nodiscard]] std::size_t size() const noexcept { return tranches_.size(); }

    [[nodiscard]] const Tranche& operator[](std::size_t index) const { return tranches_[index]; }

    [[nodiscard]] const Tranche& at(std::size_t index) const { return tranches_.at(index); }

    /// @brief Most exclusive retained tranche (index 0).
    [[nodiscard]] const Tranche& front() const { return tranches_.front(); }

    /// @brief Most inclusive tranche; records meeting it pass.
    [[nodiscard]] const Tranche& back() const { return tranches_.back(); }

    [[nodiscard]] const std::vector<Tranche>& tranches() const noexcept { return tranches_; }

    [[nodiscard]] double truthSensitivityLevel() const noexcept { return level_; }

    /// @brief Filter name given to records below every retained threshold.
    [[nodiscard]] std::string belowLowestName() const { return front().name + "+"; }

    /// @brief FILTER header entries (name, description) for every filter
    ///        this table can assign.
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> filterDescriptions() const;

    /// @brief One-line listing "name >= minScore" per tranche, in table order.
    [[nodiscard]] std::string toString() const;

private:
    ThresholdTable(std::vector<Tranche> tranches, double level)
        : tranches_(std::move(tranches)), level_(level) {}

    std::vector<Tranche> tranches_;
    double level_ = kDefaultTruthSensitivityLevel;
};

}  // namespace vqt::tier

#endif  // VQT_TIER_THRESHOLD_TABLE_H
