// =============================================================================
// vq-tiers - Apply Command
// =============================================================================
// Command handler for applying a recalibration to VCF files.
//
// This module provides:
// - ApplyOptions: Configuration options for the apply command
// - ApplyCommand: Loads the tranches, runs the filtering traversal (whole
//   genome, per interval or per contig) and writes the output VCF
// =============================================================================

#ifndef VQT_COMMANDS_APPLY_COMMAND_H
#define VQT_COMMANDS_APPLY_COMMAND_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "vqt/common/error.h"
#include "vqt/common/types.h"
#include "vqt/filter/tier_tally.h"
#include "vqt/io/vcf_reader.h"
#include "vqt/io/vcf_writer.h"
#include "vqt/tier/threshold_table.h"
#include "vqt/traversal/interval.h"
#include "vqt/traversal/traversal_engine.h"

namespace vqt::commands {

// =============================================================================
// Apply Options
// =============================================================================

/// @brief Configuration options for the apply command.
struct ApplyOptions {
    /// @brief Input VCF files, merged as one primary stream.
    std::vector<std::filesystem::path> inputPaths;

    /// @brief Recal file (VCF with VQSLOD and culprit).
    std::filesystem::path recalPath;

    /// @brief Tranches file.
    std::filesystem::path tranchesPath;

    /// @brief Output VCF ("-" for stdout).
    std::filesystem::path outputPath = "-";

    /// @brief Truth sensitivity level at which filtering starts.
    double truthSensitivityLevel = tier::kDefaultTruthSensitivityLevel;

    /// @brief Input filters that do not prevent recalibration.
    std::vector<std::string> ignoreFilters;

    /// @brief Recalibration mode.
    VariantMode mode = VariantMode::kSnp;

    /// @brief Intervals to process ("chr", "chr:pos", "chr:start-end").
    std::vector<std::string> intervals;

    /// @brief Run one shard per contig of the input header.
    bool scatterByContig = false;

    /// @brief Per-pass site cutoff.
    std::optional<std::uint64_t> maxSites;

    /// @brief Per-site cap on input records.
    std::optional<std::size_t> downsampleToCoverage;

    /// @brief Downsampling seed.
    std::uint64_t seed = traversal::kDefaultDownsampleSeed;

    /// @brief Number of threads (0 = auto).
    int threads = 0;

    /// @brief Log progress lines.
    bool showProgress = true;

    /// @brief Validate options.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Pass Readers
// =============================================================================

/// @brief Readers opened for one traversal pass.
struct PassReaders {
    /// @brief One reader per input VCF, in command-line order.
    std::vector<std::unique_ptr<io::VcfReader>> inputs;

    /// @brief Reader of the recal file.
    std::unique_ptr<io::VcfReader> recal;
};

// =============================================================================
// ApplyCommand Class
// =============================================================================

/// @brief Command handler for applying a recalibration.
class ApplyCommand {
public:
    explicit ApplyCommand(ApplyOptions options);
    ~ApplyCommand();

    ApplyCommand(const ApplyCommand&) = delete;
    ApplyCommand& operator=(const ApplyCommand&) = delete;

    /// @brief Execute the command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    /// @brief Run the command, propagating errors as exceptions.
    void run();

    [[nodiscard]] const ApplyOptions& options() const noexcept { return options_; }

    /// @brief Totals of the last run.
    [[nodiscard]] const filter::TierTally& tally() const noexcept { return tally_; }

private:
    /// @brief Open the inputs and the recal file, restricted to @p interval.
    [[nodiscard]] PassReaders openReaders(const std::optional<traversal::Interval>& interval,
                                          ContigDictionary& dictionary) const;

    /// @brief Output header for the headers of @p readers.
    [[nodiscard]] io::VcfHeader outputHeader(const PassReaders& readers) const;

    /// @brief One traversal pass over @p readers, emitting to @p sink.
    [[nodiscard]] filter::TierTally runPass(PassReaders& readers, io::RecordSink& sink,
                                            const std::string& label) const;

    /// @brief Sequential pass over the whole input.
    void runWholeGenome(ContigDictionary& dictionary);

    /// @brief Parallel passes over intervals, concatenated in order.
    void runShards(ContigDictionary& dictionary, std::vector<traversal::Interval> intervals);

    [[nodiscard]] traversal::TraversalConfig traversalConfig(const std::string& label) const;

    void logSummary() const;

    ApplyOptions options_;
    std::optional<tier::ThresholdTable> table_;
    filter::TierTally tally_;
};

}  // namespace vqt::commands

#endif  // VQT_COMMANDS_APPLY_COMMAND_H
