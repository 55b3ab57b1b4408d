// =============================================================================
// vq-tiers - Apply Command Implementation
// =============================================================================
// Command handler implementation for applying a recalibration.
// =============================================================================

#include "apply_command.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <functional>
#include <random>
#include <set>
#include <system_error>

#include <fmt/format.h>

#include "vqt/common/logger.h"
#include "vqt/filter/apply_recalibration.h"
#include "vqt/io/tranche_parser.h"
#include "vqt/traversal/shard_runner.h"

namespace vqt::commands {

namespace {

/// @brief Temporary per-shard output files, removed on destruction.
class ShardFiles {
public:
    explicit ShardFiles(std::size_t count) {
        std::random_device device;
        auto token = fmt::format("{:08x}{:08x}", device(), device());
        auto directory = std::filesystem::temp_directory_path();
        paths_.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            paths_.push_back(directory / fmt::format("vqt-{}-shard{}.vcf", token, i));
        }
    }

    ~ShardFiles() {
        for (const auto& path : paths_) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec) {
                VQT_LOG_WARNING("Failed to remove temporary file {}: {}", path.string(),
                                ec.message());
            }
        }
    }

    ShardFiles(const ShardFiles&) = delete;
    ShardFiles& operator=(const ShardFiles&) = delete;

    [[nodiscard]] const std::filesystem::path& path(std::size_t index) const {
        return paths_.at(index);
    }

private:
    std::vector<std::filesystem::path> paths_;
};

bool isStdin(const std::filesystem::path& path) {
    return path == "-";
}

VoidResult checkReadable(const std::filesystem::path& path, std::string_view what) {
    if (isStdin(path)) {
        return makeVoidSuccess();
    }
    if (!std::filesystem::exists(path)) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("{} not found: {}", what, path.string()));
    }
    return makeVoidSuccess();
}

}  // namespace

// =============================================================================
// ApplyOptions Implementation
// =============================================================================

VoidResult ApplyOptions::validate() const {
    if (inputPaths.empty()) {
        return makeVoidError(ErrorCode::kUsageError, "At least one input VCF is required");
    }
    if (recalPath.empty()) {
        return makeVoidError(ErrorCode::kUsageError, "A recal file is required (--recal-file)");
    }
    if (tranchesPath.empty()) {
        return makeVoidError(ErrorCode::kUsageError,
                             "A tranches file is required (--tranches-file)");
    }
    if (!std::isfinite(truthSensitivityLevel) || truthSensitivityLevel < 0.0 ||
        truthSensitivityLevel > 100.0) {
        return makeVoidError(
            ErrorCode::kUsageError,
            fmt::format("Truth sensitivity level must be within [0, 100], got {}",
                        truthSensitivityLevel));
    }
    if (maxSites && *maxSites == 0) {
        return makeVoidError(ErrorCode::kUsageError, "--max-sites must be at least 1");
    }
    if (downsampleToCoverage && *downsampleToCoverage == 0) {
        return makeVoidError(ErrorCode::kUsageError,
                             "--downsample-to-coverage must be at least 1");
    }
    if (threads < 0) {
        return makeVoidError(ErrorCode::kUsageError, "Thread count must not be negative");
    }

    std::size_t stdinUsers = static_cast<std::size_t>(isStdin(recalPath)) +
                             static_cast<std::size_t>(isStdin(tranchesPath)) +
                             static_cast<std::size_t>(std::count_if(
                                 inputPaths.begin(), inputPaths.end(), isStdin));
    if (stdinUsers > 1) {
        return makeVoidError(ErrorCode::kUsageError, "Only one input may be read from stdin");
    }
    bool sharded = scatterByContig || !intervals.empty();
    if (sharded && stdinUsers > 0) {
        return makeVoidError(ErrorCode::kUsageError,
                             "Inputs read from stdin cannot be split by interval or contig");
    }

    for (const auto& text : intervals) {
        if (auto parsed = traversal::parseInterval(text); !parsed) {
            return std::unexpected(parsed.error());
        }
    }

    for (const auto& path : inputPaths) {
        if (auto result = checkReadable(path, "Input file"); !result) {
            return result;
        }
    }
    if (auto result = checkReadable(recalPath, "Recal file"); !result) {
        return result;
    }
    return checkReadable(tranchesPath, "Tranches file");
}

// =============================================================================
// ApplyCommand Implementation
// =============================================================================

ApplyCommand::ApplyCommand(ApplyOptions options) : options_(std::move(options)) {}

ApplyCommand::~ApplyCommand() = default;

int ApplyCommand::execute() {
    try {
        run();
        return 0;
    } catch (const VqtException& e) {
        VQT_LOG_ERROR("Apply failed: {}", std::string(e.what()));
        return e.exitCode();
    } catch (const std::exception& e) {
        VQT_LOG_ERROR("Unexpected error: {}", std::string(e.what()));
        return toExitCode(ErrorCode::kIOError);
    }
}

void ApplyCommand::run() {
    auto startTime = std::chrono::steady_clock::now();

    unwrapOrThrow(options_.validate());

    auto tranches = io::readTranchesFile(options_.tranchesPath);
    table_ = tier::ThresholdTable::load(tranches, options_.truthSensitivityLevel);

    VQT_LOG_INFO("Applying {} recalibration at truth sensitivity {}",
                 std::string(variantModeToString(options_.mode)), options_.truthSensitivityLevel);
    VQT_LOG_DEBUG("  Tranches: {}", table_->toString());
    VQT_LOG_DEBUG("  Inputs: {}", options_.inputPaths.size());
    VQT_LOG_DEBUG("  Recal: {}", options_.recalPath.string());
    VQT_LOG_DEBUG("  Output: {}", options_.outputPath.string());

    std::vector<traversal::Interval> intervals;
    intervals.reserve(options_.intervals.size());
    for (const auto& text : options_.intervals) {
        intervals.push_back(unwrapOrThrow(traversal::parseInterval(text)));
    }

    ContigDictionary dictionary;
    tally_ = filter::TierTally{};
    if (intervals.empty() && !options_.scatterByContig) {
        runWholeGenome(dictionary);
    } else {
        runShards(dictionary, std::move(intervals));
    }

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime);
    VQT_LOG_INFO("Apply finished in {:.2f} s", elapsed.count());
    logSummary();
}

PassReaders ApplyCommand::openReaders(const std::optional<traversal::Interval>& interval,
                                      ContigDictionary& dictionary) const {
    PassReaders readers;
    readers.inputs.reserve(options_.inputPaths.size());
    for (const auto& path : options_.inputPaths) {
        io::VcfReaderOptions readerOptions;
        readerOptions.interval = interval;
        readerOptions.requireDeclaredContigs = interval && options_.intervals.empty();
        readers.inputs.push_back(std::make_unique<io::VcfReader>(path, dictionary, readerOptions));
    }

    io::VcfReaderOptions recalOptions;
    recalOptions.interval = interval;
    readers.recal = std::make_unique<io::VcfReader>(options_.recalPath, dictionary, recalOptions);
    return readers;
}

io::VcfHeader ApplyCommand::outputHeader(const PassReaders& readers) const {
    std::vector<const io::VcfHeader*> headers;
    headers.reserve(readers.inputs.size());
    for (const auto& reader : readers.inputs) {
        headers.push_back(&reader->header());
    }
    return filter::buildOutputHeader(headers, *table_);
}

filter::TierTally ApplyCommand::runPass(PassReaders& readers, io::RecordSink& sink,
                                        const std::string& label) const {
    std::vector<traversal::CoordinateSource<VariantRecord>*> inputSources;
    inputSources.reserve(readers.inputs.size());
    for (auto& reader : readers.inputs) {
        inputSources.push_back(reader.get());
    }
    traversal::MergedCoordinateSource<VariantRecord> merged(inputSources, "inputs");
    traversal::CoordinateSource<VariantRecord>& primary =
        inputSources.size() == 1 ? *inputSources.front()
                                 : static_cast<traversal::CoordinateSource<VariantRecord>&>(merged);

    io::FeatureSiteSource sites(primary);

    filter::RecalibrationSettings settings;
    settings.mode = options_.mode;
    settings.ignoreFilters.insert(options_.ignoreFilters.begin(), options_.ignoreFilters.end());
    filter::ApplyRecalibration walker(*table_, std::move(settings), sink);

    traversal::CoordinateTraversalEngine<VariantRecord, filter::TierTally> engine(
        sites, {&primary, readers.recal.get()}, walker.callbacks(), traversalConfig(label));
    auto tally = engine.run();
    traversal::logTraversalSummary(label, engine.stats());
    return tally;
}

void ApplyCommand::runWholeGenome(ContigDictionary& dictionary) {
    auto readers = openReaders(std::nullopt, dictionary);

    io::VcfWriter writer(options_.outputPath);
    writer.writeHeader(outputHeader(readers));
    tally_ = runPass(readers, writer, "apply");
    writer.flush();
}

void ApplyCommand::runShards(ContigDictionary& dictionary,
                             std::vector<traversal::Interval> intervals) {
    // Headers only; this seeds the dictionary with the declared contigs.
    io::VcfHeader header;
    {
        auto readers = openReaders(std::nullopt, dictionary);
        header = outputHeader(readers);
    }

    std::vector<traversal::Interval> shards;
    if (!intervals.empty()) {
        shards = traversal::normalizeIntervals(std::move(intervals), dictionary);
    } else {
        shards = traversal::intervalsForContigs(dictionary);
        if (shards.empty()) {
            throw UsageError(
                "--scatter-by-contig needs ##contig lines in the input or recal header");
        }
    }
    dictionary.freeze();

    VQT_LOG_INFO("Processing {} shard(s) on {} thread(s)", shards.size(),
                 options_.threads > 0 ? fmt::format("{}", options_.threads) : std::string("auto"));

    ShardFiles files(shards.size());
    std::vector<std::uint64_t> shardRecords(shards.size(), 0);

    std::function<filter::TierTally(const traversal::Interval&, std::size_t)> runShard =
        [&](const traversal::Interval& shard, std::size_t index) {
            auto readers = openReaders(shard, dictionary);
            io::VcfWriter writer(files.path(index));
            auto tally = runPass(readers, writer, "apply " + shard.toString());
            writer.flush();
            shardRecords[index] = writer.recordsWritten();
            return tally;
        };
    std::function<filter::TierTally()> zero = [] { return filter::TierTally{}; };
    std::function<filter::TierTally(filter::TierTally, filter::TierTally)> combine =
        [](filter::TierTally lhs, filter::TierTally rhs) {
            return filter::TierTally::combine(std::move(lhs), rhs);
        };

    tally_ = traversal::runSharded(shards, runShard, zero, combine,
                                   static_cast<std::size_t>(options_.threads));

    io::VcfWriter writer(options_.outputPath);
    writer.writeHeader(header);
    for (std::size_t i = 0; i < shards.size(); ++i) {
        std::ifstream body(files.path(i), std::ios::in | std::ios::binary);
        if (!body.is_open()) {
            throw IOError("Failed to reopen shard output: " + files.path(i).string());
        }
        writer.appendBody(body, shardRecords[i]);
    }
    writer.flush();
}

traversal::TraversalConfig ApplyCommand::traversalConfig(const std::string& label) const {
    traversal::TraversalConfig config;
    config.maxSites = options_.maxSites;
    config.downsampleToCoverage = options_.downsampleToCoverage;
    // Every input record must reach the output, and every one needs its recal
    // record, so neither of the walker's sources is thinned.
    config.downsampleExempt = {filter::ApplyRecalibration::kInputSource,
                               filter::ApplyRecalibration::kRecalSource};
    config.downsampleSeed = options_.seed;
    config.progressIntervalSites =
        options_.showProgress ? traversal::kDefaultProgressIntervalSites : 0;
    config.label = label;
    return config;
}

void ApplyCommand::logSummary() const {
    VQT_LOG_INFO("{}", tally_.summary());
}

}  // namespace vqt::commands
