// =============================================================================
// vq-tiers - Variant Quality Tier Filtering
// =============================================================================
// Main entry point for the vqt command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: apply
// - Global options: threads, verbose, quiet, log file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "vqt/common/error.h"
#include "vqt/common/logger.h"
#include "vqt/common/types.h"

#include "commands/apply_command.h"

namespace vqt::commands {
int runApply(CLI::App* app);
}  // namespace vqt::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "vq-tiers: Tranche filtering of variant calls by recalibrated quality score\n"
    "Annotates each call with its VQSLOD and culprit from a recal file and sets\n"
    "its FILTER column from the tranches retained at the chosen truth sensitivity.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int threads = 0;    // 0 = auto-detect
    int verbosity = 0;  // 0 = normal, 1 = debug, 2 = trace
    bool quiet = false;
    bool noProgress = false;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Apply Command Options
// =============================================================================

struct CliApplyOptions {
    std::vector<std::string> inputs;
    std::string recal;
    std::string tranches;
    std::string output = "-";
    double tsFilterLevel = vqt::tier::kDefaultTruthSensitivityLevel;
    std::vector<std::string> ignoreFilters;
    std::string mode = "SNP";
    std::vector<std::string> intervals;
    bool scatterByContig = false;
    std::optional<std::uint64_t> maxSites;
    std::optional<std::size_t> downsampleToCoverage;
    std::uint64_t seed = vqt::traversal::kDefaultDownsampleSeed;
};

CliApplyOptions gApplyOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupApplyCommand(CLI::App& app) {
    auto* apply = app.add_subcommand("apply", "Apply a recalibration to VCF file(s)");
    apply->alias("a");

    // Required options
    apply->add_option("-i,--input", gApplyOpts.inputs,
                      "Input VCF file (repeatable, or '-' for stdin)")
        ->required()
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    apply->add_option("--recal-file", gApplyOpts.recal,
                      "Recal VCF carrying VQSLOD and culprit for every input call")
        ->required()
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    apply->add_option("--tranches-file", gApplyOpts.tranches, "Tranches file")
        ->required()
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    apply->add_option("-o,--output", gApplyOpts.output, "Output VCF file (or '-' for stdout)")
        ->default_val("-");

    // Filtering options
    apply->add_option("--ts-filter-level", gApplyOpts.tsFilterLevel,
                      "Truth sensitivity level at which filtering starts")
        ->default_val(vqt::tier::kDefaultTruthSensitivityLevel)
        ->check(CLI::Range(0.0, 100.0));

    apply->add_option("--ignore-filter", gApplyOpts.ignoreFilters,
                      "Input filter that does not prevent recalibration (repeatable)");

    apply->add_option("-m,--mode", gApplyOpts.mode, "Recalibration mode: SNP, INDEL, BOTH")
        ->default_val("SNP")
        ->check(CLI::IsMember({"SNP", "INDEL", "BOTH"}, CLI::ignore_case));

    // Traversal options
    apply->add_option("-L,--interval", gApplyOpts.intervals,
                      "Interval to process: chr, chr:pos or chr:start-end (repeatable)");

    apply->add_flag("--scatter-by-contig", gApplyOpts.scatterByContig,
                    "Process each contig of the input header as a separate shard");

    apply->add_option("--max-sites", gApplyOpts.maxSites,
                      "Stop each pass after this many sites")
        ->check(CLI::PositiveNumber);

    apply->add_option("--downsample-to-coverage", gApplyOpts.downsampleToCoverage,
                      "Keep at most this many input records per site")
        ->check(CLI::PositiveNumber);

    apply->add_option("--seed", gApplyOpts.seed, "Downsampling seed")
        ->default_val(vqt::traversal::kDefaultDownsampleSeed);
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_option("-t,--threads", gOptions.threads, "Number of threads (0 = auto-detect)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v, -vv for trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    app.add_flag("--no-progress", gOptions.noProgress, "Disable progress reports");

    setupApplyCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    // Initialize logger
    try {
        vqt::log::Config config;
        config.logFile = gOptions.logFile;
        config.level = vqt::log::levelForVerbosity(gOptions.verbosity, gOptions.quiet);
        vqt::log::init(config);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("apply")) {
            exitCode = vqt::commands::runApply(app.get_subcommand("apply"));
        }
    } catch (const vqt::VqtException& ex) {
        VQT_LOG_ERROR("Error: {}", std::string(ex.what()));
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        VQT_LOG_ERROR("Unexpected error: {}", std::string(ex.what()));
        exitCode = EXIT_FAILURE;
    }

    vqt::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace vqt::commands {

int runApply([[maybe_unused]] CLI::App* app) {
    ApplyOptions opts;
    opts.inputPaths.assign(gApplyOpts.inputs.begin(), gApplyOpts.inputs.end());
    opts.recalPath = gApplyOpts.recal;
    opts.tranchesPath = gApplyOpts.tranches;
    opts.outputPath = gApplyOpts.output;
    opts.truthSensitivityLevel = gApplyOpts.tsFilterLevel;
    opts.ignoreFilters = gApplyOpts.ignoreFilters;
    opts.intervals = gApplyOpts.intervals;
    opts.scatterByContig = gApplyOpts.scatterByContig;
    opts.maxSites = gApplyOpts.maxSites;
    opts.downsampleToCoverage = gApplyOpts.downsampleToCoverage;
    opts.seed = gApplyOpts.seed;
    opts.threads = gOptions.threads;
    opts.showProgress = !gOptions.noProgress;

    auto mode = parseVariantMode(gApplyOpts.mode);
    if (!mode) {
        throw UsageError("Invalid mode: " + gApplyOpts.mode);
    }
    opts.mode = *mode;

    auto cmd = std::make_unique<ApplyCommand>(std::move(opts));
    return cmd->execute();
}

}  // namespace vqt::commands
