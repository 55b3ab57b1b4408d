// =============================================================================
// vq-tiers - Tranches File Parser Implementation
// =============================================================================

#include "vqt/io/tranche_parser.h"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string_view>

#include <fmt/format.h>

#include "vqt/common/error.h"
#include "vqt/common/logger.h"
#include "vqt/io/compressed_stream.h"

namespace vqt::io {

namespace {

constexpr std::string_view kTruthSensitivityColumn = "targetTruthSensitivity";
constexpr std::string_view kMinScoreColumn = "minVQSLod";
constexpr std::string_view kFilterNameColumn = "filterName";
constexpr std::string_view kModelColumn = "model";

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() &&
           (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return text;
}

std::vector<std::string_view> splitRow(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t begin = 0;
    while (true) {
        auto pos = line.find(',', begin);
        if (pos == std::string_view::npos) {
            fields.push_back(trim(line.substr(begin)));
            return fields;
        }
        fields.push_back(trim(line.substr(begin, pos - begin)));
        begin = pos + 1;
    }
}

/// @brief Column positions resolved from the header row.
struct ColumnLayout {
    std::size_t truthSensitivity = 0;
    std::size_t minScore = 0;
    std::size_t filterName = 0;
    std::optional<std::size_t> model;

    [[nodiscard]] std::size_t requiredWidth() const noexcept {
        std::size_t width = std::max({truthSensitivity, minScore, filterName}) + 1;
        if (model) {
            width = std::max(width, *model + 1);
        }
        return width;
    }
};

ColumnLayout resolveColumns(const std::vector<std::string_view>& header,
                            const ErrorContext& context) {
    auto find = [&header](std::string_view name) -> std::optional<std::size_t> {
        for (std::size_t i = 0; i < header.size(); ++i) {
            if (header[i] == name) {
                return i;
            }
        }
        return std::nullopt;
    };

    auto require = [&](std::string_view name) {
        auto index = find(name);
        if (!index) {
            throw FormatError(fmt::format("Tranches file is missing the '{}' column", name),
                              context);
        }
        return *index;
    };

    ColumnLayout layout;
    layout.truthSensitivity = require(kTruthSensitivityColumn);
    layout.minScore = require(kMinScoreColumn);
    layout.filterName = require(kFilterNameColumn);
    layout.model = find(kModelColumn);
    return layout;
}

double parseNumber(std::string_view text, std::string_view column, const ErrorContext& context) {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        throw FormatError(fmt::format("Invalid {} value '{}'", column, text), context);
    }
    return value;
}

}  // namespace

std::vector<tier::Tranche> readTranches(std::istream& input, const std::string& sourceName) {
    std::vector<tier::Tranche> tranches;
    std::optional<ColumnLayout> layout;
    std::string line;
    std::uint64_t lineNumber = 0;

    while (std::getline(input, line)) {
        ++lineNumber;
        auto text = trim(line);
        if (text.empty() || text.front() == '#') {
            continue;
        }

        auto context = ErrorContext{sourceName}.withLine(lineNumber);
        auto fields = splitRow(text);

        if (!layout) {
            layout = resolveColumns(fields, context);
            continue;
        }

        if (fields.size() < layout->requiredWidth()) {
            throw FormatError(fmt::format("Tranche row has {} columns, expected at least {}",
                                          fields.size(), layout->requiredWidth()),
                              context);
        }

        tier::Tranche tranche;
        tranche.truthSensitivity =
            parseNumber(fields[layout->truthSensitivity], kTruthSensitivityColumn, context);
        tranche.minScore = parseNumber(fields[layout->minScore], kMinScoreColumn, context);
        tranche.name = std::string(fields[layout->filterName]);
        if (tranche.name.empty()) {
            throw FormatError("Tranche row has an empty filterName", context);
        }

        if (layout->model) {
            auto model = parseVariantMode(fields[*layout->model]);
            if (!model) {
                throw FormatError(
                    fmt::format("Invalid model value '{}'", fields[*layout->model]), context);
            }
            tranche.model = *model;
        }

        tranches.push_back(std::move(tranche));
    }

    if (input.bad()) {
        throw IOError("Read failure on " + sourceName);
    }

    VQT_LOG_DEBUG("{}: {} tranches read", sourceName, tranches.size());
    return tranches;
}

std::vector<tier::Tranche> readTranchesFile(const std::filesystem::path& path) {
    auto stream = openInputFile(path);
    return readTranches(*stream, path.string());
}

}  // namespace vqt::io
