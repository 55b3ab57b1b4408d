// =============================================================================
// vq-tiers - Genomic Interval Implementation
// =============================================================================

#include "vqt/traversal/interval.h"

#include <algorithm>
#include <charconv>
#include <utility>

#include <fmt/format.h>

namespace vqt::traversal {

namespace {

[[nodiscard]] std::optional<Position> parsePosition(std::string_view text) {
    std::string digits;
    digits.reserve(text.size());
    for (char c : text) {
        if (c != ',') {
            digits.push_back(c);
        }
    }
    if (digits.empty()) {
        return std::nullopt;
    }

    Position value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size() || value < 1) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::string Interval::toString() const {
    if (isWholeContig()) {
        return contig;
    }
    return fmt::format("{}:{}-{}", contig, start, end);
}

Result<Interval> parseInterval(std::string_view text) {
    if (text.empty()) {
        return makeError<Interval>(ErrorCode::kUsageError, "Empty interval");
    }

    Interval interval;
    auto colon = text.rfind(':');
    if (colon == std::string_view::npos) {
        interval.contig = std::string(text);
        return interval;
    }

    interval.contig = std::string(text.substr(0, colon));
    if (interval.contig.empty()) {
        return makeError<Interval>(ErrorCode::kUsageError,
                                   fmt::format("Interval '{}' has no contig", text));
    }

    auto range = text.substr(colon + 1);
    auto dash = range.find('-');
    auto start = parsePosition(range.substr(0, dash));
    if (!start) {
        return makeError<Interval>(ErrorCode::kUsageError,
                                   fmt::format("Interval '{}' has an invalid start", text));
    }
    interval.start = *start;
    interval.end = *start;

    if (dash != std::string_view::npos) {
        auto endText = range.substr(dash + 1);
        if (!endText.empty()) {
            auto end = parsePosition(endText);
            if (!end || *end < *start) {
                return makeError<Interval>(ErrorCode::kUsageError,
                                           fmt::format("Interval '{}' has an invalid end", text));
            }
            interval.end = *end;
        } else {
            interval.end = std::numeric_limits<Position>::max();
        }
    }

    return interval;
}

std::vector<Interval> normalizeIntervals(std::vector<Interval> intervals,
                                         ContigDictionary& dictionary) {
    std::vector<std::pair<ContigRank, Interval>> ranked;
    ranked.reserve(intervals.size());
    for (auto& interval : intervals) {
        ContigRank rank = dictionary.rankOf(interval.contig);
        ranked.emplace_back(rank, std::move(interval));
    }

    std::stable_sort(ranked.begin(), ranked.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.first < rhs.first || (lhs.first == rhs.first && lhs.second.start < rhs.second.start);
    });

    std::vector<Interval> merged;
    merged.reserve(ranked.size());
    for (auto& [rank, interval] : ranked) {
        if (!merged.empty() && merged.back().contig == interval.contig &&
            (merged.back().end == std::numeric_limits<Position>::max() ||
             interval.start <= merged.back().end + 1)) {
            merged.back().end = std::max(merged.back().end, interval.end);
            continue;
        }
        merged.push_back(std::move(interval));
    }
    return merged;
}

std::vector<Interval> intervalsForContigs(const ContigDictionary& dictionary) {
    std::vector<Interval> intervals;
    intervals.reserve(dictionary.size());
    for (const auto& name : dictionary.names()) {
        intervals.push_back(Interval{name});
    }
    return intervals;
}

}  // namespace vqt::traversal
