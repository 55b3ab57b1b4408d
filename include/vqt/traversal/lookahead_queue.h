// =============================================================================
// vq-tiers - Lookahead Coordinate Queue
// =============================================================================
// Bounded lookahead buffer over one coordinate-sorted auxiliary source.
//
// After seek(site), peek() returns exactly the entries of the source that
// overlap the site. Entries entirely before the site are discarded, entries
// starting after it stay in the source. Entries pulled for a wide site that do
// not overlap a later, narrower site stay buffered but are not returned.
//
// Usage:
//   LookaheadCoordinateQueue<VariantRecord> queue(reader);
//   for (const auto& record : queue.seek(site).peek()) { ... }
// =============================================================================

#ifndef VQT_TRAVERSAL_LOOKAHEAD_QUEUE_H
#define VQT_TRAVERSAL_LOOKAHEAD_QUEUE_H

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "vqt/common/error.h"
#include "vqt/common/types.h"
#include "vqt/traversal/coordinate_source.h"

namespace vqt::traversal {

/// @brief Forward-only window of a CoordinateSource around the current site.
/// @tparam Entry Coordinate-keyed entry type
template <CoordinateKeyed Entry>
class LookaheadCoordinateQueue {
public:
    explicit LookaheadCoordinateQueue(CoordinateSource<Entry>& source) : source_(source) {}

    LookaheadCoordinateQueue(const LookaheadCoordinateQueue&) = delete;
    LookaheadCoordinateQueue& operator=(const LookaheadCoordinateQueue&) = delete;

    /// @brief Advance the window to @p site.
    /// @throws SequenceOrderViolation if @p site is before the previous site,
    ///         or if the source yields entries out of order.
    LookaheadCoordinateQueue& seek(const Coordinate& site) {
        if (lastSite_ && site < *lastSite_) {
            throw SequenceOrderViolation(
                fmt::format("Seek to {} after {} on source '{}'", site.toString(),
                            lastSite_->toString(), source_.name()),
                ErrorContext{std::string(source_.name())}.withLocus(site.toString()));
        }
        lastSite_ = site;

        std::erase_if(buffer_,
                      [&site](const Entry& entry) { return entry.coordinate().isBefore(site); });

        while (const Entry* next = source_.peek()) {
            if (next->coordinate().isPast(site)) {
                break;
            }
            auto entry = source_.pop();
            if (!entry) {
                break;
            }
            checkOrder(entry->coordinate());
            if (entry->coordinate().isBefore(site)) {
                continue;
            }
            buffer_.push_back(std::move(*entry));
        }

        window_.clear();
        for (const auto& entry : buffer_) {
            if (entry.coordinate().overlaps(site)) {
                window_.push_back(entry);
            }
        }

        peakBuffered_ = std::max(peakBuffered_, buffer_.size());
        return *this;
    }

    /// @brief Entries overlapping the last sought site, in source order.
    [[nodiscard]] const std::vector<Entry>& peek() const noexcept { return window_; }

    /// @brief Overlapping entries whose start equals the site's start.
    [[nodiscard]] std::vector<Entry> peekStartingAt() const {
        std::vector<Entry> result;
        if (!lastSite_) {
            return result;
        }
        for (const auto& entry : window_) {
            if (entry.coordinate().start() == lastSite_->start()) {
                result.push_back(entry);
            }
        }
        return result;
    }

    [[nodiscard]] std::size_t bufferedCount() const noexcept { return buffer_.size(); }

    /// @brief Largest buffer size seen over the pass.
    [[nodiscard]] std::size_t peakBuffered() const noexcept { return peakBuffered_; }

    [[nodiscard]] const std::optional<Coordinate>& lastSite() const noexcept { return lastSite_; }

private:
    void checkOrder(const Coordinate& coordinate) {
        if (lastPulled_) {
            bool backwards = coordinate.rank() < lastPulled_->rank() ||
                             (coordinate.rank() == lastPulled_->rank() &&
                              coordinate.start() < lastPulled_->start());
            if (backwards) {
                throw SequenceOrderViolation(
                    fmt::format("Source '{}' is not coordinate sorted: {} follows {}",
                                source_.name(), coordinate.toString(),
                                lastPulled_->toString()),
                    ErrorContext{std::string(source_.name())}.withLocus(coordinate.toString()));
            }
        }
        lastPulled_ = coordinate;
    }

    CoordinateSource<Entry>& source_;
    std::vector<Entry> buffer_;
    std::vector<Entry> window_;
    std::optional<Coordinate> lastSite_;
    std::optional<Coordinate> lastPulled_;
    std::size_t peakBuffered_ = 0;
};

}  // namespace vqt::traversal

#endif  // VQT_TRAVERSAL_LOOKAHEAD_QUEUE_H
