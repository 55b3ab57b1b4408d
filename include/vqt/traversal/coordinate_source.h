// =============================================================================
// vq-tiers - Coordinate Sources
// =============================================================================
// Abstract inputs of a traversal.
//
// This module provides:
// - SiteSource: Lazy, finite, non-restartable sequence of site coordinates
// - CoordinateSource<Entry>: Lazy sequence of coordinate-sorted entries
// - VectorSiteSource / VectorCoordinateSource: In-memory implementations
// - MergedCoordinateSource: K-way merge of several sorted sources
// =============================================================================

#ifndef VQT_TRAVERSAL_COORDINATE_SOURCE_H
#define VQT_TRAVERSAL_COORDINATE_SOURCE_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "vqt/common/types.h"

namespace vqt::traversal {

// =============================================================================
// Interfaces
// =============================================================================

/// @brief Produces site coordinates in non-decreasing order.
class SiteSource {
public:
    virtual ~SiteSource() = default;

    /// @brief Next site, or nullopt when exhausted.
    [[nodiscard]] virtual std::optional<Coordinate> next() = 0;
};

/// @brief Produces entries sorted by (rank, start).
/// @tparam Entry Coordinate-keyed entry type
template <CoordinateKeyed Entry>
class CoordinateSource {
public:
    virtual ~CoordinateSource() = default;

    /// @brief Next entry without consuming it; nullptr when exhausted.
    /// @note The pointer is valid until the next pop().
    [[nodiscard]] virtual const Entry* peek() = 0;

    /// @brief Consume and return the next entry.
    [[nodiscard]] virtual std::optional<Entry> pop() = 0;

    /// @brief Name used in log and error messages.
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// =============================================================================
// In-Memory Implementations
// =============================================================================

/// @brief Site source over a pre-built list of coordinates.
class VectorSiteSource final : public SiteSource {
public:
    explicit VectorSiteSource(std::vector<Coordinate> sites) : sites_(std::move(sites)) {}

    [[nodiscard]] std::optional<Coordinate> next() override {
        if (index_ >= sites_.size()) {
            return std::nullopt;
        }
        return sites_[index_++];
    }

private:
    std::vector<Coordinate> sites_;
    std::size_t index_ = 0;
};

/// @brief Coordinate source over a pre-built, sorted list of entries.
template <CoordinateKeyed Entry>
class VectorCoordinateSource final : public CoordinateSource<Entry> {
public:
    explicit VectorCoordinateSource(std::vector<Entry> entries, std::string name = "memory")
        : entries_(std::move(entries)), name_(std::move(name)) {}

    [[nodiscard]] const Entry* peek() override {
        return index_ < entries_.size() ? &entries_[index_] : nullptr;
    }

    [[nodiscard]] std::optional<Entry> pop() override {
        if (index_ >= entries_.size()) {
            return std::nullopt;
        }
        return entries_[index_++];
    }

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

private:
    std::vector<Entry> entries_;
    std::size_t index_ = 0;
    std::string name_;
};

/// @brief Merges several sorted sources into one sorted stream.
/// @note Ties are broken by source order, so the merge is stable.
template <CoordinateKeyed Entry>
class MergedCoordinateSource final : public CoordinateSource<Entry> {
public:
    explicit MergedCoordinateSource(std::vector<CoordinateSource<Entry>*> sources,
                                    std::string name = "merged")
        : sources_(std::move(sources)), name_(std::move(name)) {}

    [[nodiscard]] const Entry* peek() override {
        auto* source = nextSource();
        return source != nullptr ? source->peek() : nullptr;
    }

    [[nodiscard]] std::optional<Entry> pop() override {
        auto* source = nextSource();
        if (source == nullptr) {
            return std::nullopt;
        }
        return source->pop();
    }

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

private:
    [[nodiscard]] CoordinateSource<Entry>* nextSource() {
        CoordinateSource<Entry>* best = nullptr;
        const Entry* bestEntry = nullptr;
        for (auto* source : sources_) {
            const Entry* candidate = source->peek();
            if (candidate == nullptr) {
                continue;
            }
            if (bestEntry == nullptr || startsBefore(*candidate, *bestEntry)) {
                best = source;
                bestEntry = candidate;
            }
        }
        return best;
    }

    [[nodiscard]] static bool startsBefore(const Entry& lhs, const Entry& rhs) noexcept {
        const Coordinate& a = lhs.coordinate();
        const Coordinate& b = rhs.coordinate();
        return a.rank() < b.rank() || (a.rank() == b.rank() && a.start() < b.start());
    }

    std::vector<CoordinateSource<Entry>*> sources_;
    std::string name_;
};

}  // namespace vqt::traversal

#endif  // VQT_TRAVERSAL_COORDINATE_SOURCE_H
