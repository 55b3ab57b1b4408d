// =============================================================================
// vq-tiers - Shard Runner
// =============================================================================
// Runs independent traversals over disjoint coordinate ranges in parallel
// and merges their accumulators.
//
// Each shard writes its result into its own slot; slots are then merged by a
// pairwise tree reduction in index order, so the merge order is fixed no
// matter in which order shards finish.
// =============================================================================

#ifndef VQT_TRAVERSAL_SHARD_RUNNER_H
#define VQT_TRAVERSAL_SHARD_RUNNER_H

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

namespace vqt::traversal {

/// @brief Merge values by combining adjacent pairs, level by level.
///
/// ((v0 v1) (v2 v3)) (v4) ... An odd value at the end of a level is carried
/// up unchanged. For an associative combine this equals the left fold.
/// @return zero() if @p values is empty
template <typename Acc, typename Zero, typename Combine>
[[nodiscard]] Acc treeReduce(std::vector<Acc> values, Zero&& zero, Combine&& combine) {
    if (values.empty()) {
        return zero();
    }

    while (values.size() > 1) {
        std::vector<Acc> next;
        next.reserve((values.size() + 1) / 2);
        for (std::size_t i = 0; i + 1 < values.size(); i += 2) {
            next.push_back(combine(std::move(values[i]), std::move(values[i + 1])));
        }
        if (values.size() % 2 == 1) {
            next.push_back(std::move(values.back()));
        }
        values = std::move(next);
    }
    return std::move(values.front());
}

/// @brief Run one pass per shard on up to @p threads threads.
/// @param shards Shard descriptions, in coordinate order
/// @param runShard Runs one shard; receives the shard and its index
/// @param threads Worker threads (0 = TBB default)
/// @note An exception thrown by any shard propagates to the caller.
template <typename Shard, typename Acc>
[[nodiscard]] Acc runSharded(const std::vector<Shard>& shards,
                             const std::function<Acc(const Shard&, std::size_t)>& runShard,
                             const std::function<Acc()>& zero,
                             const std::function<Acc(Acc, Acc)>& combine,
                             std::size_t threads = 0) {
    std::vector<std::optional<Acc>> slots(shards.size());

    auto body = [&] {
        tbb::parallel_for(tbb::blocked_range<std::size_t>(0, shards.size(), 1),
                          [&](const tbb::blocked_range<std::size_t>& range) {
                              for (std::size_t i = range.begin(); i != range.end(); ++i) {
                                  slots[i] = runShard(shards[i], i);
                              }
                          });
    };

    if (threads > 0) {
        tbb::task_arena arena(static_cast<int>(threads));
        arena.execute(body);
    } else {
        body();
    }

    std::vector<Acc> results;
    results.reserve(slots.size());
    for (auto& slot : slots) {
        results.push_back(std::move(*slot));
    }
    return treeReduce(std::move(results), zero, combine);
}

}  // namespace vqt::traversal

#endif  // VQT_TRAVERSAL_SHARD_RUNNER_H
