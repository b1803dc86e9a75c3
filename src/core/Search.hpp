// ========================= src/core/Search.hpp =========================
#pragma once
#include "Layout.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace pour {

    using MoveList = std::vector<Move>;

    struct SearchStats {
        size_t expanded{ 0 };     // nodes whose pours were enumerated
        size_t generated{ 0 };    // child layouts produced
        size_t duplicates{ 0 };   // children dropped by the visited set
        size_t pruned{ 0 };       // nodes rejected by the metric filter
        size_t peakFrontier{ 0 };
    };

    // Count of adjacent equal-color layer pairs over all bottles.
    // A full monochrome bottle contributes capacity - 1.
    int sortedness(const Layout& s);

    // Depth-first search over legal pours (LIFO frontier, no pruning).
    // Finds some solution quickly; no bound on its length.
    std::optional<MoveList> searchDepthFirst(const Layout& start, SearchStats* stats = nullptr);

    // Priority search ordered by move count, then by sortedness (higher first).
    // A node is dropped when the best sortedness already seen at its move count
    // exceeds its own by more than `tolerance`, both when queued and when popped.
    // Beam heuristic: the result is usually, not provably, the shortest.
    std::optional<MoveList> searchPriority(const Layout& start, int tolerance, SearchStats* stats = nullptr);

} // namespace pour
