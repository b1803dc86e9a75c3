//
// Test-only puzzle synthesis.
//
// Starts from a solved layout (one full bottle per color plus empty bottles)
// and applies random reverse pours. Every reverse pour is undone by exactly
// one legal forward pour, so the scrambled rows stay solvable without any
// extra empty bottle. Bottles here only need to be empty or full at the start;
// color uniformity of the final state is checked by the real Bottle rule.
//
#pragma once

#include <cstdint>
#include <vector>

#include "../src/core/Types.hpp"

namespace scrambler {

    struct RNG {
        uint64_t s = 0x9E3779B97F4A7C15ULL;

        static uint64_t rotl(uint64_t x, int r) { return (x << r) | (x >> (64 - r)); }
        uint64_t next() { s ^= rotl(s, 7); s ^= (s >> 9); return s * 0x9E3779B97F4A7C15ULL; }
        int irange(int lo, int hi) { return lo + int(next() % uint64_t(hi - lo + 1)); }
    };

    struct ReversePour { int from; int to; int amount; };

    inline int topRun(const std::vector<pour::Color>& b) {
        int n = 0;
        for (int i = (int)b.size() - 1; i >= 0 && b[i] == b.back(); --i) ++n;
        return n;
    }

    // Reverse pours available in m, in (from, to, amount) order.
    inline std::vector<ReversePour> reversePours(const pour::Matrix& m, int capacity) {
        std::vector<ReversePour> out;
        for (int x = 0; x < (int)m.size(); ++x) {
            const auto& X = m[x];
            if (X.empty()) continue;
            const pour::Color c = X.back();
            const int run = topRun(X);
            for (int y = 0; y < (int)m.size(); ++y) {
                if (y == x) continue;
                const auto& Y = m[y];
                for (int k = 1; k <= run; ++k) {
                    if ((int)Y.size() + k > capacity) break;
                    // the forward pour back needs a matching top (or empty bottle) at x
                    if (k == run && (int)X.size() > run) continue;
                    // and must move exactly k layers
                    bool runStops = Y.empty() || Y.back() != c;
                    bool destFills = (int)X.size() == capacity;
                    if (!runStops && !destFills) continue;
                    out.push_back(ReversePour{ x, y, k });
                }
            }
        }
        return out;
    }

    // Rows of a solvable puzzle: `colors` colors, `empty` bottles of slack.
    inline pour::Matrix scramble(int colors, int empty, int capacity, int steps, uint64_t seed) {
        RNG rng;
        rng.s = seed ? seed : 0xBADC0FFEEULL;

        pour::Matrix m;
        for (int c = 0; c < colors; ++c) m.emplace_back(capacity, pour::Color(c + 1));
        for (int e = 0; e < empty; ++e) m.emplace_back();

        int lastFrom = -1, lastTo = -1;
        for (int step = 0; step < steps; ++step) {
            std::vector<ReversePour> cand;
            for (const auto& rp : reversePours(m, capacity)) {
                // avoid undoing the previous step straight away
                if (rp.from == lastTo && rp.to == lastFrom) continue;
                cand.push_back(rp);
            }
            if (cand.empty()) break;
            const ReversePour rp = cand[rng.irange(0, (int)cand.size() - 1)];
            for (int i = 0; i < rp.amount; ++i) {
                m[rp.to].push_back(m[rp.from].back());
                m[rp.from].pop_back();
            }
            lastFrom = rp.from; lastTo = rp.to;
        }
        return m;
    }

} // namespace scrambler
