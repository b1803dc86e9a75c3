// ========================= src/core/Solver.cpp =========================
#include "Solver.hpp"
#include "Log.hpp"
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace pour {

    Solver::Solver(SolveParams params) :p(params) {
        if (p.capacity <= 0) throw std::invalid_argument("capacity must be positive, got " + std::to_string(p.capacity));
        if (p.minEmpty < 0) throw std::invalid_argument("minimum empty bottle count must be non-negative");
        if (p.maxEmpty < p.minEmpty) {
            throw std::invalid_argument("maximum empty bottle count " + std::to_string(p.maxEmpty) +
                " is below the minimum " + std::to_string(p.minEmpty));
        }
    }

    SolveResult Solver::solve(const Matrix& rows, SolvingMethod method) const {
        using clock = std::chrono::steady_clock;
        auto t0 = clock::now();
        auto elapsedMs = [&] { return std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - t0).count(); };

        // validates every row before any search starts
        const Layout base(rows, p.capacity);

        SolveResult res;
        res.params = p;
        res.emptyBottles = p.maxEmpty;

        for (int empty = p.minEmpty; empty <= p.maxEmpty; ++empty) {
            Layout start = base.withEmptyBottles(empty);
            SearchStats stats;
            std::optional<MoveList> found;

            log()->debug("{}: trying {} bottles ({} empty)", toString(method), start.bottleCount(), empty);
            switch (method) {
            case SolvingMethod::Balanced:
            case SolvingMethod::Shortest:
                found = searchPriority(start, toleranceFor(method), &stats);
                break;
            case SolvingMethod::Fastest:
            default:
                found = searchDepthFirst(start, &stats);
                break;
            }
            log()->debug("  expanded={} generated={} duplicates={} pruned={} peak={}",
                stats.expanded, stats.generated, stats.duplicates, stats.pruned, stats.peakFrontier);

            res.stats = stats;
            if (found) {
                res.solved = true;
                res.moves = std::move(*found);
                res.emptyBottles = empty;
                log()->info("{}: solved in {} moves with {} empty bottle(s), {} ms",
                    toString(method), res.moves.size(), empty, elapsedMs());
                return res;
            }
        }

        log()->info("{}: no solution with up to {} empty bottle(s), {} ms", toString(method), p.maxEmpty, elapsedMs());
        return res;
    }

    std::future<SolveResult> solveAsync(Matrix rows, SolvingMethod method, SolveParams params) {
        return std::async(std::launch::async, [rows = std::move(rows), method, params] {
            return Solver(params).solve(rows, method);
        });
    }

} // namespace pour
