// ========================= src/core/Solver.hpp =========================
#pragma once
#include "Search.hpp"
#include <future>

namespace pour {

    struct SolveResult {
        bool solved{ false };
        MoveList moves;          // indices into the input rows followed by emptyBottles empty bottles
        int emptyBottles{ 0 };   // count used; the last count tried when !solved
        SolveParams params{};
        SearchStats stats{};     // of the final search attempt
    };

    class Solver {
    public:
        // throws std::invalid_argument on capacity <= 0 or bad empty-bottle bounds
        explicit Solver(SolveParams params = {});

        // Tries minEmpty..maxEmpty extra empty bottles in turn and returns the
        // first solution. Throws CapacityError for a row longer than capacity.
        SolveResult solve(const Matrix& rows, SolvingMethod method) const;

        const SolveParams& params() const { return p; }

    private:
        SolveParams p;
    };

    // Runs Solver::solve on its own thread; exceptions arrive through the future.
    std::future<SolveResult> solveAsync(Matrix rows, SolvingMethod method, SolveParams params = {});

} // namespace pour
