// ========================= src/io/SolutionText.hpp =========================
#pragma once
#include "../core/Solver.hpp"
#include <string>
#include <vector>

namespace pour {

    // "Add 2 empty bottle(s), then pour:" followed by "1. 3 -> 5" lines, 1-based.
    std::string formatSolution(const SolveResult& res);

    // Bottle contents after each move, starting with the extended input layout.
    // Throws IndexError or TransfusionError when a move does not fit the layout.
    std::vector<Layout> replay(const Matrix& rows, const SolveResult& res);

    // One line per bottle, e.g. "  3: [1,1,2]"
    std::string formatLayout(const Layout& s);

} // namespace pour
