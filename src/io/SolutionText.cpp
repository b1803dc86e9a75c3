// ========================= src/io/SolutionText.cpp =========================
#include "SolutionText.hpp"
#include <sstream>
#include <utility>

namespace pour {

    std::string formatSolution(const SolveResult& res) {
        std::ostringstream oss;
        if (!res.solved) {
            oss << "No solution with up to " << res.emptyBottles << " empty bottle(s).\n";
            return oss.str();
        }
        if (res.moves.empty()) {
            oss << "Already solved.\n";
            return oss.str();
        }
        if (res.emptyBottles > 0) oss << "Add " << res.emptyBottles << " empty bottle(s), then pour:\n";
        else oss << "Pour:\n";
        for (size_t i = 0; i < res.moves.size(); ++i) {
            oss << (i + 1) << ". " << (res.moves[i].from + 1) << " -> " << (res.moves[i].to + 1) << "\n";
        }
        return oss.str();
    }

    std::vector<Layout> replay(const Matrix& rows, const SolveResult& res) {
        std::vector<Layout> frames;
        frames.reserve(res.moves.size() + 1);
        frames.emplace_back(rows, res.params.capacity, res.emptyBottles);
        for (const auto& m : res.moves) {
            Layout next = frames.back();
            next.apply(m);
            frames.push_back(std::move(next));
        }
        return frames;
    }

    std::string formatLayout(const Layout& s) {
        std::ostringstream oss;
        for (int i = 0; i < s.bottleCount(); ++i) {
            oss << "  " << (i + 1) << ": [" << s.bottle(i).toString() << "]\n";
        }
        return oss.str();
    }

} // namespace pour
