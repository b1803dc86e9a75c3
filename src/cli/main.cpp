// ========================= src/cli/main.cpp =========================
#include "Options.hpp"
#include "../core/Errors.hpp"
#include "../core/Log.hpp"
#include "../core/Solver.hpp"
#include "../io/Csv.hpp"
#include "../io/SolutionText.hpp"
#include <filesystem>
#include <iostream>
#include <memory>

using namespace pour;

int main(int argc, char* argv[]) {
    CliOptions cfg;
    try {
        cfg = parseArgs(argc, argv);
        setLogLevel(cfg.logLevel);
    }
    catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n" << usage();
        return 2;
    }
    if (cfg.showHelp) { std::cout << usage(); return 0; }

    if (!std::filesystem::exists(cfg.inPath)) {
        log()->error("puzzle file '{}' not found", cfg.inPath);
        return 2;
    }

    std::vector<PuzzleRow> puzzles;
    try {
        puzzles = CsvIO::loadPuzzles(cfg.inPath);
    }
    catch (const std::invalid_argument& e) {
        log()->error("{}: {}", cfg.inPath, e.what());
        return 2;
    }
    log()->info("loaded {} puzzle(s) from {}", puzzles.size(), cfg.inPath);

    std::unique_ptr<Solver> solver;
    try {
        solver = std::make_unique<Solver>(cfg.params);
    }
    catch (const std::invalid_argument& e) {
        log()->error("{}", e.what());
        return 2;
    }

    std::vector<SolutionRow> solutions;
    int failures = 0;
    for (const auto& pz : puzzles) {
        SolutionRow row;
        row.index = pz.index;
        row.method = pz.method.value_or(cfg.method);
        try {
            SolveResult res = solver->solve(pz.rows, row.method);
            row.solved = res.solved;
            row.emptyBottles = res.emptyBottles;
            row.moves = res.moves;
            if (!res.solved) ++failures;
            if (!cfg.quiet) std::cout << "#" << pz.index << " (" << toString(row.method) << ")\n" << formatSolution(res);
        }
        catch (const std::logic_error& e) {
            // CapacityError and bad parameters: skip this puzzle, keep going
            log()->error("puzzle #{}: {}", pz.index, e.what());
            row.emptyBottles = cfg.params.maxEmpty;
            ++failures;
        }
        solutions.push_back(std::move(row));
    }

    if (!cfg.outPath.empty()) {
        if (!CsvIO::saveSolutions(cfg.outPath, solutions)) {
            log()->error("cannot write '{}'", cfg.outPath);
            return 1;
        }
        log()->info("wrote {} solution row(s) to {}", solutions.size(), cfg.outPath);
    }

    if (failures > 0) log()->warn("{} of {} puzzle(s) unsolved", failures, puzzles.size());
    return failures > 0 ? 1 : 0;
}
