// ========================= src/cli/Options.hpp =========================
#pragma once
#include "../core/Types.hpp"
#include <string>

namespace pour {

    struct CliOptions {
        std::string inPath{ "puzzles.csv" };
        std::string outPath;                  // empty => no solution CSV
        SolvingMethod method{ SolvingMethod::Fastest }; // for rows without a method column
        SolveParams params{};
        std::string logLevel{ "info" };
        bool quiet{ false };                  // no step listing on stdout
        bool showHelp{ false };
    };

    // Flags are --key=value (or bare --quiet / --help). Unknown flags and
    // malformed values throw std::invalid_argument.
    CliOptions parseArgs(int argc, const char* const* argv);

    std::string usage();

} // namespace pour
