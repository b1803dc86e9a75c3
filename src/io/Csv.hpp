// ========================= src/io/Csv.hpp =========================
#pragma once
#include "../core/Search.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace pour {

    struct PuzzleRow {
        int index{ 0 };                       // puzzle number
        Matrix rows;                          // e.g. 1_2_1_2#2_1_2_1#  (last bottle empty)
        std::optional<SolvingMethod> method;  // empty column -> caller's default
    };

    struct SolutionRow {
        int index{ 0 };
        SolvingMethod method{ SolvingMethod::Fastest };
        bool solved{ false };
        int emptyBottles{ 0 };
        MoveList moves;                       // written as "0>2 1>0 ..."
    };

    // puzzles:   index,map,method
    // solutions: index,method,solved,emptyBottles,moveCount,moves
    // Malformed content throws std::invalid_argument naming the line.
    struct CsvIO {
        static std::string encodeMap(const Matrix& m);
        static Matrix decodeMap(const std::string& map);
        static std::string encodeMoves(const MoveList& moves);
        static MoveList decodeMoves(const std::string& moves);

        static std::vector<PuzzleRow> readPuzzles(std::istream& in);
        static void writePuzzles(std::ostream& out, const std::vector<PuzzleRow>& rows, bool header = true);
        static void writeSolutions(std::ostream& out, const std::vector<SolutionRow>& rows, bool header = true);

        static std::vector<PuzzleRow> loadPuzzles(const std::string& path); // empty when the file cannot be opened
        static bool savePuzzles(const std::string& path, const std::vector<PuzzleRow>& rows, bool appendIfExists = false);
        static bool saveSolutions(const std::string& path, const std::vector<SolutionRow>& rows, bool appendIfExists = false);
    };

} // namespace pour
