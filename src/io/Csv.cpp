// ========================= src/io/Csv.cpp =========================
#include "Csv.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace pour {

    // keeps empty tokens: "1_2##" -> {"1_2", "", ""}
    static std::vector<std::string> split(const std::string& s, char sep) {
        std::vector<std::string> out; std::string cur;
        for (char ch : s) {
            if (ch == sep) { out.push_back(cur); cur.clear(); }
            else cur.push_back(ch);
        }
        out.push_back(cur);
        return out;
    }

    static std::string trim(const std::string& s) {
        size_t b = s.find_first_not_of(" \t\r");
        if (b == std::string::npos) return "";
        size_t e = s.find_last_not_of(" \t\r");
        return s.substr(b, e - b + 1);
    }

    static int toInt(const std::string& s, const char* what) {
        size_t used = 0; int v = 0;
        try { v = std::stoi(s, &used); }
        catch (const std::exception&) { used = 0; }
        if (used == 0 || used != s.size()) throw std::invalid_argument(std::string("bad ") + what + " '" + s + "'");
        return v;
    }

    std::string CsvIO::encodeMap(const Matrix& m) {
        std::ostringstream oss;
        for (size_t i = 0; i < m.size(); ++i) {
            for (size_t k = 0; k < m[i].size(); ++k) {
                if (k) oss << '_';
                oss << int(m[i][k]);
            }
            if (i + 1 < m.size()) oss << '#';
        }
        return oss.str();
    }

    Matrix CsvIO::decodeMap(const std::string& map) {
        Matrix m;
        if (trim(map).empty()) return m;
        for (const auto& token : split(trim(map), '#')) {
            std::vector<Color> bottle;
            if (!token.empty()) {
                for (const auto& cell : split(token, '_')) {
                    int v = toInt(cell, "color");
                    if (v < 0 || v > 255) throw std::invalid_argument("color " + cell + " is outside 0..255");
                    bottle.push_back((Color)v);
                }
            }
            m.push_back(std::move(bottle));
        }
        return m;
    }

    std::string CsvIO::encodeMoves(const MoveList& moves) {
        std::ostringstream oss;
        for (size_t i = 0; i < moves.size(); ++i) {
            if (i) oss << ' ';
            oss << moves[i].from << '>' << moves[i].to;
        }
        return oss.str();
    }

    MoveList CsvIO::decodeMoves(const std::string& moves) {
        MoveList out;
        std::istringstream iss(moves);
        std::string tok;
        while (iss >> tok) {
            auto parts = split(tok, '>');
            if (parts.size() != 2) throw std::invalid_argument("bad move '" + tok + "'");
            out.push_back(Move{ toInt(parts[0], "move source"), toInt(parts[1], "move destination") });
        }
        return out;
    }

    std::vector<PuzzleRow> CsvIO::readPuzzles(std::istream& in) {
        std::vector<PuzzleRow> out;
        std::string line; bool first = true; int lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            if (first) { first = false; if (line.rfind("index", 0) == 0) continue; }
            if (trim(line).empty()) continue;
            auto cells = split(line, ',');
            if (cells.size() < 2) throw std::invalid_argument("line " + std::to_string(lineNo) + ": expected index,map[,method]");
            try {
                PuzzleRow r;
                r.index = toInt(trim(cells[0]), "index");
                r.rows = decodeMap(cells[1]);
                if (cells.size() > 2 && !trim(cells[2]).empty()) {
                    r.method = parseMethod(trim(cells[2]));
                    if (!r.method) throw std::invalid_argument("unknown method '" + trim(cells[2]) + "'");
                }
                out.push_back(std::move(r));
            }
            catch (const std::invalid_argument& e) {
                throw std::invalid_argument("line " + std::to_string(lineNo) + ": " + e.what());
            }
        }
        return out;
    }

    void CsvIO::writePuzzles(std::ostream& out, const std::vector<PuzzleRow>& rows, bool header) {
        if (header) out << "index,map,method\n";
        for (const auto& r : rows) {
            out << r.index << ',' << encodeMap(r.rows) << ',' << (r.method ? toString(*r.method) : "") << "\n";
        }
    }

    void CsvIO::writeSolutions(std::ostream& out, const std::vector<SolutionRow>& rows, bool header) {
        if (header) out << "index,method,solved,emptyBottles,moveCount,moves\n";
        for (const auto& r : rows) {
            out << r.index << ',' << toString(r.method) << ',' << (r.solved ? 1 : 0) << ',' << r.emptyBottles << ','
                << r.moves.size() << ',' << encodeMoves(r.moves) << "\n";
        }
    }

    std::vector<PuzzleRow> CsvIO::loadPuzzles(const std::string& path) {
        std::ifstream f(path);
        if (!f) return {};
        return readPuzzles(f);
    }

    bool CsvIO::savePuzzles(const std::string& path, const std::vector<PuzzleRow>& rows, bool appendIfExists) {
        namespace fs = std::filesystem;
        bool exists = fs::exists(path);
        std::ofstream f(path, std::ios::out | (appendIfExists ? std::ios::app : std::ios::trunc));
        if (!f) return false;
        writePuzzles(f, rows, !exists || !appendIfExists);
        return bool(f);
    }

    bool CsvIO::saveSolutions(const std::string& path, const std::vector<SolutionRow>& rows, bool appendIfExists) {
        namespace fs = std::filesystem;
        bool exists = fs::exists(path);
        std::ofstream f(path, std::ios::out | (appendIfExists ? std::ios::app : std::ios::trunc));
        if (!f) return false;
        writeSolutions(f, rows, !exists || !appendIfExists);
        return bool(f);
    }

} // namespace pour
