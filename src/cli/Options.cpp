// ========================= src/cli/Options.cpp =========================
#include "Options.hpp"
#include <stdexcept>

namespace pour {

    static int toCount(const std::string& key, const std::string& v) {
        size_t used = 0; int n = -1;
        try { n = std::stoi(v, &used); }
        catch (const std::exception&) { used = 0; }
        if (used == 0 || used != v.size() || n < 0) throw std::invalid_argument(key + ": expected a non-negative integer, got '" + v + "'");
        return n;
    }

    std::string usage() {
        return
            "Usage: pour_cli [options]\n"
            "  --in=PATH          puzzles CSV (index,map,method), default puzzles.csv\n"
            "  --out=PATH         write solutions CSV\n"
            "  --method=NAME      fastest | balanced | shortest (rows without a method)\n"
            "  --capacity=N       layers per bottle, default 4\n"
            "  --min-empty=N      first count of extra empty bottles, default 0\n"
            "  --max-empty=N      last count of extra empty bottles, default 4\n"
            "  --log-level=LEVEL  trace | debug | info | warn | error | critical | off\n"
            "  --quiet            do not print the pour steps\n"
            "Example:\n"
            "  pour_cli --in=puzzles.csv --out=solutions.csv --method=shortest\n";
    }

    CliOptions parseArgs(int argc, const char* const* argv) {
        CliOptions cfg;

        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];

            auto get_val = [&](const char* key) -> std::string {
                const std::string k = std::string(key) + "=";
                if (a.rfind(k, 0) == 0) return a.substr(k.size());
                return {};
            };

            if (a == "--help" || a == "-h") { cfg.showHelp = true; continue; }
            if (a == "--quiet") { cfg.quiet = true; continue; }

            if (auto v = get_val("--in"); !v.empty()) { cfg.inPath = v; continue; }
            if (auto v = get_val("--out"); !v.empty()) { cfg.outPath = v; continue; }
            if (auto v = get_val("--method"); !v.empty()) {
                auto m = parseMethod(v);
                if (!m) throw std::invalid_argument("--method: unknown solving method '" + v + "'");
                cfg.method = *m;
                continue;
            }
            if (auto v = get_val("--capacity"); !v.empty()) {
                cfg.params.capacity = toCount("--capacity", v);
                if (cfg.params.capacity == 0) throw std::invalid_argument("--capacity: must be positive");
                continue;
            }
            if (auto v = get_val("--min-empty"); !v.empty()) { cfg.params.minEmpty = toCount("--min-empty", v); continue; }
            if (auto v = get_val("--max-empty"); !v.empty()) { cfg.params.maxEmpty = toCount("--max-empty", v); continue; }
            if (auto v = get_val("--log-level"); !v.empty()) { cfg.logLevel = v; continue; }

            throw std::invalid_argument("Unknown argument: " + a);
        }

        if (cfg.params.maxEmpty < cfg.params.minEmpty) {
            throw std::invalid_argument("--max-empty must not be below --min-empty");
        }
        return cfg;
    }

} // namespace pour
