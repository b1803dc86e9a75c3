// ========================= src/core/Types.hpp =========================
#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <string_view>
#include <optional>

namespace pour {

    using Color = uint8_t;                       // opaque layer id, only equality matters
    using Matrix = std::vector<std::vector<Color>>; // one row per bottle, bottom -> top

    constexpr int kDefaultCapacity = 4;
    constexpr int kDefaultMinEmpty = 0;
    constexpr int kDefaultMaxEmpty = 4;

    struct Move {
        int from{ -1 };
        int to{ -1 };

        bool operator==(const Move& o) const { return from == o.from && to == o.to; }
        bool operator!=(const Move& o) const { return !(*this == o); }
    };

    enum class SolvingMethod : uint8_t { Fastest = 0, Balanced = 1, Shortest = 2 };

    inline const char* toString(SolvingMethod m) {
        switch (m) {
        case SolvingMethod::Fastest: return "fastest";
        case SolvingMethod::Balanced: return "balanced";
        case SolvingMethod::Shortest: return "shortest";
        }
        return "?";
    }

    inline std::optional<SolvingMethod> parseMethod(std::string_view s) {
        if (s == "fastest") return SolvingMethod::Fastest;
        if (s == "balanced") return SolvingMethod::Balanced;
        if (s == "shortest") return SolvingMethod::Shortest;
        return std::nullopt;
    }

    // Metric tolerance of the priority search; fastest has none (depth-first)
    inline int toleranceFor(SolvingMethod m) { return m == SolvingMethod::Balanced ? 1 : 0; }

    struct SolveParams {
        int capacity{ kDefaultCapacity };  // shared by every bottle
        int minEmpty{ kDefaultMinEmpty };  // first count of extra empty bottles tried
        int maxEmpty{ kDefaultMaxEmpty };  // last count tried before giving up
    };

} // namespace pour
