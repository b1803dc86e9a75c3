// ========================= src/core/Fingerprint.hpp =========================
#pragma once
#include "Layout.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace pour {

    // 128-bit digest of a layout's canonical form. Bottle order does not matter.
    struct Fingerprint {
        uint64_t hi{ 0 };
        uint64_t lo{ 0 };

        bool operator==(const Fingerprint& o) const { return hi == o.hi && lo == o.lo; }
        bool operator!=(const Fingerprint& o) const { return !(*this == o); }

        std::string hex() const;
    };

    // FNV-1a, 128-bit variant
    Fingerprint fingerprintOf(std::string_view canonical);

    inline Fingerprint fingerprint(const Layout& s) { return fingerprintOf(s.canonicalForm()); }

} // namespace pour

namespace std {
    template<> struct hash<pour::Fingerprint> {
        size_t operator()(const pour::Fingerprint& f) const noexcept {
            return size_t(f.lo ^ (f.hi * 0x9e3779b97f4a7c15ull));
        }
    };
}
