// ========================= src/core/Fingerprint.cpp =========================
#include "Fingerprint.hpp"
#include <cstdio>

namespace pour {

    namespace {
        // offset basis 0x6c62272e07bb014262b821756295c58d
        constexpr uint64_t kOffsetHi = 0x6c62272e07bb0142ull;
        constexpr uint64_t kOffsetLo = 0x62b821756295c58dull;
        // prime is 2^88 + kPrimeLow
        constexpr uint64_t kPrimeLow = 0x13b;

        // (hi:lo) *= prime, mod 2^128, on 64-bit halves
        void mulPrime(uint64_t& hi, uint64_t& lo) {
            const uint64_t pa = (lo >> 32) * kPrimeLow;
            const uint64_t pb = (lo & 0xffffffffull) * kPrimeLow;
            const uint64_t newLo = (pa << 32) + pb;
            const uint64_t carry = newLo < pb ? 1 : 0;
            hi = hi * kPrimeLow + (pa >> 32) + carry + (lo << 24);
            lo = newLo;
        }
    }

    Fingerprint fingerprintOf(std::string_view canonical) {
        uint64_t hi = kOffsetHi, lo = kOffsetLo;
        for (unsigned char ch : canonical) {
            lo ^= ch;
            mulPrime(hi, lo);
        }
        return Fingerprint{ hi, lo };
    }

    std::string Fingerprint::hex() const {
        char buf[33];
        std::snprintf(buf, sizeof(buf), "%016llx%016llx", (unsigned long long)hi, (unsigned long long)lo);
        return std::string(buf);
    }

} // namespace pour
