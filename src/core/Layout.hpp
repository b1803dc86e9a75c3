// ========================= src/core/Layout.hpp =========================
#pragma once
#include "Bottle.hpp"
#include <string>
#include <vector>

namespace pour {

    // Ordered, index-addressable set of bottles sharing one capacity.
    class Layout {
    public:
        explicit Layout(int capacity = kDefaultCapacity);
        // throws CapacityError when a row is longer than capacity
        Layout(const Matrix& rows, int capacity, int extraEmpty = 0);

        int capacity() const { return cap; }
        int bottleCount() const { return static_cast<int>(B.size()); }
        const Bottle& bottle(int i) const;            // throws IndexError
        const std::vector<Bottle>& bottles() const { return B; }

        // copy with n empty bottles appended
        Layout withEmptyBottles(int n) const;

        // throws IndexError on bad index; false for from == to
        bool canPour(int from, int to, int* outAmount = nullptr) const;
        // returns amount moved; self-pour is a no-op returning 0
        int apply(const Move& m);

        bool isSolved() const;
        int totalLayers() const;
        Matrix matrix() const;

        // bottle strings sorted and newline-joined; equal for any bottle permutation
        std::string canonicalForm() const;

        bool operator==(const Layout& o) const { return cap == o.cap && B == o.B; }
        bool operator!=(const Layout& o) const { return !(*this == o); }

    private:
        int cap{ kDefaultCapacity };
        std::vector<Bottle> B;

        void checkIndex(int i) const;
    };

} // namespace pour
