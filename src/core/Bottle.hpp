// ========================= src/core/Bottle.hpp =========================
#pragma once
#include "Types.hpp"
#include <string>
#include <vector>

namespace pour {

    // One pour-able stack of colored layers, bottom -> top, with a fixed capacity.
    // Contents change only through pour().
    class Bottle {
    public:
        explicit Bottle(int capacity = kDefaultCapacity);
        Bottle(std::vector<Color> layers, int capacity); // throws CapacityError when layers exceed capacity

        int capacity() const { return cap; }
        int size() const { return static_cast<int>(slots.size()); }
        const std::vector<Color>& layers() const { return slots; }

        bool isEmpty() const { return slots.empty(); }
        bool isFull() const { return size() >= cap; }
        bool isInFinalState() const;

        Color topColor() const { return slots.back(); } // requires !isEmpty()
        int topRun() const;                             // count of contiguous same-color from top
        int freeSpace() const { return cap - size(); }

        // legality of pouring from -> to; amount that would move goes to outAmount
        static bool canPour(const Bottle& from, const Bottle& to, int* outAmount = nullptr);
        // moves min(topRun, freeSpace) layers; throws TransfusionError when !canPour
        static int pour(Bottle& from, Bottle& to);

        // comma-joined layers, e.g. "1,2,2"
        std::string toString() const;

        bool operator==(const Bottle& o) const { return cap == o.cap && slots == o.slots; }
        bool operator!=(const Bottle& o) const { return !(*this == o); }

    private:
        std::vector<Color> slots;
        int cap{ kDefaultCapacity };
    };

} // namespace pour
