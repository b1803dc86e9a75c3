// ========================= src/core/Bottle.cpp =========================
#include "Bottle.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <utility>

namespace pour {

    Bottle::Bottle(int capacity) :cap(capacity) {
        if (cap <= 0) throw std::invalid_argument("bottle capacity must be positive, got " + std::to_string(cap));
    }

    Bottle::Bottle(std::vector<Color> layers, int capacity) :slots(std::move(layers)), cap(capacity) {
        if (cap <= 0) throw std::invalid_argument("bottle capacity must be positive, got " + std::to_string(cap));
        if (size() > cap) {
            throw CapacityError("cannot fill bottle over its capacity: " + std::to_string(size()) +
                " layers, capacity " + std::to_string(cap));
        }
    }

    bool Bottle::isInFinalState() const {
        if (slots.empty()) return true;
        if (!isFull()) return false;
        Color t = slots[0];
        for (Color c : slots) if (c != t) return false;
        return true;
    }

    int Bottle::topRun() const {
        if (slots.empty()) return 0;
        Color t = slots.back();
        int cnt = 0;
        for (int i = size() - 1; i >= 0; --i) {
            if (slots[i] == t) ++cnt; else break;
        }
        return cnt;
    }

    bool Bottle::canPour(const Bottle& from, const Bottle& to, int* outAmount) {
        if (from.isEmpty()) return false;
        if (to.isFull()) return false;
        if (!to.isEmpty() && to.topColor() != from.topColor()) return false;

        int mv = std::min(from.topRun(), to.freeSpace());
        if (outAmount) *outAmount = mv;
        return true;
    }

    int Bottle::pour(Bottle& from, Bottle& to) {
        int amount = 0;
        if (!canPour(from, to, &amount)) {
            throw TransfusionError("pour from [" + from.toString() + "] to [" + to.toString() + "] is invalid");
        }
        for (int i = 0; i < amount; ++i) {
            to.slots.push_back(from.slots.back());
            from.slots.pop_back();
        }
        return amount;
    }

    std::string Bottle::toString() const {
        std::string out;
        for (size_t i = 0; i < slots.size(); ++i) {
            if (i) out.push_back(',');
            out += std::to_string(int(slots[i]));
        }
        return out;
    }

} // namespace pour
