// ========================= src/core/Layout.cpp =========================
#include "Layout.hpp"
#include "Errors.hpp"
#include <algorithm>

namespace pour {

    Layout::Layout(int capacity) :cap(capacity) {
        if (cap <= 0) throw std::invalid_argument("layout capacity must be positive, got " + std::to_string(cap));
    }

    Layout::Layout(const Matrix& rows, int capacity, int extraEmpty) :Layout(capacity) {
        if (extraEmpty < 0) throw std::invalid_argument("negative empty bottle count");
        B.reserve(rows.size() + size_t(extraEmpty));
        for (size_t i = 0; i < rows.size(); ++i) {
            if ((int)rows[i].size() > cap) {
                throw CapacityError("bottle " + std::to_string(i) + " holds " + std::to_string(rows[i].size()) +
                    " layers, capacity is " + std::to_string(cap));
            }
            B.emplace_back(rows[i], cap);
        }
        for (int i = 0; i < extraEmpty; ++i) B.emplace_back(cap);
    }

    void Layout::checkIndex(int i) const {
        if (i < 0 || i >= (int)B.size()) {
            throw IndexError("bottle index " + std::to_string(i) + " is out of bounds [0, " + std::to_string(B.size()) + ")");
        }
    }

    const Bottle& Layout::bottle(int i) const {
        checkIndex(i);
        return B[i];
    }

    Layout Layout::withEmptyBottles(int n) const {
        if (n < 0) throw std::invalid_argument("negative empty bottle count");
        Layout out = *this;
        for (int i = 0; i < n; ++i) out.B.emplace_back(cap);
        return out;
    }

    bool Layout::canPour(int from, int to, int* outAmount) const {
        checkIndex(from);
        checkIndex(to);
        if (from == to) return false;
        return Bottle::canPour(B[from], B[to], outAmount);
    }

    int Layout::apply(const Move& m) {
        checkIndex(m.from);
        checkIndex(m.to);
        if (m.from == m.to) return 0;
        return Bottle::pour(B[m.from], B[m.to]);
    }

    bool Layout::isSolved() const {
        for (const auto& b : B) { if (!b.isInFinalState()) return false; }
        return true;
    }

    int Layout::totalLayers() const {
        int n = 0;
        for (const auto& b : B) n += b.size();
        return n;
    }

    Matrix Layout::matrix() const {
        Matrix m; m.reserve(B.size());
        for (const auto& b : B) m.push_back(b.layers());
        return m;
    }

    std::string Layout::canonicalForm() const {
        std::vector<std::string> parts; parts.reserve(B.size());
        for (const auto& b : B) parts.push_back(b.toString());
        std::sort(parts.begin(), parts.end());
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i) out.push_back('\n');
            out += parts[i];
        }
        return out;
    }

} // namespace pour
