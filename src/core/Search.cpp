// ========================= src/core/Search.cpp =========================
#include "Search.hpp"
#include "Fingerprint.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace pour {

    int sortedness(const Layout& s) {
        int metric = 0;
        for (const auto& b : s.bottles()) {
            const auto& layers = b.layers();
            for (size_t i = 1; i < layers.size(); ++i) {
                if (layers[i] == layers[i - 1]) ++metric;
            }
        }
        return metric;
    }

    namespace {

        // Move history shared by all nodes of one search; each node keeps only
        // the index of its last link.
        class Trail {
        public:
            int push(int parent, Move m) {
                links.push_back(Link{ parent, m });
                return static_cast<int>(links.size()) - 1;
            }

            MoveList path(int idx) const {
                MoveList out;
                while (idx >= 0) {
                    out.push_back(links[idx].m);
                    idx = links[idx].parent;
                }
                std::reverse(out.begin(), out.end());
                return out;
            }

        private:
            struct Link { int parent{ -1 }; Move m{}; };
            std::vector<Link> links;
        };

        struct Node {
            Layout s;
            int depth{ 0 };   // moves taken from the start
            int metric{ 0 };  // sortedness, priority discipline only
            int link{ -1 };   // last move in the Trail, -1 for the start
            size_t seq{ 0 };  // insertion order, breaks priority ties
        };

        class StackFrontier {
        public:
            bool empty() const { return v.empty(); }
            size_t size() const { return v.size(); }
            void push(Node n) { v.push_back(std::move(n)); }
            Node pop() { Node n = std::move(v.back()); v.pop_back(); return n; }

            int score(const Layout&) const { return 0; }
            bool admit(const Node&) { return true; }

        private:
            std::vector<Node> v;
        };

        class PriorityFrontier {
        public:
            explicit PriorityFrontier(int tolerance) :tol(tolerance) {}

            bool empty() const { return heap.empty(); }
            size_t size() const { return heap.size(); }

            void push(Node n) {
                heap.push_back(std::move(n));
                std::push_heap(heap.begin(), heap.end(), later);
            }

            Node pop() {
                std::pop_heap(heap.begin(), heap.end(), later);
                Node n = std::move(heap.back());
                heap.pop_back();
                return n;
            }

            int score(const Layout& s) const { return sortedness(s); }

            // keep nodes within `tol` of the best metric seen at their depth
            bool admit(const Node& n) {
                auto it = best.find(n.depth);
                if (it == best.end()) { best.emplace(n.depth, n.metric); return true; }
                if (it->second > n.metric + tol) return false;
                if (it->second < n.metric) it->second = n.metric;
                return true;
            }

        private:
            // heap comparator: true when a is served after b
            static bool later(const Node& a, const Node& b) {
                if (a.depth != b.depth) return a.depth > b.depth;
                if (a.metric != b.metric) return a.metric < b.metric;
                return a.seq > b.seq;
            }

            int tol{ 0 };
            std::vector<Node> heap;
            std::unordered_map<int, int> best; // depth -> highest admitted metric
        };

        template<class Frontier>
        std::optional<MoveList> run(const Layout& start, Frontier& frontier, SearchStats* outStats) {
            SearchStats st;
            auto report = [&] { if (outStats) *outStats = st; };

            if (start.isSolved()) { report(); return MoveList{}; }

            std::unordered_set<Fingerprint> visited;
            visited.insert(fingerprint(start));
            Trail trail;
            size_t seq = 0;

            frontier.push(Node{ start, 0, frontier.score(start), -1, seq++ });

            while (!frontier.empty()) {
                Node step = frontier.pop();
                if (!frontier.admit(step)) { ++st.pruned; continue; }
                ++st.expanded;

                const int n = step.s.bottleCount();
                for (int i = 0; i < n; ++i) {
                    for (int j = 0; j < n; ++j) {
                        if (!step.s.canPour(i, j)) continue;

                        Layout next = step.s;
                        next.apply(Move{ i, j });
                        ++st.generated;

                        if (!visited.insert(fingerprint(next)).second) { ++st.duplicates; continue; }

                        int link = trail.push(step.link, Move{ i, j });
                        if (next.isSolved()) { report(); return trail.path(link); }

                        int metric = frontier.score(next);
                        Node child{ std::move(next), step.depth + 1, metric, link, seq++ };
                        if (frontier.admit(child)) {
                            frontier.push(std::move(child));
                            st.peakFrontier = std::max(st.peakFrontier, frontier.size());
                        }
                        else {
                            ++st.pruned;
                        }
                    }
                }
            }

            report();
            return std::nullopt;
        }

    } // namespace

    std::optional<MoveList> searchDepthFirst(const Layout& start, SearchStats* stats) {
        StackFrontier frontier;
        return run(start, frontier, stats);
    }

    std::optional<MoveList> searchPriority(const Layout& start, int tolerance, SearchStats* stats) {
        if (tolerance < 0) throw std::invalid_argument("metric tolerance must be non-negative");
        PriorityFrontier frontier(tolerance);
        return run(start, frontier, stats);
    }

} // namespace pour
