// ========================= src/ui/App.hpp =========================
#pragma once
#include "../core/Solver.hpp"
#include "../io/Csv.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace pour {

    class AppUI {
    public:
        AppUI();
        ~AppUI();
        int run(); // SDL2 + ImGui main loop

    private:
        struct Entry {
            PuzzleRow puzzle;
            std::optional<SolveResult> result; // cleared whenever the puzzle is edited
        };

        SolveParams params{};
        SolvingMethod method{ SolvingMethod::Fastest };
        std::vector<Entry> entries;           // in-memory puzzle list
        int currentIndex{ -1 };
        int viewIndexInput{ 1 };
        int playbackStep{ 0 };
        int newBottleCount{ 4 };
        char savePath[256] = "puzzles.csv";
        char loadPath[256] = "puzzles.csv";

        // solve runs on its own thread; the UI thread only polls
        std::thread solveThread;
        std::atomic<bool> isSolving{ false };
        std::mutex pendingMutex;
        struct Pending { int index{ -1 }; Matrix rows; SolveResult result; };
        std::optional<Pending> pending;
        std::mutex statusMutex;
        std::string statusMessage;

        // UI helpers
        void drawTopBar();
        void drawEditor();
        void drawViewer();

        void startSolve();
        void collectSolved();
        void setStatus(const std::string& msg);
        std::string getStatus();
        void ensureIndex(int idx);
    };

} // namespace pour
