// ========================= src/ui/App.cpp =========================
#include "App.hpp"
#include "../core/Log.hpp"
#include "../io/SolutionText.hpp"
#include <SDL.h>
#include "imgui.h"
#include "backends/imgui_impl_sdl2.h"
#include "backends/imgui_impl_sdlrenderer2.h"
#include <algorithm> // for std::clamp
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace pour {

    AppUI::AppUI() {
        // start with the two-bottle example so the window is not empty
        Entry e;
        e.puzzle.index = 0;
        e.puzzle.rows = { { 1, 2, 1, 2 }, { 2, 1, 2, 1 } };
        entries.push_back(std::move(e));
        currentIndex = 0;
    }

    AppUI::~AppUI() {
        if (solveThread.joinable()) {
            solveThread.join();
        }
    }

    void AppUI::setStatus(const std::string& msg) {
        std::lock_guard<std::mutex> lock(statusMutex);
        statusMessage = msg;
    }

    std::string AppUI::getStatus() {
        std::lock_guard<std::mutex> lock(statusMutex);
        return statusMessage;
    }

    void AppUI::ensureIndex(int idx) {
        if (idx >= 0 && idx < (int)entries.size()) {
            currentIndex = idx;
            viewIndexInput = idx + 1;
            playbackStep = 0;
        }
    }

    void AppUI::startSolve() {
        if (currentIndex < 0 || currentIndex >= (int)entries.size() || isSolving.load()) return;
        if (solveThread.joinable()) solveThread.join();

        int index = currentIndex;
        Matrix rows = entries[index].puzzle.rows;
        SolvingMethod m = entries[index].puzzle.method.value_or(method);
        SolveParams pCopy = params;
        setStatus(std::string("Solving (") + toString(m) + ")...");
        isSolving.store(true);

        solveThread = std::thread([this, index, rows, m, pCopy]() {
            try {
                SolveResult res = Solver(pCopy).solve(rows, m);
                {
                    std::lock_guard<std::mutex> lock(pendingMutex);
                    pending = Pending{ index, rows, std::move(res) };
                }
                setStatus("");
            }
            catch (const std::exception& e) {
                log()->error("solve failed: {}", e.what());
                setStatus(std::string("Solve failed: ") + e.what());
            }
            isSolving.store(false);
        });
    }

    void AppUI::collectSolved() {
        if (!isSolving.load() && solveThread.joinable()) {
            solveThread.join();
        }

        std::optional<Pending> done;
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            done.swap(pending);
        }
        if (!done) return;

        // drop results for puzzles edited or removed while solving
        if (done->index < (int)entries.size() && entries[done->index].puzzle.rows == done->rows) {
            entries[done->index].result = std::move(done->result);
            if (done->index == currentIndex) playbackStep = 0;
        }
    }

    static bool InputIntClamped(const char* label, int* value, int minValue, int maxValue, int step = 1, int stepFast = 5) {
        if (minValue > maxValue) std::swap(minValue, maxValue);
        int before = *value;
        bool interacted = ImGui::InputInt(label, value, step, stepFast);
        if (*value < minValue) *value = minValue;
        if (*value > maxValue) *value = maxValue;

        return interacted || *value != before;
    }

    void AppUI::drawTopBar() {
        collectSolved();

        ImGui::Begin("Controls");
        ImGui::Text("Params");
        bool pChanged = false;
        pChanged |= InputIntClamped("Capacity", &params.capacity, 1, 50);
        pChanged |= InputIntClamped("Min empty bottles", &params.minEmpty, 0, 10);
        pChanged |= InputIntClamped("Max empty bottles", &params.maxEmpty, params.minEmpty, 10);
        if (pChanged) {
            for (auto& e : entries) e.result.reset();
            playbackStep = 0;
        }

        ImGui::Separator();
        ImGui::Text("Method");
        int mi = (int)method;
        if (ImGui::RadioButton("Fastest", mi == 0)) mi = 0; ImGui::SameLine();
        if (ImGui::RadioButton("Balanced", mi == 1)) mi = 1; ImGui::SameLine();
        if (ImGui::RadioButton("Shortest", mi == 2)) mi = 2;
        method = (SolvingMethod)mi;

        bool currentlySolving = isSolving.load();
        bool hasPuzzle = currentIndex >= 0 && currentIndex < (int)entries.size();
        if (currentlySolving || !hasPuzzle) ImGui::BeginDisabled();
        if (ImGui::Button("Solve")) startSolve();
        if (currentlySolving || !hasPuzzle) ImGui::EndDisabled();

        if (currentlySolving) {
            ImGui::SameLine();
            ImGui::TextColored(ImVec4(0.9f, 0.8f, 0.3f, 1.0f), "Solving...");
        }

        std::string status = getStatus();
        if (!status.empty()) {
            ImGui::TextColored(ImVec4(0.9f, 0.6f, 0.5f, 1.0f), "%s", status.c_str());
        }

        ImGui::Separator();
        InputIntClamped("Bottles", &newBottleCount, 1, 30);
        if (ImGui::Button("New Puzzle")) {
            Entry e;
            e.puzzle.index = entries.empty() ? 0 : entries.back().puzzle.index + 1;
            e.puzzle.rows.assign(newBottleCount, {});
            entries.push_back(std::move(e));
            ensureIndex((int)entries.size() - 1);
        }
        ImGui::SameLine();
        if (currentlySolving) ImGui::BeginDisabled();
        if (ImGui::Button("Clear Memory")) {
            entries.clear();
            currentIndex = -1;
            viewIndexInput = 1;
            playbackStep = 0;
        }
        if (currentlySolving) ImGui::EndDisabled();

        ImGui::Separator();
        ImGui::InputText("Save CSV", savePath, sizeof(savePath));
        if (ImGui::Button("Save")) {
            std::vector<PuzzleRow> rows;
            for (const auto& e : entries) rows.push_back(e.puzzle);
            if (CsvIO::savePuzzles(savePath, rows)) setStatus("Saved " + std::to_string(rows.size()) + " puzzle(s).");
            else setStatus(std::string("Cannot write ") + savePath);
        }

        ImGui::InputText("Load CSV", loadPath, sizeof(loadPath));
        if (currentlySolving) ImGui::BeginDisabled();
        if (ImGui::Button("Load")) {
            try {
                auto rows = CsvIO::loadPuzzles(loadPath);
                entries.clear(); currentIndex = -1; viewIndexInput = 1;
                for (auto& r : rows) { Entry e; e.puzzle = std::move(r); entries.push_back(std::move(e)); }
                if (!entries.empty()) ensureIndex(0);
                setStatus("Loaded " + std::to_string(entries.size()) + " puzzle(s).");
            }
            catch (const std::invalid_argument& e) {
                setStatus(std::string("Load failed: ") + e.what());
            }
        }
        if (currentlySolving) ImGui::EndDisabled();

        ImGui::Separator();
        ImGui::Text("View by index");
        bool hasMaps = !entries.empty();
        int maxIndex = hasMaps ? (int)entries.size() : 1;
        viewIndexInput = std::clamp(viewIndexInput, 1, maxIndex);
        int inputValue = viewIndexInput;
        if (!hasMaps) ImGui::BeginDisabled();
        if (InputIntClamped("Puzzle #", &inputValue, 1, maxIndex)) {
            viewIndexInput = inputValue;
            if (hasMaps) ensureIndex(viewIndexInput - 1);
        }
        if (!hasMaps) ImGui::EndDisabled();

        ImGui::End();
    }

    static ImU32 colorFor(Color c) {
        static ImU32 table[20] = {
            IM_COL32(230, 80, 80,255), IM_COL32(80,180,250,255), IM_COL32(90,200,120,255), IM_COL32(240,210,70,255),
            IM_COL32(200,120,240,255), IM_COL32(255,160,120,255), IM_COL32(120,120,240,255), IM_COL32(90,160,160,255), IM_COL32(250,130,180,255),
            IM_COL32(150,100,80,255), IM_COL32(100,150,100,255), IM_COL32(80,160,200,255), IM_COL32(200,80,200,255), IM_COL32(100,100,220,255),
            IM_COL32(220,120,60,255), IM_COL32(160,220,60,255), IM_COL32(60,220,160,255), IM_COL32(60,160,220,255), IM_COL32(200,200,200,255),
            IM_COL32(30,30,30,255)
        };
        return table[c % 20];
    }

    void AppUI::drawViewer() {
        ImGui::Begin("Viewer");
        if (currentIndex < 0 || currentIndex >= (int)entries.size()) { ImGui::Text("No puzzle selected"); ImGui::End(); return; }
        const auto& e = entries[currentIndex];

        // the puzzle may be over capacity while being edited
        std::vector<Layout> frames;
        try {
            if (e.result && e.result->solved) frames = replay(e.puzzle.rows, *e.result);
            else frames.emplace_back(e.puzzle.rows, params.capacity);
        }
        catch (const std::logic_error& err) {
            ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "%s", err.what());
            ImGui::End();
            return;
        }

        if (!e.result) {
            ImGui::TextDisabled("Not solved yet.");
        }
        else if (!e.result->solved) {
            ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "No solution with up to %d empty bottle(s).", e.result->emptyBottles);
        }
        else {
            const auto& moves = e.result->moves;
            int maxStep = (int)moves.size();
            playbackStep = std::clamp(playbackStep, 0, maxStep);
            ImGui::Text("Method=%s  Moves=%d  Empty bottles=%d", toString(e.puzzle.method.value_or(method)), maxStep, e.result->emptyBottles);
            ImGui::Text("Expanded=%zu  Generated=%zu  Pruned=%zu", e.result->stats.expanded, e.result->stats.generated, e.result->stats.pruned);
            ImGui::Separator();
            ImGui::Text("Solution step: %d / %d", playbackStep, maxStep);
            bool canPrev = playbackStep > 0;
            bool canNext = playbackStep < maxStep;
            if (!canPrev) ImGui::BeginDisabled();
            if (ImGui::Button("Prev")) { --playbackStep; }
            if (!canPrev) ImGui::EndDisabled();
            ImGui::SameLine();
            if (!canNext) ImGui::BeginDisabled();
            if (ImGui::Button("Next")) { ++playbackStep; }
            if (!canNext) ImGui::EndDisabled();
            ImGui::SameLine();
            if (ImGui::Button("Reset")) { playbackStep = 0; }
            int stepInput = playbackStep;
            if (InputIntClamped("Step", &stepInput, 0, maxStep)) {
                playbackStep = stepInput;
            }
            if (playbackStep > 0 && playbackStep <= maxStep) {
                const auto& lastMove = moves[playbackStep - 1];
                ImGui::Text("Move %d: %d -> %d", playbackStep, lastMove.from + 1, lastMove.to + 1);
            }
        }

        const Layout& s = frames[std::min<size_t>(playbackStep, frames.size() - 1)];

        // draw bottles
        float cell = 18.0f; // cell height
        float bottleW = 28.0f; float gap = 12.0f;
        float baseY = 20.0f + s.capacity() * cell;
        ImDrawList* dl = ImGui::GetWindowDrawList();
        ImVec2 origin = ImGui::GetCursorScreenPos();

        for (int i = 0; i < s.bottleCount(); ++i) {
            const auto& b = s.bottle(i);
            float x = origin.x + i * (bottleW + gap);
            float y = origin.y + baseY;
            // outline; extra empty bottles are drawn dimmer
            bool extra = i >= (int)e.puzzle.rows.size();
            dl->AddRect(ImVec2(x, y - b.capacity() * cell), ImVec2(x + bottleW, y),
                extra ? IM_COL32(120, 120, 120, 255) : IM_COL32(200, 200, 200, 255));
            // slots bottom->top
            for (int k = 0; k < b.capacity(); ++k) {
                float yTop = y - (k + 1) * cell;
                ImU32 col = IM_COL32(60, 60, 60, 255);
                if (k < b.size()) col = colorFor(b.layers()[k]);
                dl->AddRectFilled(ImVec2(x + 2, yTop + 2), ImVec2(x + bottleW - 2, yTop + cell - 2), col, 3.0f);
            }
            std::string bottleLabel = std::to_string(i + 1);
            dl->AddText(ImVec2(x, y + 6), IM_COL32(200, 200, 200, 255), bottleLabel.c_str());
        }
        ImGui::Dummy(ImVec2(s.bottleCount() * (bottleW + gap), baseY + 24.0f));

        if (e.result && e.result->solved) {
            ImGui::Separator();
            ImGui::TextUnformatted(formatSolution(*e.result).c_str());
        }

        ImGui::End();
    }

    void AppUI::drawEditor() {
        ImGui::Begin("Editor (per bottle)");
        if (currentIndex < 0 || currentIndex >= (int)entries.size()) { ImGui::Text("No puzzle selected"); ImGui::End(); return; }
        auto& e = entries[currentIndex];
        auto& rows = e.puzzle.rows;
        bool edited = false;

        if (ImGui::Button("Add Bottle")) { rows.emplace_back(); edited = true; }
        ImGui::SameLine();
        if (rows.size() > 1 && ImGui::Button("Remove Last Bottle")) { rows.pop_back(); edited = true; }
        if (rows.empty()) { ImGui::Text("No bottles"); ImGui::End(); if (edited) e.result.reset(); return; }

        static int selBottle = 0;
        selBottle = std::clamp(selBottle, 0, (int)rows.size() - 1);
        int displayBottle = selBottle + 1;
        if (InputIntClamped("Bottle", &displayBottle, 1, (int)rows.size())) {
            selBottle = displayBottle - 1;
        }
        ImGui::Text("Editing Bottle #%d", selBottle + 1);

        auto& b = rows[selBottle];
        ImGui::Text("Capacity=%d  Size=%d", params.capacity, (int)b.size());

        ImGui::Separator();
        ImGui::Text("Paint / Edit Slots");
        static int paintColor = 1; paintColor = std::clamp(paintColor, 0, 255);
        InputIntClamped("Paint Color", &paintColor, 0, 255);
        if (ImGui::Button("Push Top")) {
            if ((int)b.size() < params.capacity) { b.push_back((Color)paintColor); edited = true; }
        }
        ImGui::SameLine();
        if (ImGui::Button("Pop Top")) {
            if (!b.empty()) { b.pop_back(); edited = true; }
        }
        ImGui::SameLine();
        if (ImGui::Button("Clear Bottle")) {
            b.clear(); edited = true;
        }

        static int editIndex = 1; editIndex = std::clamp(editIndex, 1, std::max(1, params.capacity));
        InputIntClamped("Edit Slot Index (1 = bottom)", &editIndex, 1, std::max(1, params.capacity));
        int slotIndex = editIndex - 1;
        if (slotIndex < (int)b.size()) {
            int ec = b[slotIndex];
            if (InputIntClamped("Edit Slot Color", &ec, 0, 255)) { b[slotIndex] = (Color)ec; edited = true; }
        }
        else {
            ImGui::TextDisabled("(Index beyond current height)");
        }

        ImGui::Separator();
        int pm = e.puzzle.method ? (int)*e.puzzle.method + 1 : 0;
        ImGui::Text("Method for this puzzle");
        if (ImGui::RadioButton("Default", pm == 0)) pm = 0; ImGui::SameLine();
        if (ImGui::RadioButton("fastest", pm == 1)) pm = 1; ImGui::SameLine();
        if (ImGui::RadioButton("balanced", pm == 2)) pm = 2; ImGui::SameLine();
        if (ImGui::RadioButton("shortest", pm == 3)) pm = 3;
        std::optional<SolvingMethod> chosen;
        if (pm > 0) chosen = (SolvingMethod)(pm - 1);
        if (chosen != e.puzzle.method) { e.puzzle.method = chosen; edited = true; }

        if (edited) { e.result.reset(); playbackStep = 0; }
        ImGui::End();
    }

    int AppUI::run() {
        // SDL2 init
        if (SDL_Init(SDL_INIT_VIDEO) != 0) {
            log()->error("SDL_Init failed: {}", SDL_GetError());
            return 1;
        }
        SDL_Window* window = SDL_CreateWindow("Pour Solver", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1400, 900, SDL_WINDOW_SHOWN);
        SDL_Renderer* renderer = window ? SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC) : nullptr;
        if (!window || !renderer) {
            log()->error("cannot create window: {}", SDL_GetError());
            if (window) SDL_DestroyWindow(window);
            SDL_Quit();
            return 1;
        }

        IMGUI_CHECKVERSION();
        ImGui::CreateContext();
        ImGui::StyleColorsDark();

        ImGui_ImplSDL2_InitForSDLRenderer(window, renderer);
        ImGui_ImplSDLRenderer2_Init(renderer);

        bool running = true; SDL_Event e;
        while (running) {
            while (SDL_PollEvent(&e)) {
                ImGui_ImplSDL2_ProcessEvent(&e);
                if (e.type == SDL_QUIT) running = false;
            }
            ImGui_ImplSDLRenderer2_NewFrame();
            ImGui_ImplSDL2_NewFrame();
            ImGui::NewFrame();

            drawTopBar();
            drawViewer();
            drawEditor();

            ImGui::Render();
            SDL_SetRenderDrawColor(renderer, 20, 20, 24, 255);
            SDL_RenderClear(renderer);
            ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
            SDL_RenderPresent(renderer);
        }

        // a running solve cannot be interrupted; wait for it before tearing down
        if (solveThread.joinable()) solveThread.join();

        ImGui_ImplSDLRenderer2_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 0;
    }

} // namespace pour
