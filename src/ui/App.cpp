// ========================= src/ui/App.cpp =========================
#include "App.hpp"
#include <SDL.h>
#include "imgui.h"
#include "backends/imgui_impl_sdl2.h"
#include "backends/imgui_impl_sdlrenderer2.h"
#include <algorithm> // for std::clamp
#include <cstdint>
#include <cstdio>
#include <string>

namespace hm {

    AppUI::AppUI() :p{}, opt{} {}

    AppUI::~AppUI() {
        if (generationThread.joinable()) {
            generationThread.join();
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
        if (idx >= 0 && idx < (int)runs.size()) {
            currentIndex = idx;
            viewIndexInput = idx + 1;
            playbackStep = 0;
        }
    }

    std::optional<Run> AppUI::solveLayout(const std::string& name, const std::vector<std::string>& rows,
        const Params& p, const GenOptions& opt, std::string* reason) {
        TreasureGenerator treasures(opt);
        auto maze = Maze::build(rows, treasures.source(), reason);
        if (!maze) return std::nullopt;

        Run r;
        r.name = name;
        r.layout = rows;
        r.treasureSeed = opt.seed;
        r.result = Solver(p).solve(*maze);
        r.maze = std::move(maze);
        printf("[Solve] %s: %s, path=%d, loot=%d value, %d/%d capacity left, %d nodes, %.2f ms\n",
            name.c_str(), r.result.found ? "escaped" : "no path", (int)r.result.path.size(),
            r.result.loot.totalValue, r.result.loot.remaining, r.result.loot.capacity,
            r.result.nodesExpanded, r.result.computeTimeMs);
        return r;
    }

    void AppUI::collectGenerated() {
        if (!isGenerating.load() && generationThread.joinable()) {
            generationThread.join();
            generationTotal = 0;
            generationCompleted.store(0);
        }

        std::vector<Run> newly;
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            if (!pendingRuns.empty()) {
                newly.swap(pendingRuns);
            }
        }

        if (!newly.empty()) {
            bool hadAny = !runs.empty();
            for (auto& r : newly) {
                runs.push_back(std::move(r));
            }
            if (currentIndex < 0 || !hadAny) ensureIndex(0);
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
        collectGenerated();

        ImGui::Begin("Controls");
        ImGui::Text("Maze");
        InputIntClamped("Rows", &p.rows, 5, 61);
        InputIntClamped("Cols", &p.cols, 5, 81);
        InputIntClamped("Backpack capacity", &p.capacity, 0, 1000, 1, 10);
        int mode = (int)p.mode;
        if (ImGui::RadioButton("Collect during search", mode == 0)) mode = 0;
        ImGui::SameLine();
        if (ImGui::RadioButton("Collect along path", mode == 1)) mode = 1;
        p.mode = (CollectMode)mode;
        InputIntClamped("Max per visit (0 = all)", &p.maxPerVisit, 0, 50);

        ImGui::Separator();
        ImGui::Text("Treasures");
        if (InputIntClamped("Weight min", &opt.weightMin, 1, 100)) opt.weightMax = std::max(opt.weightMax, opt.weightMin);
        InputIntClamped("Weight max", &opt.weightMax, opt.weightMin, 100);
        if (InputIntClamped("Value min", &opt.valueMin, 1, 1000)) opt.valueMax = std::max(opt.valueMax, opt.valueMin);
        InputIntClamped("Value max", &opt.valueMax, opt.valueMin, 1000);
        if (InputIntClamped("Per hollow min", &opt.treasuresMin, 0, 50)) opt.treasuresMax = std::max(opt.treasuresMax, opt.treasuresMin);
        InputIntClamped("Per hollow max", &opt.treasuresMax, opt.treasuresMin, 50);
        uint64_t seedValue = opt.seed;
        if (ImGui::InputScalar("Seed", ImGuiDataType_U64, &seedValue)) {
            opt.seed = seedValue;
        }

        ImGui::Separator();
        ImGui::Text("Generator");
        InputIntClamped("Exits", &opt.exits, 1, 10);
        InputIntClamped("Spooky hollows", &opt.spooky, 0, 50);
        InputIntClamped("Mystical cells", &opt.mystical, 0, 50);
        InputIntClamped("Mystical pools", &opt.mysticalPools, 1, 10);
        InputIntClamped("Loop %", &opt.loopPercent, 0, 100);
        InputIntClamped("Count (N)", &NtoGenerate, 1, 50);

        bool currentlyGenerating = isGenerating.load();
        if (currentlyGenerating) ImGui::BeginDisabled();
        if (ImGui::Button("Generate N")) {
            Params pCopy = p;
            GenOptions optCopy = opt;
            int count = NtoGenerate;
            setStatus("");

            if (generationThread.joinable()) generationThread.join();
            generationTotal = count;
            generationCompleted.store(0);
            isGenerating.store(true);

            generationThread = std::thread([this, pCopy, optCopy, count]() mutable {
                MazeGenerator localGen(pCopy, optCopy);
                std::vector<Run> local;
                std::string status;
                local.reserve(count);
                for (int i = 0; i < count; ++i) {
                    std::string reason;
                    auto g = localGen.makeOne(&reason);
                    if (!g) {
                        status = reason.empty() ? "Generation failed for a maze." : reason;
                        break;
                    }
                    GenOptions treasureOpt = optCopy;
                    treasureOpt.seed = optCopy.seed + uint64_t(i) * 0x9E3779B97F4A7C15ULL;
                    auto r = solveLayout("gen-" + std::to_string(g->seed), g->layout, pCopy, treasureOpt, &reason);
                    if (r) local.push_back(std::move(*r));
                    generationCompleted.fetch_add(1);
                }
                {
                    std::lock_guard<std::mutex> lock(pendingMutex);
                    for (auto& item : local) {
                        pendingRuns.push_back(std::move(item));
                    }
                }
                setStatus(status.empty() ? "Generation complete." : status);
                isGenerating.store(false);
                });
        }
        if (currentlyGenerating) ImGui::EndDisabled();

        if (isGenerating.load()) {
            ImGui::SameLine();
            int total = generationTotal;
            int done = generationCompleted.load();
            if (total < 1) total = 1;
            if (done > total) done = total;
            ImGui::TextColored(ImVec4(0.9f, 0.8f, 0.3f, 1.0f), "Generating Mazes... %d/%d", done, total);
        }

        ImGui::SameLine();
        if (ImGui::Button("Clear Memory")) {
            runs.clear();
            currentIndex = -1;
            viewIndexInput = 1;
            playbackStep = 0;
        }

        ImGui::Separator();
        ImGui::InputText("Layout file", layoutPath, sizeof(layoutPath));
        if (ImGui::Button("Load & Solve")) {
            auto rows = LayoutIO::load(layoutPath);
            if (!rows) {
                setStatus(std::string("Cannot open ") + layoutPath);
                printf("[IO] cannot open layout %s\n", layoutPath);
            }
            else {
                std::string reason;
                auto r = solveLayout(layoutPath, *rows, p, opt, &reason);
                if (!r) setStatus("Invalid maze layout: " + reason);
                else { runs.push_back(std::move(*r)); ensureIndex((int)runs.size() - 1); setStatus(""); }
            }
        }
        ImGui::SameLine();
        bool hasCurrent = currentIndex >= 0 && currentIndex < (int)runs.size();
        if (!hasCurrent) ImGui::BeginDisabled();
        if (ImGui::Button("Save Layout")) {
            if (!LayoutIO::save(layoutPath, runs[currentIndex].layout)) setStatus(std::string("Cannot write ") + layoutPath);
        }
        ImGui::SameLine();
        if (ImGui::Button("Re-solve")) {
            // fresh hollows from the same seed, so the same treasures come back
            const Run& cur = runs[currentIndex];
            GenOptions again = opt; again.seed = cur.treasureSeed;
            std::string reason;
            auto r = solveLayout(cur.name, cur.layout, p, again, &reason);
            if (r) { runs[currentIndex] = std::move(*r); playbackStep = 0; }
            else setStatus("Invalid maze layout: " + reason);
        }
        if (!hasCurrent) ImGui::EndDisabled();

        std::string status = getStatus();
        if (!status.empty()) {
            ImGui::TextColored(ImVec4(0.9f, 0.6f, 0.5f, 1.0f), "%s", status.c_str());
        }

        ImGui::Separator();
        ImGui::InputText("Save CSV", savePath, sizeof(savePath));
        if (ImGui::Button("Save")) {
            // append indices continuing from existing file if present
            auto rowsExisting = CsvIO::load(savePath);
            int startIdx = rowsExisting.empty() ? 0 : (rowsExisting.back().index + 1);
            std::vector<CsvRow> rows;
            for (size_t i = 0; i < runs.size(); ++i) {
                rows.push_back(CsvIO::encode(startIdx + (int)i, runs[i].name, runs[i].result));
            }
            if (!CsvIO::save(savePath, rows, true)) setStatus(std::string("Cannot write ") + savePath);
        }

        ImGui::InputText("Load CSV", loadPath, sizeof(loadPath));
        if (ImGui::Button("Load")) {
            loadedRows = CsvIO::load(loadPath);
            printf("[IO] %d report rows from %s\n", (int)loadedRows.size(), loadPath);
        }

        ImGui::Separator();
        ImGui::Text("View by index");
        bool hasRuns = !runs.empty();
        int maxIndex = hasRuns ? (int)runs.size() : 1;
        viewIndexInput = std::clamp(viewIndexInput, 1, maxIndex);
        int inputValue = viewIndexInput;
        if (!hasRuns) ImGui::BeginDisabled();
        if (InputIntClamped("Maze #", &inputValue, 1, maxIndex)) {
            viewIndexInput = inputValue;
            if (hasRuns) ensureIndex(viewIndexInput - 1);
        }
        if (!hasRuns) ImGui::EndDisabled();

        ImGui::End();
    }

    static ImU32 colorFor(char symbol) {
        switch (symbol) {
        case '#': return IM_COL32(70, 70, 80, 255);
        case 'P': return IM_COL32(90, 200, 120, 255);
        case 'E': return IM_COL32(230, 80, 80, 255);
        case 'S': return IM_COL32(200, 120, 240, 255);
        case 'M': return IM_COL32(80, 180, 250, 255);
        default:
            if (symbol >= '1' && symbol <= '9') return IM_COL32(80, 160, 200, 255);
            return IM_COL32(30, 30, 34, 255);
        }
    }

    void AppUI::drawViewer() {
        ImGui::Begin("Viewer");
        if (currentIndex < 0 || currentIndex >= (int)runs.size()) { ImGui::Text("No maze selected"); ImGui::End(); return; }
        const auto& r = runs[currentIndex];
        const auto& res = r.result;

        ImGui::Text("%s  %dx%d", r.name.c_str(), r.maze ? r.maze->rows() : 0, r.maze ? r.maze->cols() : 0);
        if (res.found) ImGui::Text("Escaped in %d steps, %d cells expanded, %.2f ms", (int)res.path.size() - 1, res.nodesExpanded, res.computeTimeMs);
        else ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "No path found (%d cells expanded)", res.nodesExpanded);

        const auto& path = res.path;
        int maxStep = (int)path.size();
        playbackStep = std::clamp(playbackStep, 0, maxStep);
        if (path.empty()) {
            ImGui::TextDisabled("No escape path recorded.");
        }
        else {
            ImGui::Separator();
            ImGui::Text("Path step: %d / %d", playbackStep, maxStep);
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
            ImGui::SameLine();
            if (ImGui::Button("End")) { playbackStep = maxStep; }
            int stepInput = playbackStep;
            if (InputIntClamped("Step", &stepInput, 0, maxStep)) {
                playbackStep = stepInput;
            }
            if (playbackStep > 0) {
                ImGui::Text("At %s", path[playbackStep - 1].str().c_str());
            }
        }

        if (!r.maze) { ImGui::End(); return; }
        const Maze& m = *r.maze;
        std::vector<Position> shown(path.begin(), path.begin() + playbackStep);
        auto grid = m.render(&shown);

        float cell = std::clamp(720.0f / float(std::max(m.rows(), m.cols())), 8.0f, 28.0f);
        ImDrawList* dl = ImGui::GetWindowDrawList();
        ImVec2 origin = ImGui::GetCursorScreenPos();
        for (int row = 0; row < m.rows(); ++row) {
            for (int col = 0; col < m.cols(); ++col) {
                float x = origin.x + col * cell;
                float y = origin.y + row * cell;
                char sym = m.at({ row, col }).symbol();
                dl->AddRectFilled(ImVec2(x, y), ImVec2(x + cell - 1, y + cell - 1), colorFor(sym), 2.0f);
                if (grid[row][col] == '*') {
                    dl->AddCircleFilled(ImVec2(x + cell * 0.5f, y + cell * 0.5f), cell * 0.25f, IM_COL32(240, 210, 70, 255));
                }
                else if (sym != ' ' && sym != '#') {
                    char label[2] = { sym, 0 };
                    ImVec2 ts = ImGui::CalcTextSize(label);
                    dl->AddText(ImVec2(x + (cell - ts.x) * 0.5f, y + (cell - ts.y) * 0.5f), IM_COL32(255, 255, 255, 255), label);
                }
            }
        }
        ImGui::Dummy(ImVec2(m.cols() * cell, m.rows() * cell));

        ImGui::End();
    }

    void AppUI::drawLoot() {
        ImGui::Begin("Loot");
        if (currentIndex < 0 || currentIndex >= (int)runs.size()) { ImGui::Text("No maze selected"); ImGui::End(); return; }
        const auto& loot = runs[currentIndex].result.loot;
        ImGui::Text("Carried %d / %d  (remaining %d)", loot.totalWeight, loot.capacity, loot.remaining);
        ImGui::Text("Value %d  [%s]", loot.totalValue, labelForValue(loot.totalValue, loot.capacity).c_str());
        ImGui::Separator();
        if (ImGui::BeginTable("loot", 4, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg)) {
            ImGui::TableSetupColumn("Id"); ImGui::TableSetupColumn("Weight");
            ImGui::TableSetupColumn("Value"); ImGui::TableSetupColumn("Ratio");
            ImGui::TableHeadersRow();
            for (int id : loot.order) {
                const auto& t = loot.taken.at(id);
                ImGui::TableNextRow();
                ImGui::TableNextColumn(); ImGui::Text("%d", t.id());
                ImGui::TableNextColumn(); ImGui::Text("%d", t.weight());
                ImGui::TableNextColumn(); ImGui::Text("%d", t.value());
                ImGui::TableNextColumn(); ImGui::Text("%.2f", t.ratio());
            }
            ImGui::EndTable();
        }
        ImGui::End();
    }

    void AppUI::drawHollows() {
        ImGui::Begin("Hollows");
        if (currentIndex < 0 || currentIndex >= (int)runs.size() || !runs[currentIndex].maze) { ImGui::Text("No maze selected"); ImGui::End(); return; }
        const Maze& m = *runs[currentIndex].maze;
        ImGui::Text("%d treasures left in %d hollows", m.treasuresLeft(), (int)m.hollows().size());
        int n = 0;
        for (const auto& h : m.hollows()) {
            std::string header;
            if (h->kind() == HollowKind::Spooky) header = "Spooky #" + std::to_string(++n);
            else {
                const auto* mh = static_cast<const MysticalHollow*>(h.get());
                header = "Mystical pool " + std::to_string(mh->pool()) + " (" + std::to_string(mh->linkedCells().size()) + " cells)";
                ++n;
            }
            header += " - " + std::to_string(h->size()) + " left##" + std::to_string(n);
            if (ImGui::TreeNode(header.c_str())) {
                for (const auto& t : h->candidates()) {
                    ImGui::BulletText("#%d  w=%d  v=%d  r=%.2f", t.id(), t.weight(), t.value(), t.ratio());
                }
                ImGui::TreePop();
            }
        }
        ImGui::End();
    }

    void AppUI::drawReports() {
        ImGui::Begin("Reports");
        if (loadedRows.empty()) { ImGui::TextDisabled("Load a CSV to list past runs."); ImGui::End(); return; }
        for (const auto& row : loadedRows) {
            std::vector<Position> route; std::vector<Treasure> items;
            bool ok = CsvIO::decodePath(row.path, route) && CsvIO::decodeLoot(row.loot, items);
            ImGui::Text("#%d %s  %s  steps=%d  items=%d  value=%d  left=%d/%d%s", row.index, row.name.c_str(),
                row.found ? "escaped" : "trapped", (int)route.size(), (int)items.size(), row.totalValue,
                row.remaining, row.capacity, ok ? "" : "  (malformed)");
        }
        ImGui::End();
    }

    int AppUI::run() {
        // SDL2 init
        if (SDL_Init(SDL_INIT_VIDEO) != 0) {
            printf("[SDL] init failed: %s\n", SDL_GetError());
            return 1;
        }
        SDL_Window* window = SDL_CreateWindow("Hollow Maze", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1400, 900, SDL_WINDOW_SHOWN);
        SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
        if (!window || !renderer) {
            printf("[SDL] window/renderer failed: %s\n", SDL_GetError());
            if (renderer) SDL_DestroyRenderer(renderer);
            if (window) SDL_DestroyWindow(window);
            SDL_Quit();
            return 1;
        }

        IMGUI_CHECKVERSION();
        ImGui::CreateContext();

        ImGuiIO& io = ImGui::GetIO(); (void)io;
        ImGui::StyleColorsDark();
        io.Fonts->AddFontDefault();

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
            drawLoot();
            drawHollows();
            drawReports();

            ImGui::Render();
            SDL_SetRenderDrawColor(renderer, 20, 20, 24, 255);
            SDL_RenderClear(renderer);
            ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
            SDL_RenderPresent(renderer);
        }

        ImGui_ImplSDLRenderer2_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 0;
    }

} // namespace hm
