// ========================= src/ui/App.hpp =========================
#pragma once
#include "../core/Generator.hpp"
#include "../core/Solver.hpp"
#include "../io/Csv.hpp"
#include "../io/Layout.hpp"
#include <string>
#include <thread>
#include <mutex>
#include <atomic>

namespace hm {

    // One solved puzzle kept in memory for viewing.
    struct Run {
        std::string name;
        std::vector<std::string> layout;
        uint64_t treasureSeed{ 0 };
        std::optional<Maze> maze;     // state after the solve (hollows depleted)
        SolveResult result;
    };

    class AppUI {
    public:
        AppUI();
        ~AppUI();
        int run(); // SDL2 + ImGui main loop

    private:
        Params p; GenOptions opt; int NtoGenerate{ 5 };
        std::vector<Run> runs;        // in-memory pool
        int currentIndex{ -1 };
        int viewIndexInput{ 1 };
        int playbackStep{ 0 };
        char layoutPath[256]{ "mazes/sample.txt" };
        char savePath[256]{ "runs.csv" };
        char loadPath[256]{ "runs.csv" };
        std::vector<CsvRow> loadedRows;

        // background batch generation
        std::thread generationThread;
        std::atomic<bool> isGenerating{ false };
        std::atomic<int> generationCompleted{ 0 };
        int generationTotal{ 0 };
        std::mutex pendingMutex;
        std::vector<Run> pendingRuns;

        std::mutex statusMutex;
        std::string statusMessage;

        void setStatus(const std::string& msg);
        std::string getStatus();

        // builds a maze from rows with fresh treasures and solves it
        static std::optional<Run> solveLayout(const std::string& name, const std::vector<std::string>& rows,
            const Params& p, const GenOptions& opt, std::string* reason);

        // UI helpers
        void drawTopBar();
        void drawViewer();
        void drawLoot();
        void drawHollows();
        void drawReports();
        void collectGenerated();

        void ensureIndex(int idx);
    };

} // namespace hm
