// ========================= src/io/Csv.hpp =========================
#pragma once
#include "../core/Solver.hpp"
#include <string>
#include <vector>

namespace hm {

    struct CsvRow {
        int index{ 0 };             // run number
        std::string name;           // layout file or "gen-<seed>"
        bool found{ false };
        std::string path;           // e.g. 1_1#1_2#2_2
        std::string loot;           // e.g. 4_3_12#9_2_5  (id_weight_value)
        int capacity{ 0 };
        int remaining{ 0 };
        int totalValue{ 0 };
        int nodes{ 0 };
    };

    struct CsvIO {
        static CsvRow encode(int index, const std::string& name, const SolveResult& res);
        static bool decodePath(const std::string& field, std::vector<Position>& out);
        static bool decodeLoot(const std::string& field, std::vector<Treasure>& out);

        static bool save(const std::string& path, const std::vector<CsvRow>& rows, bool appendIfExists = true);
        static std::vector<CsvRow> load(const std::string& path);
    };

} // namespace hm
