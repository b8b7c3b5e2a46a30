// ========================= src/io/Layout.cpp =========================
#include "Layout.hpp"
#include <fstream>

namespace hm {

    std::optional<std::vector<std::string>> LayoutIO::load(const std::string& path) {
        std::ifstream f(path);
        if (!f) return std::nullopt;
        std::vector<std::string> rows; std::string line;
        while (std::getline(f, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            rows.push_back(line);
        }
        while (!rows.empty() && rows.back().empty()) rows.pop_back();
        return rows;
    }

    bool LayoutIO::save(const std::string& path, const std::vector<std::string>& rows) {
        std::ofstream f(path, std::ios::out | std::ios::trunc);
        if (!f) return false;
        for (const auto& r : rows) f << r << '\n';
        return bool(f);
    }

    bool LayoutIO::save(const std::string& path, const Maze& maze, const std::vector<Position>* route) {
        return save(path, maze.render(route));
    }

} // namespace hm
