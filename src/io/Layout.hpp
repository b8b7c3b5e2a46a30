// ========================= src/io/Layout.hpp =========================
#pragma once
#include "../core/Maze.hpp"
#include <string>
#include <vector>

namespace hm {

    struct LayoutIO {
        // rows of the file; std::nullopt when it cannot be opened. Trailing '\r'
        // and trailing blank lines are dropped, everything else is kept verbatim.
        static std::optional<std::vector<std::string>> load(const std::string& path);

        static bool save(const std::string& path, const std::vector<std::string>& rows);
        static bool save(const std::string& path, const Maze& maze, const std::vector<Position>* route = nullptr);
    };

} // namespace hm
