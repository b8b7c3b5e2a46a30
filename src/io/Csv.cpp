// ========================= src/io/Csv.cpp =========================
#include "Csv.hpp"
#include <fstream>
#include <sstream>
#include <filesystem>

namespace hm {

    static std::string encodePath(const std::vector<Position>& path) {
        std::ostringstream oss;
        for (size_t i = 0; i < path.size(); ++i) {
            oss << path[i].row << '_' << path[i].col;
            if (i + 1 < path.size()) oss << '#';
        }
        return oss.str();
    }

    static std::string encodeLoot(const LootReport& loot) {
        std::ostringstream oss;
        for (size_t i = 0; i < loot.order.size(); ++i) {
            const auto& t = loot.taken.at(loot.order[i]);
            oss << t.id() << '_' << t.weight() << '_' << t.value();
            if (i + 1 < loot.order.size()) oss << '#';
        }
        return oss.str();
    }

    CsvRow CsvIO::encode(int index, const std::string& name, const SolveResult& res) {
        CsvRow row;
        row.index = index;
        row.name = name;
        row.found = res.found;
        row.path = encodePath(res.path);
        row.loot = encodeLoot(res.loot);
        row.capacity = res.loot.capacity;
        row.remaining = res.loot.remaining;
        row.totalValue = res.loot.totalValue;
        row.nodes = res.nodesExpanded;
        return row;
    }

    static std::vector<std::string> split(const std::string& s, char sep) {
        std::vector<std::string> out; std::string cur; std::istringstream iss(s);
        while (std::getline(iss, cur, sep)) out.push_back(cur);
        return out;
    }

    static bool toInt(const std::string& s, int& out) {
        if (s.empty()) return false;
        try { size_t used = 0; out = std::stoi(s, &used); return used == s.size(); }
        catch (const std::exception&) { return false; }
    }

    bool CsvIO::decodePath(const std::string& field, std::vector<Position>& out) {
        out.clear();
        if (field.empty()) return true;
        for (const auto& cell : split(field, '#')) {
            auto parts = split(cell, '_');
            Position p;
            if (parts.size() != 2 || !toInt(parts[0], p.row) || !toInt(parts[1], p.col)) return false;
            out.push_back(p);
        }
        return true;
    }

    bool CsvIO::decodeLoot(const std::string& field, std::vector<Treasure>& out) {
        out.clear();
        if (field.empty()) return true;
        for (const auto& item : split(field, '#')) {
            auto parts = split(item, '_');
            int id = 0, w = 0, v = 0;
            if (parts.size() != 3 || !toInt(parts[0], id) || !toInt(parts[1], w) || !toInt(parts[2], v)) return false;
            out.emplace_back(id, w, v);
        }
        return true;
    }

    static std::string esc(const std::string& s) {
        if (s.find_first_of(",\"") == std::string::npos) return s;
        std::string out = "\"";
        for (char c : s) { if (c == '"') out.push_back('"'); out.push_back(c); }
        out.push_back('"');
        return out;
    }

    bool CsvIO::save(const std::string& path, const std::vector<CsvRow>& rows, bool appendIfExists) {
        namespace fs = std::filesystem;
        std::error_code ec;
        bool exists = fs::exists(path, ec);
        std::ofstream f(path, std::ios::out | (appendIfExists ? std::ios::app : std::ios::trunc));
        if (!f) return false;
        if (!exists || !appendIfExists) {
            f << "index,name,found,path,loot,capacity,remaining,totalValue,nodes\n";
        }
        for (const auto& r : rows) {
            f << r.index << ',' << esc(r.name) << ',' << (r.found ? 1 : 0) << ',' << r.path << ',' << r.loot << ','
                << r.capacity << ',' << r.remaining << ',' << r.totalValue << ',' << r.nodes << "\n";
        }
        return bool(f);
    }

    // splits one CSV line, honouring "quoted, fields"
    static std::vector<std::string> cellsOf(const std::string& line) {
        std::vector<std::string> out; std::string cur; bool quoted = false;
        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (quoted) {
                if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') { cur.push_back('"'); ++i; }
                else if (c == '"') quoted = false;
                else cur.push_back(c);
            }
            else if (c == '"') quoted = true;
            else if (c == ',') { out.push_back(cur); cur.clear(); }
            else cur.push_back(c);
        }
        out.push_back(cur);
        return out;
    }

    std::vector<CsvRow> CsvIO::load(const std::string& path) {
        std::vector<CsvRow> out; std::ifstream f(path);
        if (!f) return out;
        std::string line; bool first = true;
        while (std::getline(f, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (first) { first = false; continue; }
            if (line.empty()) continue;
            auto cells = cellsOf(line);
            if (cells.size() < 9) continue;
            CsvRow r; int i = 0; int found = 0;
            bool ok = toInt(cells[i++], r.index);
            r.name = cells[i++];
            ok = ok && toInt(cells[i++], found);
            r.found = found != 0;
            r.path = cells[i++];
            r.loot = cells[i++];
            ok = ok && toInt(cells[i++], r.capacity);
            ok = ok && toInt(cells[i++], r.remaining);
            ok = ok && toInt(cells[i++], r.totalValue);
            ok = ok && toInt(cells[i++], r.nodes);
            if (!ok) continue; // malformed line
            out.push_back(std::move(r));
        }
        return out;
    }

} // namespace hm
