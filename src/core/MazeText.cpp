/**
 * @file MazeText.cpp
 * @brief Implementação do formato texto de labirintos.
 */
#include "MazeText.hpp"
#include "Log.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace breach {

std::optional<Rows> parse_maze_text(std::istream& in, MazeDefect* defect) {
    auto fail = [&](MazeDefect d) -> std::optional<Rows> { if (defect) *defect = d; return std::nullopt; };
    Rows rows;
    std::string line;
    while (std::getline(in, line)) {
        std::vector<int> row;
        bool comment = false;
        for (char c : line) {
            if (c == ' ' || c == '\t' || c == '\r' || c == ',' || c == '[' || c == ']') continue;
            if (c == '#' && row.empty()) { comment = true; break; }
            if (c == '0' || c == '1') { row.push_back(c - '0'); continue; }
            return fail(MazeDefect::BadTile);
        }
        if (comment || row.empty()) continue;
        rows.push_back(std::move(row));
    }
    // Reaproveita a validação de forma da grade (vazio / irregular)
    MazeDefect d = MazeDefect::None;
    if (!Grid::from_rows(rows, &d)) return fail(d);
    if (defect) *defect = MazeDefect::None;
    return rows;
}

std::string format_maze_text(const Rows& rows) {
    std::ostringstream os;
    for (const auto& r : rows) {
        for (size_t c = 0; c < r.size(); ++c) {
            if (c) os << ' ';
            os << r[c];
        }
        os << '\n';
    }
    return os.str();
}

bool load_maze_file(const std::string& path, Rows* out, MazeDefect* defect) {
    if (!out) return false;
    std::ifstream ifs(path);
    if (!ifs) {
        BREACH_LOGE("MAZE", "falha ao abrir %s", path.c_str());
        return false;
    }
    MazeDefect d = MazeDefect::None;
    auto rows = parse_maze_text(ifs, &d);
    if (defect) *defect = d;
    if (!rows) {
        BREACH_LOGE("MAZE", "%s invalido: %s", path.c_str(), to_string(d));
        return false;
    }
    *out = std::move(*rows);
    BREACH_LOGI("MAZE", "carregado %s (%dx%d)", path.c_str(), (int)out->size(), (int)out->front().size());
    return true;
}

bool save_maze_file(const std::string& path, const Rows& rows) {
    namespace fs = std::filesystem;
    const fs::path file(path);
    if (file.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(file.parent_path(), ec);
        if (ec) {
            BREACH_LOGE("MAZE", "create dir failed: %s", ec.message().c_str());
            return false;
        }
    }
    std::ofstream ofs(file, std::ios::trunc);
    if (!ofs) {
        BREACH_LOGE("MAZE", "open write failed: %s", path.c_str());
        return false;
    }
    ofs << format_maze_text(rows);
    ofs.close();
    if (!ofs) {
        BREACH_LOGE("MAZE", "write failed: %s", path.c_str());
        return false;
    }
    BREACH_LOGI("MAZE", "salvo -> %s", path.c_str());
    return true;
}

} // namespace breach
