#include "apf_planner/io/grid_loader.hpp"
#include "apf_planner/utils/logging.hpp"
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace apf_planner {

Grid GridLoader::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open map file: " + filename);
    }

    Grid grid = loadFromStream(file);

    APF_LOG_INFO("grid_loader", logging::format_string(
        "loaded %s: %dx%d cells, %zu obstacles",
        filename.c_str(), grid.rows(), grid.cols(), grid.obstacle_count()));

    return grid;
}

Grid GridLoader::loadFromStream(std::istream& input) {
    std::vector<std::vector<CellType>> cells;
    std::string line;
    int line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;

        if (isIgnoredLine(line)) {
            continue;
        }

        std::vector<CellType> row;
        row.reserve(line.size());

        for (const char ch : line) {
            if (std::isspace(static_cast<unsigned char>(ch)) || ch == ',') {
                continue;
            }

            switch (ch) {
                case '0': row.push_back(CellType::Free); break;
                case '1': row.push_back(CellType::Obstacle); break;
                case '2': row.push_back(CellType::Start); break;
                case '3': row.push_back(CellType::Goal); break;
                default:
                    throw MalformedGridError(
                        "line " + std::to_string(line_number) +
                        ": unexpected cell code '" + std::string(1, ch) + "'");
            }
        }

        if (!cells.empty() && row.size() != cells.front().size()) {
            throw MalformedGridError(
                "line " + std::to_string(line_number) + ": row has " +
                std::to_string(row.size()) + " cells, expected " +
                std::to_string(cells.front().size()));
        }

        cells.push_back(std::move(row));
    }

    if (input.bad()) {
        throw std::runtime_error("read error while loading map");
    }

    return Grid(std::move(cells));
}

bool GridLoader::isIgnoredLine(const std::string& line) {
    for (const char ch : line) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            continue;
        }
        return ch == '#';
    }
    return true;  // 空行
}

} // namespace apf_planner
