#include "apf_planner/ros/occupancy_grid_converter.hpp"
#include <cmath>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace apf_planner {

namespace {
    constexpr int8_t UNKNOWN_CELL = -1;  // 不明なセルの値

    std::string describe(const char* label, const Position& cell) {
        return std::string(label) + " cell (" + std::to_string(cell.row) + ", " +
               std::to_string(cell.col) + ")";
    }
}

OccupancyGridConverter::OccupancyGridConverter(int occupied_threshold, bool treat_unknown_as_obstacle)
    : occupied_threshold_(occupied_threshold),
      treat_unknown_as_obstacle_(treat_unknown_as_obstacle) {}

Grid OccupancyGridConverter::convert(const nav_msgs::msg::OccupancyGrid& map,
                                     const geometry_msgs::msg::Point& start,
                                     const geometry_msgs::msg::Point& goal) const {
    const int width = static_cast<int>(map.info.width);
    const int height = static_cast<int>(map.info.height);

    if (width <= 0 || height <= 0) {
        throw MalformedGridError("occupancy grid is empty");
    }
    if (!(map.info.resolution > 0.0f)) {
        throw MalformedGridError(
            "occupancy grid resolution must be positive, got " + std::to_string(map.info.resolution));
    }
    if (map.data.size() != static_cast<std::size_t>(width) * static_cast<std::size_t>(height)) {
        throw MalformedGridError(
            "occupancy grid data has " + std::to_string(map.data.size()) +
            " cells, expected " + std::to_string(width * height));
    }

    // 占有格子データを2D配列に変換
    std::vector<std::vector<CellType>> cells(height, std::vector<CellType>(width, CellType::Free));
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            if (is_occupied(map.data[y * width + x])) {
                cells[y][x] = CellType::Obstacle;
            }
        }
    }

    const Position start_cell = world_to_grid(map, start);
    const Position goal_cell = world_to_grid(map, goal);

    for (const auto& [label, cell] : {std::make_pair("start", start_cell),
                                      std::make_pair("goal", goal_cell)}) {
        if (cell.row < 0 || cell.row >= height || cell.col < 0 || cell.col >= width) {
            throw MalformedGridError(describe(label, cell) + " is outside the map");
        }
        if (cells[cell.row][cell.col] == CellType::Obstacle) {
            throw MalformedGridError(describe(label, cell) + " is occupied");
        }
    }

    if (start_cell == goal_cell) {
        throw MalformedGridError(describe("start", start_cell) + " coincides with the goal");
    }

    cells[start_cell.row][start_cell.col] = CellType::Start;
    cells[goal_cell.row][goal_cell.col] = CellType::Goal;

    return Grid(std::move(cells));
}

Position OccupancyGridConverter::world_to_grid(const nav_msgs::msg::OccupancyGrid& map,
                                               const geometry_msgs::msg::Point& point) {
    const double resolution = map.info.resolution;
    const int x = static_cast<int>(std::floor((point.x - map.info.origin.position.x) / resolution));
    const int y = static_cast<int>(std::floor((point.y - map.info.origin.position.y) / resolution));
    return Position(y, x);
}

geometry_msgs::msg::Point OccupancyGridConverter::grid_to_world(const nav_msgs::msg::OccupancyGrid& map,
                                                                const Position& cell) {
    const double resolution = map.info.resolution;
    geometry_msgs::msg::Point point;
    point.x = map.info.origin.position.x + (cell.col + 0.5) * resolution;
    point.y = map.info.origin.position.y + (cell.row + 0.5) * resolution;
    point.z = 0.0;
    return point;
}

bool OccupancyGridConverter::is_occupied(int8_t occupancy) const {
    if (occupancy == UNKNOWN_CELL) {
        return treat_unknown_as_obstacle_;
    }
    return occupancy >= occupied_threshold_;
}

} // namespace apf_planner
