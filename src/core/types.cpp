#include "apf_planner/core/types.hpp"
#include <cmath>
#include <cstdlib>
#include <utility>

namespace apf_planner {

// Position implementations
double Position::distance_to(const Position& other) const {
    double dr = row - other.row;
    double dc = col - other.col;
    return std::sqrt(dr * dr + dc * dc);
}

bool Position::is_neighbor_of(const Position& other) const {
    int dr = std::abs(row - other.row);
    int dc = std::abs(col - other.col);
    return dr <= 1 && dc <= 1 && (dr + dc) > 0;
}

bool Position::operator==(const Position& other) const {
    return row == other.row && col == other.col;
}

bool Position::operator!=(const Position& other) const {
    return !(*this == other);
}

// Grid implementations
Grid::Grid(std::vector<std::vector<CellType>> cells)
    : rows_(0), cols_(0), cells_(std::move(cells)) {

    if (cells_.empty() || cells_.front().empty()) {
        throw MalformedGridError("grid must have at least one row and one column");
    }

    rows_ = static_cast<int>(cells_.size());
    cols_ = static_cast<int>(cells_.front().size());

    int start_count = 0;
    int goal_count = 0;

    for (int r = 0; r < rows_; ++r) {
        if (static_cast<int>(cells_[r].size()) != cols_) {
            throw MalformedGridError(
                "row " + std::to_string(r) + " has " + std::to_string(cells_[r].size()) +
                " cells, expected " + std::to_string(cols_));
        }

        for (int c = 0; c < cols_; ++c) {
            switch (cells_[r][c]) {
                case CellType::Free:
                case CellType::Obstacle:
                    break;
                case CellType::Start:
                    start_ = Position(r, c);
                    ++start_count;
                    break;
                case CellType::Goal:
                    goal_ = Position(r, c);
                    ++goal_count;
                    break;
                default:
                    throw MalformedGridError(
                        "unknown cell code at (" + std::to_string(r) + ", " + std::to_string(c) + ")");
            }
        }
    }

    if (start_count != 1) {
        throw MalformedGridError(
            "grid must contain exactly one start cell, found " + std::to_string(start_count));
    }
    if (goal_count != 1) {
        throw MalformedGridError(
            "grid must contain exactly one goal cell, found " + std::to_string(goal_count));
    }
}

bool Grid::contains(const Position& pos) const {
    return pos.row >= 0 && pos.row < rows_ && pos.col >= 0 && pos.col < cols_;
}

bool Grid::is_obstacle(const Position& pos) const {
    return at(pos) == CellType::Obstacle;
}

bool Grid::mark_obstacle(const Position& pos) {
    CellType& cell = cells_[pos.row][pos.col];
    if (cell != CellType::Free) {
        return false;
    }
    cell = CellType::Obstacle;
    return true;
}

std::vector<Position> Grid::obstacle_cells() const {
    std::vector<Position> obstacles;
    for (int r = 0; r < rows_; ++r) {
        for (int c = 0; c < cols_; ++c) {
            if (cells_[r][c] == CellType::Obstacle) {
                obstacles.emplace_back(r, c);
            }
        }
    }
    return obstacles;
}

std::size_t Grid::obstacle_count() const {
    std::size_t count = 0;
    for (const auto& row : cells_) {
        for (const auto cell : row) {
            if (cell == CellType::Obstacle) {
                ++count;
            }
        }
    }
    return count;
}

bool Grid::operator==(const Grid& other) const {
    return cells_ == other.cells_;
}

bool Grid::operator!=(const Grid& other) const {
    return !(*this == other);
}

// Path implementations
void Path::add_point(const Position& pos) {
    points.push_back(pos);
}

double Path::total_cost() const {
    double cost = 0.0;
    for (std::size_t i = 1; i < points.size(); ++i) {
        cost += step_cost(points[i - 1], points[i]);
    }
    return cost;
}

bool Path::is_connected() const {
    for (std::size_t i = 1; i < points.size(); ++i) {
        if (!points[i].is_neighbor_of(points[i - 1])) {
            return false;
        }
    }
    return true;
}

double step_cost(const Position& from, const Position& to) {
    int dr = std::abs(to.row - from.row);
    int dc = std::abs(to.col - from.col);

    if (dr == 1 && dc == 1) {
        return std::sqrt(2.0);  // 対角線移動
    }
    return 1.0;  // 直線移動
}

const char* to_string(CellType type) {
    switch (type) {
        case CellType::Free: return "free";
        case CellType::Obstacle: return "obstacle";
        case CellType::Start: return "start";
        case CellType::Goal: return "goal";
    }
    return "unknown";
}

} // namespace apf_planner
