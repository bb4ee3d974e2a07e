// src/core/potential_field_generator.cpp

#include "apf_planner/core/potential_field_generator.hpp"
#include "apf_planner/utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace apf_planner {

void PotentialFieldConfig::validate() const {
    if (attractive_gain < 0.0 || repulsive_gain < 0.0) {
        throw std::invalid_argument("potential field gains must be non-negative");
    }
    if (!(influence_radius > 0.0)) {
        throw std::invalid_argument("obstacle influence radius must be positive");
    }
    if (!(min_obstacle_distance > 0.0)) {
        throw std::invalid_argument("minimum obstacle distance must be positive");
    }
}

// PotentialField
PotentialField::PotentialField(int rows, int cols)
    : rows_(rows), cols_(cols),
      values_(rows, std::vector<double>(cols, 0.0)) {}

bool PotentialField::contains(const Position& pos) const {
    return pos.row >= 0 && pos.row < rows_ && pos.col >= 0 && pos.col < cols_;
}

bool PotentialField::is_impassable(const Position& pos) const {
    return std::isinf(at(pos));
}

double PotentialField::max_finite_value() const {
    double max_value = 0.0;
    for (const auto& row : values_) {
        for (const double value : row) {
            if (std::isfinite(value)) {
                max_value = std::max(max_value, value);
            }
        }
    }
    return max_value;
}

// コンストラクタ
PotentialFieldGenerator::PotentialFieldGenerator()
    : PotentialFieldGenerator(PotentialFieldConfig()) {}

PotentialFieldGenerator::PotentialFieldGenerator(const PotentialFieldConfig& config)
    : config_(config) {
    config_.validate();
}

PotentialField PotentialFieldGenerator::computeField(const Grid& grid, const Position& goal) const {
    if (!grid.contains(goal)) {
        throw MalformedGridError(
            "goal (" + std::to_string(goal.row) + ", " + std::to_string(goal.col) +
            ") is outside the grid");
    }

    PotentialField field(grid.rows(), grid.cols());

    // 障害物セルを事前に列挙（各セルから全障害物を走査する）
    const auto obstacles = grid.obstacle_cells();

    for (int row = 0; row < grid.rows(); ++row) {
        for (int col = 0; col < grid.cols(); ++col) {
            const Position cell(row, col);

            if (grid.is_obstacle(cell)) {
                field.set(cell, PotentialField::kImpassable);
                continue;
            }

            // 引力成分：ゴールから遠いほど高い
            const double attractive = attractivePotential(cell, goal);

            // 斥力成分：障害物に近いほど高い
            const double repulsive = repulsivePotential(nearestObstacleDistance(cell, obstacles));

            field.set(cell, attractive + repulsive);
        }
    }

    APF_LOG_DEBUG("potential_field", logging::format_string(
        "field %dx%d computed for goal (%d, %d), %zu obstacle cells",
        grid.rows(), grid.cols(), goal.row, goal.col, obstacles.size()));

    return field;
}

double PotentialFieldGenerator::attractivePotential(const Position& cell, const Position& goal) const {
    return config_.attractive_gain * cell.distance_to(goal);
}

double PotentialFieldGenerator::repulsivePotential(double obstacle_distance) const {
    // 影響半径外は斥力ゼロ（境界での平滑化なし）
    if (obstacle_distance > config_.influence_radius) {
        return 0.0;
    }

    const double distance = std::max(obstacle_distance, config_.min_obstacle_distance);
    const double term = 1.0 / distance - 1.0 / config_.influence_radius;
    return config_.repulsive_gain * term * term;
}

double PotentialFieldGenerator::nearestObstacleDistance(const Position& cell,
                                                        const std::vector<Position>& obstacles) {
    double min_distance = std::numeric_limits<double>::infinity();

    for (const auto& obstacle : obstacles) {
        const double distance = cell.distance_to(obstacle);
        if (distance < min_distance) {
            min_distance = distance;
        }
    }

    return min_distance;
}

}  // namespace apf_planner
