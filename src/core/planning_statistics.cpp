#include "apf_planner/core/planning_statistics.hpp"
#include <iomanip>
#include <sstream>

namespace apf_planner {

void PlanningStatistics::set_map_info(const Grid& grid, int width, int height) {
    map_rows = grid.rows();
    map_cols = grid.cols();
    num_obstacles = grid.obstacle_count();
    robot_width = width;
    robot_height = height;
}

void PlanningStatistics::set_result(const PathResult& result) {
    nodes_explored = result.metrics.nodes_expanded;
    strategy = result.metrics.strategy;
    success = result.success();
    path_length = result.path.size();
    path_cost = result.path.total_cost();

    if (success) {
        failure_reason.clear();
    } else {
        failure_reason = std::string("goal not reached (") +
                         to_string(result.metrics.termination) + ")";
    }
}

double PlanningStatistics::exploration_ratio() const {
    const double cells = static_cast<double>(map_rows) * static_cast<double>(map_cols);
    if (cells <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(nodes_explored) / cells;
}

double PlanningStatistics::path_efficiency(const Position& start, const Position& goal) const {
    if (!success || path_cost <= 0.0) {
        return 0.0;
    }
    return start.distance_to(goal) / path_cost * 100.0;
}

std::string PlanningStatistics::summary() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "Planning Statistics:\n";
    oss << "====================\n";
    oss << "  Map size:        " << map_rows << " x " << map_cols << " cells\n";
    oss << "  Obstacles:       " << num_obstacles << " cells\n";
    oss << "  Robot footprint: " << robot_height << " x " << robot_width << " cells\n";
    oss << "  Planning time:   " << planning_time_ms << " ms"
        << " (field " << field_time_ms << " ms, extraction " << extraction_time_ms << " ms)\n";
    oss << "  Nodes explored:  " << nodes_explored
        << " (" << (exploration_ratio() * 100.0) << "% of map)\n";
    oss << "  Strategy:        " << to_string(strategy) << "\n";
    oss << "  Path length:     " << path_length << " waypoints\n";
    oss << "  Path cost:       " << path_cost << "\n";
    oss << "  Result:          " << (success ? "SUCCESS" : "FAILED");
    if (!success && !failure_reason.empty()) {
        oss << " - " << failure_reason;
    }
    oss << "\n";
    return oss.str();
}

} // namespace apf_planner
