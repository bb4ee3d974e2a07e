#include "apf_planner/core/path_planner.hpp"
#include "apf_planner/utils/logging.hpp"
#include "apf_planner/utils/time_utils.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace apf_planner {

void PlannerConfig::validate() const {
    if (robot_width < 1 || robot_height < 1) {
        throw std::invalid_argument(
            "robot footprint must be at least 1x1 cells, got " +
            std::to_string(robot_width) + "x" + std::to_string(robot_height));
    }
    field.validate();
}

PathPlanner::PathPlanner() : PathPlanner(PlannerConfig()) {}

PathPlanner::PathPlanner(const PlannerConfig& config)
    : config_(config), field_generator_(config.field) {
    config_.validate();
}

PlanningResult PathPlanner::plan(const Grid& grid) const {
    const Position start = grid.start();
    const Position goal = grid.goal();

    APF_LOG_INFO("planner", logging::format_string(
        "planning %dx%d grid: start (%d, %d) -> goal (%d, %d), footprint %dx%d",
        grid.rows(), grid.cols(), start.row, start.col, goal.row, goal.col,
        config_.robot_height, config_.robot_width));

    // ロボット形状に合わせて障害物を膨張
    Grid inflated_grid = FootprintInflator::inflate(grid, config_.robot_width, config_.robot_height);

    time_utils::StageTimer stage_timer;

    // ポテンシャル場の生成
    stage_timer.begin("field");
    PotentialField field = field_generator_.computeField(inflated_grid, goal);

    // 経路抽出
    stage_timer.begin("extraction");
    PathResult path_result = path_extractor_.extract_path(field, start, goal);
    stage_timer.finish();

    PlanningStatistics statistics;
    statistics.set_map_info(grid, config_.robot_width, config_.robot_height);
    statistics.set_result(path_result);
    statistics.field_time_ms = stage_timer.stage_ms("field");
    statistics.extraction_time_ms = stage_timer.stage_ms("extraction");
    statistics.planning_time_ms = stage_timer.total_ms();

    if (path_result.success()) {
        APF_LOG_INFO("planner", logging::format_string(
            "path found: %zu waypoints, cost %.2f, %s in %s",
            path_result.path.size(), path_result.path.total_cost(),
            to_string(path_result.metrics.strategy),
            time_utils::format_duration(statistics.planning_time_ms / 1000.0).c_str()));
    } else {
        APF_LOG_WARN("planner", logging::format_string(
            "goal not reached: partial path of %zu waypoints (%s)",
            path_result.path.size(), to_string(path_result.metrics.termination)));
    }

    return PlanningResult{std::move(inflated_grid), std::move(field),
                          std::move(path_result), std::move(statistics)};
}

} // namespace apf_planner
