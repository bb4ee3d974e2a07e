#ifndef APF_PLANNER_CORE_PLANNING_STATISTICS_HPP_
#define APF_PLANNER_CORE_PLANNING_STATISTICS_HPP_

#include "apf_planner/core/path_extractor.hpp"
#include "apf_planner/core/types.hpp"
#include <cstddef>
#include <string>

namespace apf_planner {

/**
 * @brief 1回の経路計画の性能統計
 */
struct PlanningStatistics {
    double planning_time_ms;     // 場の生成 + 経路抽出 [ms]
    double field_time_ms;
    double extraction_time_ms;
    std::size_t nodes_explored;
    std::size_t path_length;     // 経由点数
    double path_cost;            // 移動コストの合計
    int map_rows;
    int map_cols;
    std::size_t num_obstacles;   // 膨張前の障害物セル数
    int robot_width;
    int robot_height;
    bool success;
    std::string failure_reason;
    ExtractionStrategy strategy;

    PlanningStatistics()
        : planning_time_ms(0.0), field_time_ms(0.0), extraction_time_ms(0.0),
          nodes_explored(0), path_length(0), path_cost(0.0),
          map_rows(0), map_cols(0), num_obstacles(0), robot_width(1), robot_height(1),
          success(false), strategy(ExtractionStrategy::AStar) {}

    void set_map_info(const Grid& grid, int width, int height);
    void set_result(const PathResult& result);

    /**
     * @brief 探索ノード数 / 全セル数
     */
    double exploration_ratio() const;

    /**
     * @brief 直線距離 / 経路コスト [%]（失敗時は0）
     */
    double path_efficiency(const Position& start, const Position& goal) const;

    std::string summary() const;
};

} // namespace apf_planner

#endif // APF_PLANNER_CORE_PLANNING_STATISTICS_HPP_
