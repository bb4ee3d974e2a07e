#ifndef APF_PLANNER_CORE_PATH_PLANNER_HPP_
#define APF_PLANNER_CORE_PATH_PLANNER_HPP_

#include "apf_planner/core/footprint_inflator.hpp"
#include "apf_planner/core/path_extractor.hpp"
#include "apf_planner/core/planning_statistics.hpp"
#include "apf_planner/core/potential_field_generator.hpp"
#include "apf_planner/core/types.hpp"

namespace apf_planner {

/**
 * @brief 経路計画パイプライン設定
 */
struct PlannerConfig {
    int robot_width = 2;           // ロボット幅 [cells]
    int robot_height = 2;          // ロボット高さ [cells]
    PotentialFieldConfig field;

    void validate() const;
};

/**
 * @brief 経路計画の結果一式
 */
struct PlanningResult {
    Grid inflated_grid;
    PotentialField field;
    PathResult path_result;
    PlanningStatistics statistics;

    bool success() const { return path_result.success(); }
};

/**
 * @brief 膨張 → ポテンシャル場 → 経路抽出 の経路計画パイプライン
 */
class PathPlanner {
public:
    PathPlanner();
    explicit PathPlanner(const PlannerConfig& config);

    /**
     * @brief グリッドの開始・目標セル間の経路を計画
     * @param grid 占有格子地図（変更しない）
     * @return 膨張後グリッド、ポテンシャル場、経路、統計情報
     */
    PlanningResult plan(const Grid& grid) const;

    const PlannerConfig& config() const { return config_; }

private:
    PlannerConfig config_;
    PotentialFieldGenerator field_generator_;
    PathExtractor path_extractor_;
};

} // namespace apf_planner

#endif // APF_PLANNER_CORE_PATH_PLANNER_HPP_
