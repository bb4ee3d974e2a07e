#ifndef APF_PLANNER_ROS_OCCUPANCY_GRID_CONVERTER_HPP_
#define APF_PLANNER_ROS_OCCUPANCY_GRID_CONVERTER_HPP_

#include "apf_planner/core/types.hpp"
#include <cstdint>
#include <geometry_msgs/msg/point.hpp>
#include <nav_msgs/msg/occupancy_grid.hpp>

namespace apf_planner {

/**
 * @brief OccupancyGridから計画用グリッドへの変換クラス
 *
 * グリッドの行はy、列はxに対応する。
 */
class OccupancyGridConverter {
public:
    /**
     * @brief コンストラクタ
     * @param occupied_threshold この値以上の占有率を障害物とする
     * @param treat_unknown_as_obstacle 不明セル(-1)を障害物として扱うか
     */
    explicit OccupancyGridConverter(int occupied_threshold = 65,
                                    bool treat_unknown_as_obstacle = true);

    /**
     * @brief 地図と開始・目標位置（世界座標）から計画用グリッドを作成
     * @param map 占有格子地図
     * @param start 開始位置（世界座標）
     * @param goal 目標位置（世界座標）
     * @return 開始・目標セルを含むグリッド
     * @throws MalformedGridError 地図が空、または開始・目標が範囲外か障害物上の場合
     */
    Grid convert(const nav_msgs::msg::OccupancyGrid& map,
                 const geometry_msgs::msg::Point& start,
                 const geometry_msgs::msg::Point& goal) const;

    /**
     * @brief 世界座標をグリッド座標に変換
     */
    static Position world_to_grid(const nav_msgs::msg::OccupancyGrid& map,
                                  const geometry_msgs::msg::Point& point);

    /**
     * @brief グリッド座標をセル中心の世界座標に変換
     */
    static geometry_msgs::msg::Point grid_to_world(const nav_msgs::msg::OccupancyGrid& map,
                                                   const Position& cell);

    bool is_occupied(int8_t occupancy) const;

private:
    int occupied_threshold_;
    bool treat_unknown_as_obstacle_;
};

} // namespace apf_planner

#endif // APF_PLANNER_ROS_OCCUPANCY_GRID_CONVERTER_HPP_
