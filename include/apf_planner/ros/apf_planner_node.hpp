#ifndef APF_PLANNER_ROS_APF_PLANNER_NODE_HPP_
#define APF_PLANNER_ROS_APF_PLANNER_NODE_HPP_

#include <rclcpp/rclcpp.hpp>
#include <geometry_msgs/msg/point.hpp>
#include <geometry_msgs/msg/point_stamped.hpp>
#include <nav_msgs/msg/occupancy_grid.hpp>
#include <nav_msgs/msg/path.hpp>
#include <visualization_msgs/msg/marker_array.hpp>
#include <tf2_ros/buffer.h>
#include <tf2_ros/transform_listener.h>

#include "apf_planner/core/path_planner.hpp"
#include "apf_planner/ros/occupancy_grid_converter.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace apf_planner {

// 可視化パラメータの定数
namespace visualization_constants {
    constexpr int DEFAULT_FIELD_STRIDE = 1;          // ポテンシャル場のサンプリング間隔
    constexpr double FIELD_MARKER_HEIGHT = 0.02;     // セルマーカーの高さ[m]
    constexpr double FIELD_MARKER_ALPHA = 0.5;       // セルマーカーの透明度
}

/**
 * @brief 人工ポテンシャル場経路計画 ROS2ノード
 */
class ApfPlannerNode : public rclcpp::Node {
public:
    /**
     * @brief コンストラクタ
     */
    ApfPlannerNode();

private:
    // コア機能
    std::unique_ptr<PathPlanner> path_planner_;
    std::unique_ptr<OccupancyGridConverter> grid_converter_;
    PlannerConfig config_;

    // 状態変数
    std::optional<nav_msgs::msg::OccupancyGrid> current_map_;
    std::optional<geometry_msgs::msg::Point> goal_;

    // TF2関連
    std::shared_ptr<tf2_ros::Buffer> tf_buffer_;
    std::shared_ptr<tf2_ros::TransformListener> tf_listener_;

    // パブリッシャー
    rclcpp::Publisher<nav_msgs::msg::Path>::SharedPtr path_pub_;
    rclcpp::Publisher<visualization_msgs::msg::MarkerArray>::SharedPtr potential_field_pub_;

    // サブスクライバー
    rclcpp::Subscription<nav_msgs::msg::OccupancyGrid>::SharedPtr map_sub_;
    rclcpp::Subscription<geometry_msgs::msg::PointStamped>::SharedPtr clicked_point_sub_;

    /**
     * @brief パラメータ設定
     */
    void setup_parameters();

    /**
     * @brief ROS2パラメータからPlannerConfigを作成
     * @return 経路計画設定
     */
    PlannerConfig create_config_from_parameters();

    /**
     * @brief TFからロボット位置を取得
     * @return ロボット位置（失敗時はstd::nullopt）
     */
    std::optional<geometry_msgs::msg::Point> get_robot_position_from_tf();

    /**
     * @brief クリックされたポイントをゴールとして設定
     * @param msg PointStampedメッセージ
     */
    void clicked_point_callback(const geometry_msgs::msg::PointStamped::SharedPtr msg);

    /**
     * @brief 地図データコールバック
     * @param msg OccupancyGridメッセージ
     */
    void map_callback(const nav_msgs::msg::OccupancyGrid::SharedPtr msg);

    /**
     * @brief 地図・ゴール・ロボット位置が揃っていれば経路を計画して配信
     */
    void plan_and_publish();

    /**
     * @brief 計画経路の配信
     * @param map 計画に使用した地図
     * @param path グリッド上の経路
     */
    void publish_path(const nav_msgs::msg::OccupancyGrid& map, const Path& path);

    /**
     * @brief ポテンシャル場の可視化（障害物セルは描画しない）
     * @param map 計画に使用した地図
     * @param field ポテンシャル場
     */
    void publish_potential_field(const nav_msgs::msg::OccupancyGrid& map,
                                 const PotentialField& field);

    /**
     * @brief 空の可視化マーカーを送信（クリア用）
     */
    void publish_empty_visualization();
};

} // namespace apf_planner

#endif // APF_PLANNER_ROS_APF_PLANNER_NODE_HPP_
