#include "apf_planner/ros/apf_planner_node.hpp"

namespace apf_planner
{

  void ApfPlannerNode::clicked_point_callback(const geometry_msgs::msg::PointStamped::SharedPtr msg)
  {
    goal_ = msg->point;
    RCLCPP_INFO(this->get_logger(), "Goal set: (%.2f, %.2f)", msg->point.x, msg->point.y);

    plan_and_publish();
  }

  void ApfPlannerNode::map_callback(const nav_msgs::msg::OccupancyGrid::SharedPtr msg)
  {
    RCLCPP_INFO(this->get_logger(), "Map received: %dx%d, resolution: %.3f m/cell",
                msg->info.width, msg->info.height, msg->info.resolution);

    // マップを保存
    current_map_ = *msg;

    // ゴールが設定されている場合は新しい地図で再計画
    if (goal_.has_value()) {
      plan_and_publish();
    }
  }

  void ApfPlannerNode::plan_and_publish()
  {
    if (!current_map_.has_value()) {
      RCLCPP_WARN(this->get_logger(), "No map received yet, cannot plan");
      return;
    }
    if (!goal_.has_value()) {
      return;
    }

    const auto robot_position = get_robot_position_from_tf();
    if (!robot_position.has_value()) {
      RCLCPP_WARN(this->get_logger(), "Robot pose unavailable, cannot plan");
      return;
    }

    try
    {
      const auto& map = current_map_.value();
      const Grid grid = grid_converter_->convert(map, robot_position.value(), goal_.value());

      const auto result = path_planner_->plan(grid);
      const auto& metrics = result.path_result.metrics;

      if (result.success()) {
        RCLCPP_INFO(this->get_logger(), "Path found: %zu waypoints (%s, %zu nodes, %.2f ms)",
                    result.path_result.path.size(), to_string(metrics.strategy),
                    metrics.nodes_expanded, result.statistics.planning_time_ms);
      } else {
        RCLCPP_WARN(this->get_logger(), "Goal not reached: partial path of %zu waypoints (%s)",
                    result.path_result.path.size(), to_string(metrics.termination));
      }

      publish_path(map, result.path_result.path);

      if (this->get_parameter("publish_potential_field").as_bool()) {
        publish_potential_field(map, result.field);
      }
    }
    catch (const std::exception &e)
    {
      RCLCPP_ERROR(this->get_logger(), "Planning error: %s", e.what());
      publish_empty_visualization();
    }
  }

} // namespace apf_planner
