#include "apf_planner/ros/apf_planner_node.hpp"
#include <geometry_msgs/msg/pose_stamped.hpp>
#include <std_msgs/msg/color_rgba.hpp>
#include <algorithm>
#include <cmath>

namespace apf_planner
{
  using namespace visualization_constants;

  void ApfPlannerNode::publish_path(const nav_msgs::msg::OccupancyGrid& map, const Path& path)
  {
    nav_msgs::msg::Path path_msg;
    path_msg.header.frame_id = this->get_parameter("global_frame").as_string();
    path_msg.header.stamp = this->get_clock()->now();

    for (const auto& cell : path.points)
    {
      geometry_msgs::msg::PoseStamped pose;
      pose.header = path_msg.header;
      pose.pose.position = OccupancyGridConverter::grid_to_world(map, cell);
      pose.pose.orientation.w = 1.0;
      path_msg.poses.push_back(pose);
    }

    path_pub_->publish(path_msg);
  }

  void ApfPlannerNode::publish_empty_visualization()
  {
    auto empty_marker_array = visualization_msgs::msg::MarkerArray();
    auto delete_marker = visualization_msgs::msg::Marker();
    delete_marker.header.frame_id = this->get_parameter("global_frame").as_string();
    delete_marker.header.stamp = this->get_clock()->now();
    delete_marker.action = visualization_msgs::msg::Marker::DELETEALL;
    delete_marker.id = 0;
    empty_marker_array.markers.push_back(delete_marker);

    potential_field_pub_->publish(empty_marker_array);
  }

  void ApfPlannerNode::publish_potential_field(const nav_msgs::msg::OccupancyGrid& map,
                                               const PotentialField& field)
  {
    auto marker_array = visualization_msgs::msg::MarkerArray();
    const std::string global_frame = this->get_parameter("global_frame").as_string();

    // 既存マーカーをクリア
    auto delete_marker = visualization_msgs::msg::Marker();
    delete_marker.header.frame_id = global_frame;
    delete_marker.header.stamp = this->get_clock()->now();
    delete_marker.action = visualization_msgs::msg::Marker::DELETEALL;
    delete_marker.id = 0;
    marker_array.markers.push_back(delete_marker);

    visualization_msgs::msg::Marker cells;
    cells.header.frame_id = global_frame;
    cells.header.stamp = delete_marker.header.stamp;
    cells.ns = "potential_field";
    cells.id = 1;
    cells.type = visualization_msgs::msg::Marker::CUBE_LIST;
    cells.action = visualization_msgs::msg::Marker::ADD;
    cells.pose.orientation.w = 1.0;
    cells.scale.x = map.info.resolution * DEFAULT_FIELD_STRIDE;
    cells.scale.y = map.info.resolution * DEFAULT_FIELD_STRIDE;
    cells.scale.z = FIELD_MARKER_HEIGHT;

    // 対数スケールで正規化（斥力のピークで色が飽和しないように）
    const double max_log_value = std::log1p(field.max_finite_value());

    for (int row = 0; row < field.rows(); row += DEFAULT_FIELD_STRIDE)
    {
      for (int col = 0; col < field.cols(); col += DEFAULT_FIELD_STRIDE)
      {
        const Position cell(row, col);
        if (field.is_impassable(cell)) {
          continue;
        }

        const double normalized = max_log_value > 0.0
            ? std::clamp(std::log1p(field.at(cell)) / max_log_value, 0.0, 1.0)
            : 0.0;

        // 低ポテンシャルは青、高ポテンシャルは赤
        std_msgs::msg::ColorRGBA color;
        color.r = static_cast<float>(normalized);
        color.g = 0.0f;
        color.b = static_cast<float>(1.0 - normalized);
        color.a = static_cast<float>(FIELD_MARKER_ALPHA);

        cells.points.push_back(OccupancyGridConverter::grid_to_world(map, cell));
        cells.colors.push_back(color);
      }
    }

    marker_array.markers.push_back(cells);
    potential_field_pub_->publish(marker_array);
  }

} // namespace apf_planner
