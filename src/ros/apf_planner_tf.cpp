#include "apf_planner/ros/apf_planner_node.hpp"
#include <tf2/exceptions.h>

namespace apf_planner
{

  std::optional<geometry_msgs::msg::Point> ApfPlannerNode::get_robot_position_from_tf()
  {
    try
    {
      std::string base_frame = this->get_parameter("base_frame").as_string();
      std::string global_frame = this->get_parameter("global_frame").as_string();

      // TF取得
      geometry_msgs::msg::TransformStamped transform_stamped;
      transform_stamped = tf_buffer_->lookupTransform(
          global_frame, base_frame, tf2::TimePointZero, tf2::durationFromSec(0.1));

      // 位置の取得（姿勢は計画に使用しない）
      geometry_msgs::msg::Point position;
      position.x = transform_stamped.transform.translation.x;
      position.y = transform_stamped.transform.translation.y;
      position.z = 0.0;

      return position;
    }
    catch (const tf2::TransformException &ex)
    {
      RCLCPP_DEBUG(this->get_logger(), "TF lookup failed: %s", ex.what());
      return std::nullopt;
    }
  }

} // namespace apf_planner
