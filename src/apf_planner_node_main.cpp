#include <rclcpp/rclcpp.hpp>
#include <memory>
#include <iostream>

#include "apf_planner/ros/apf_planner_node.hpp"

int main(int argc, char** argv)
{
    // ROS2の初期化
    rclcpp::init(argc, argv);

    try {
        // 経路計画ノードの作成
        auto node = std::make_shared<apf_planner::ApfPlannerNode>();

        // ノード実行
        rclcpp::spin(node);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        rclcpp::shutdown();
        return 1;
    }

    rclcpp::shutdown();
    return 0;
}
