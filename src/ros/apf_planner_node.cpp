#include "apf_planner/ros/apf_planner_node.hpp"

namespace apf_planner
{

  ApfPlannerNode::ApfPlannerNode() : Node("apf_planner_node")
  {
    // パラメータ設定
    setup_parameters();

    // 設定初期化（不正な値はここで例外）
    config_ = create_config_from_parameters();

    path_planner_ = std::make_unique<PathPlanner>(config_);
    grid_converter_ = std::make_unique<OccupancyGridConverter>(
        this->get_parameter("occupied_threshold").as_int(),
        this->get_parameter("treat_unknown_as_obstacle").as_bool());

    // TF2関連初期化
    tf_buffer_ = std::make_shared<tf2_ros::Buffer>(this->get_clock());
    tf_listener_ = std::make_shared<tf2_ros::TransformListener>(*tf_buffer_);

    // パブリッシャー初期化
    path_pub_ = this->create_publisher<nav_msgs::msg::Path>("planned_path", 10);
    potential_field_pub_ = this->create_publisher<visualization_msgs::msg::MarkerArray>("potential_field", 10);

    // サブスクライバー初期化
    auto map_qos = rclcpp::QoS(1).reliable().transient_local();
    map_sub_ = this->create_subscription<nav_msgs::msg::OccupancyGrid>(
        "map", map_qos, std::bind(&ApfPlannerNode::map_callback, this, std::placeholders::_1));

    clicked_point_sub_ = this->create_subscription<geometry_msgs::msg::PointStamped>(
        "clicked_point", 10, std::bind(&ApfPlannerNode::clicked_point_callback, this, std::placeholders::_1));

    RCLCPP_INFO(this->get_logger(), "APF planner ready: footprint %dx%d, gains %.2f/%.2f, influence %.2f",
                config_.robot_height, config_.robot_width,
                config_.field.attractive_gain, config_.field.repulsive_gain,
                config_.field.influence_radius);
  }

  void ApfPlannerNode::setup_parameters()
  {
    // ポテンシャル場パラメータ
    this->declare_parameter("attractive_gain", 1.0);
    this->declare_parameter("repulsive_gain", 50.0);
    this->declare_parameter("obstacle_influence", 3.0);

    // ロボット形状パラメータ [cells]
    this->declare_parameter("robot_width", 2);
    this->declare_parameter("robot_height", 2);

    // 地図変換
    this->declare_parameter("occupied_threshold", 65);
    this->declare_parameter("treat_unknown_as_obstacle", true);

    // フレーム名
    this->declare_parameter("base_frame", "base_footprint");
    this->declare_parameter("global_frame", "map");

    // 可視化
    this->declare_parameter("publish_potential_field", true);
  }

  PlannerConfig ApfPlannerNode::create_config_from_parameters()
  {
    PlannerConfig config;

    config.robot_width = static_cast<int>(this->get_parameter("robot_width").as_int());
    config.robot_height = static_cast<int>(this->get_parameter("robot_height").as_int());

    config.field.attractive_gain = this->get_parameter("attractive_gain").as_double();
    config.field.repulsive_gain = this->get_parameter("repulsive_gain").as_double();
    config.field.influence_radius = this->get_parameter("obstacle_influence").as_double();

    config.validate();
    return config;
  }

} // namespace apf_planner
