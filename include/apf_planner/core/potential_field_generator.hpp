// include/apf_planner/core/potential_field_generator.hpp

#ifndef APF_PLANNER_CORE_POTENTIAL_FIELD_GENERATOR_HPP_
#define APF_PLANNER_CORE_POTENTIAL_FIELD_GENERATOR_HPP_

#include "apf_planner/core/types.hpp"
#include <limits>
#include <vector>

namespace apf_planner {

/**
 * @brief ポテンシャル場の調整パラメータ
 */
struct PotentialFieldConfig {
    double attractive_gain = 1.0;        // 引力ゲイン
    double repulsive_gain = 50.0;        // 斥力ゲイン
    double influence_radius = 3.0;       // 斥力の影響半径[cells]
    double min_obstacle_distance = 0.1;  // 最小障害物距離[cells]（ゼロ除算防止）

    /**
     * @throws std::invalid_argument ゲインが負、または半径・最小距離が正でない場合
     */
    void validate() const;
};

// グリッド全体のスカラーポテンシャル場
class PotentialField {
public:
    static constexpr double kImpassable = std::numeric_limits<double>::infinity();

    PotentialField(int rows, int cols);

    int rows() const { return rows_; }
    int cols() const { return cols_; }

    double at(int row, int col) const { return values_[row][col]; }
    double at(const Position& pos) const { return values_[pos.row][pos.col]; }
    void set(const Position& pos, double value) { values_[pos.row][pos.col] = value; }

    bool contains(const Position& pos) const;
    bool is_impassable(const Position& pos) const;

    /**
     * @brief 有限値の最大ポテンシャル（可視化用）
     */
    double max_finite_value() const;

private:
    int rows_;
    int cols_;
    std::vector<std::vector<double>> values_;
};

class PotentialFieldGenerator {
public:
    PotentialFieldGenerator();
    explicit PotentialFieldGenerator(const PotentialFieldConfig& config);
    ~PotentialFieldGenerator() = default;

    // 引力と斥力を重ね合わせたポテンシャル場を計算
    PotentialField computeField(const Grid& grid, const Position& goal) const;

    // 引力ポテンシャル
    double attractivePotential(const Position& cell, const Position& goal) const;

    // 斥力ポテンシャル（距離0は最小距離に丸める）
    double repulsivePotential(double obstacle_distance) const;

    // 最も近い障害物セルまでのユークリッド距離（障害物なしは無限大）
    static double nearestObstacleDistance(const Position& cell,
                                          const std::vector<Position>& obstacles);

    const PotentialFieldConfig& getConfig() const { return config_; }

private:
    PotentialFieldConfig config_;
};

}  // namespace apf_planner

#endif  // APF_PLANNER_CORE_POTENTIAL_FIELD_GENERATOR_HPP_
