#ifndef APF_PLANNER_CORE_FOOTPRINT_INFLATOR_HPP_
#define APF_PLANNER_CORE_FOOTPRINT_INFLATOR_HPP_

#include "apf_planner/core/types.hpp"

namespace apf_planner {

/**
 * @brief ロボットの矩形フットプリントに基づく障害物膨張クラス
 *
 * 膨張後のグリッドではロボットを点として扱える。
 * 開始・目標セルは膨張範囲内にあっても障害物に変更しない。
 */
class FootprintInflator {
public:
    /**
     * @brief 障害物をフットプリントの半幅・半高さ分だけ膨張
     * @param grid 元の占有格子地図（変更しない）
     * @param footprint_width ロボット幅 [cells]
     * @param footprint_height ロボット高さ [cells]
     * @return 膨張後の新しいグリッド
     * @throws std::invalid_argument 幅または高さが1未満の場合
     */
    static Grid inflate(const Grid& grid, int footprint_width, int footprint_height);

    /**
     * @brief 指定位置にロボットを置いた場合の衝突判定
     * @param grid 占有格子地図
     * @param center ロボット中心のグリッド座標
     * @param footprint_width ロボット幅 [cells]
     * @param footprint_height ロボット高さ [cells]
     * @return フットプリントが範囲外または障害物に掛かる場合true
     */
    static bool collides(const Grid& grid, const Position& center,
                         int footprint_width, int footprint_height);

private:
    static void validate_footprint(int footprint_width, int footprint_height);
};

} // namespace apf_planner

#endif // APF_PLANNER_CORE_FOOTPRINT_INFLATOR_HPP_
