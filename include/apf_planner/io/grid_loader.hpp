#ifndef APF_PLANNER_IO_GRID_LOADER_HPP_
#define APF_PLANNER_IO_GRID_LOADER_HPP_

#include "apf_planner/core/types.hpp"
#include <istream>
#include <string>

namespace apf_planner {

/**
 * @brief テキスト形式の占有格子地図の読み込み
 *
 * 1行が1行分のセルに対応し、各セルは 0(自由) 1(障害物) 2(開始) 3(目標)。
 * セル間の空白・カンマは任意。空行と '#' で始まる行は無視する。
 */
class GridLoader {
public:
    /**
     * @brief ファイルから読み込み
     * @param filename マップファイルのパス
     * @return 検証済みのグリッド
     * @throws std::runtime_error ファイルを開けない場合
     * @throws MalformedGridError 内容が不正な場合
     */
    static Grid loadFromFile(const std::string& filename);

    /**
     * @brief ストリームから読み込み
     * @throws MalformedGridError 内容が不正な場合
     */
    static Grid loadFromStream(std::istream& input);

private:
    static bool isIgnoredLine(const std::string& line);
};

} // namespace apf_planner

#endif // APF_PLANNER_IO_GRID_LOADER_HPP_
