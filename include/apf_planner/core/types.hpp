#ifndef APF_PLANNER_CORE_TYPES_HPP_
#define APF_PLANNER_CORE_TYPES_HPP_

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace apf_planner {

/**
 * @brief セル種別（マップファイルの数値コードと一致）
 */
enum class CellType : int {
    Free = 0,       // 自由空間
    Obstacle = 1,   // 障害物
    Start = 2,      // 開始位置
    Goal = 3        // 目標位置
};

/**
 * @brief グリッド座標クラス (row, col)
 */
struct Position {
    int row, col;

    Position() : row(0), col(0) {}
    Position(int row, int col) : row(row), col(col) {}

    double distance_to(const Position& other) const;
    bool is_neighbor_of(const Position& other) const;
    bool operator==(const Position& other) const;
    bool operator!=(const Position& other) const;
};

/**
 * @brief グリッド契約違反（非矩形、サイズ0、開始・目標の欠落や重複など）
 */
class MalformedGridError : public std::invalid_argument {
public:
    explicit MalformedGridError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief 占有格子地図
 *
 * 構築時に矩形性と開始・目標セルの一意性を検証する。
 * 障害物の追加は自由セルに対してのみ許可されるため、不変条件は常に保たれる。
 */
class Grid {
public:
    /**
     * @brief 行データからグリッドを構築
     * @param cells 行ごとのセル種別
     * @throws MalformedGridError 不変条件を満たさない場合
     */
    explicit Grid(std::vector<std::vector<CellType>> cells);

    int rows() const { return rows_; }
    int cols() const { return cols_; }

    CellType at(int row, int col) const { return cells_[row][col]; }
    CellType at(const Position& pos) const { return cells_[pos.row][pos.col]; }

    bool contains(const Position& pos) const;
    bool is_obstacle(const Position& pos) const;

    const Position& start() const { return start_; }
    const Position& goal() const { return goal_; }

    /**
     * @brief 自由セルを障害物に変更
     * @param pos 対象セル
     * @return 変更した場合true（自由セル以外は変更しない）
     */
    bool mark_obstacle(const Position& pos);

    std::vector<Position> obstacle_cells() const;
    std::size_t obstacle_count() const;

    const std::vector<std::vector<CellType>>& cells() const { return cells_; }

    bool operator==(const Grid& other) const;
    bool operator!=(const Grid& other) const;

private:
    int rows_;
    int cols_;
    std::vector<std::vector<CellType>> cells_;
    Position start_;
    Position goal_;
};

/**
 * @brief グリッド上の経路クラス
 */
struct Path {
    std::vector<Position> points;

    void add_point(const Position& pos);
    bool empty() const { return points.empty(); }
    std::size_t size() const { return points.size(); }

    /**
     * @brief 経路長（軸方向1.0、対角√2の合計）
     */
    double total_cost() const;

    /**
     * @brief 隣接する点がすべて8近傍で連結しているか
     */
    bool is_connected() const;
};

/**
 * @brief 隣接セル間の移動コスト（対角線移動は√2倍）
 */
double step_cost(const Position& from, const Position& to);

const char* to_string(CellType type);

} // namespace apf_planner

#endif // APF_PLANNER_CORE_TYPES_HPP_
