#ifndef APF_PLANNER_CORE_PATH_EXTRACTOR_HPP_
#define APF_PLANNER_CORE_PATH_EXTRACTOR_HPP_

#include "apf_planner/core/potential_field_generator.hpp"
#include "apf_planner/core/types.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace apf_planner {

/**
 * @brief 経路を生成した探索戦略
 */
enum class ExtractionStrategy {
    AStar,            // 主戦略：ポテンシャル場をヒューリスティックとするA*
    GradientDescent   // 代替戦略：最急降下
};

/**
 * @brief A*探索が失敗した理由
 */
enum class SearchFailure {
    None,               // 失敗なし
    FrontierExhausted,  // オープンリストが空になった（到達不可能）
    IterationLimit      // 反復上限に到達
};

/**
 * @brief 経路抽出の終了理由
 */
enum class TerminationReason {
    ReachedGoal,  // 目標に到達
    DeadEnd,      // 有限ポテンシャルの隣接セルなし
    Cycle,        // 振動・平坦部による循環を検出
    StepLimit     // ステップ上限に到達
};

/**
 * @brief 経路抽出の統計情報
 */
struct ExtractionMetrics {
    std::size_t nodes_expanded;
    std::size_t descent_steps;
    ExtractionStrategy strategy;
    SearchFailure search_failure;
    TerminationReason termination;

    ExtractionMetrics()
        : nodes_expanded(0), descent_steps(0),
          strategy(ExtractionStrategy::AStar),
          search_failure(SearchFailure::None),
          termination(TerminationReason::ReachedGoal) {}

    bool fallback_used() const { return strategy == ExtractionStrategy::GradientDescent; }
};

/**
 * @brief 経路抽出の結果
 */
struct PathResult {
    Path path;
    ExtractionMetrics metrics;

    bool success() const { return metrics.termination == TerminationReason::ReachedGoal; }
};

/**
 * @brief 直近の訪問位置を保持する固定長リングバッファ
 */
class PositionHistory {
public:
    static constexpr std::size_t kCapacity = 20;

    PositionHistory();

    void push(const Position& pos);
    std::size_t count(const Position& pos) const;
    std::size_t size() const { return size_; }

private:
    std::array<Position, kCapacity> buffer_;
    std::size_t head_;
    std::size_t size_;
};

/**
 * @brief ポテンシャル場からの経路抽出クラス
 *
 * A*探索を試行し、目標に到達しない場合は最急降下にフォールバックする。
 * A*の優先度は累積コスト + ポテンシャル値で、斥力項がヒューリスティックを
 * 過大評価し得るため最適性は保証されない。
 */
class PathExtractor {
public:
    /**
     * @brief 8近傍の方向（北、南、西、東、北西、北東、南西、南東）
     */
    static constexpr int kDirectionCount = 8;
    static const std::array<std::array<int, 2>, kDirectionCount> kDirections;

    /**
     * @brief 探索の反復上限係数（rows × cols × 係数）
     */
    static constexpr std::size_t kSearchIterationFactor = 4;
    static constexpr std::size_t kDescentStepFactor = 2;

    /**
     * @brief 循環判定を開始するステップ数と許容出現回数
     */
    static constexpr std::size_t kCycleCheckStartStep = 10;
    static constexpr std::size_t kMaxRepetitions = 2;

    PathExtractor() = default;

    /**
     * @brief 開始位置から目標位置までの経路を抽出
     * @param field ポテンシャル場
     * @param start 開始位置
     * @param goal 目標位置
     * @return 経路と統計情報（目標未到達の場合は部分経路）
     * @throws MalformedGridError 開始・目標が場の範囲外の場合
     */
    PathResult extract_path(const PotentialField& field,
                            const Position& start, const Position& goal) const;

    /**
     * @brief A*探索（主戦略）
     * @param field ポテンシャル場
     * @param start 開始位置
     * @param goal 目標位置
     * @param metrics 展開ノード数と失敗理由を記録
     * @return 目標までの経路（失敗時は空）
     */
    Path search_astar(const PotentialField& field, const Position& start,
                      const Position& goal, ExtractionMetrics& metrics) const;

    /**
     * @brief 循環検出付き最急降下（代替戦略）
     * @param field ポテンシャル場
     * @param start 開始位置
     * @param goal 目標位置
     * @param metrics 降下ステップ数と終了理由を記録
     * @return 開始位置から停止位置までの経路
     */
    Path descend_gradient(const PotentialField& field, const Position& start,
                          const Position& goal, ExtractionMetrics& metrics) const;

private:
    /**
     * @brief オープンリストの要素（同一優先度は挿入順）
     */
    struct FrontierEntry {
        double priority;
        double g_cost;
        std::uint64_t sequence;
        Position position;
    };

    struct FrontierCompare {
        bool operator()(const FrontierEntry& a, const FrontierEntry& b) const {
            if (a.priority != b.priority) {
                return a.priority > b.priority;  // 小さい優先度を先に
            }
            return a.sequence > b.sequence;      // 先に挿入された要素を先に
        }
    };

    static Path reconstruct_path(const std::vector<int>& parents, int cols,
                                 const Position& goal);
};

const char* to_string(ExtractionStrategy strategy);
const char* to_string(SearchFailure failure);
const char* to_string(TerminationReason reason);

} // namespace apf_planner

#endif // APF_PLANNER_CORE_PATH_EXTRACTOR_HPP_
