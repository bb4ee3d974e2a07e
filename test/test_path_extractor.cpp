// test/test_path_extractor.cpp

#include <gtest/gtest.h>
#include "apf_planner/core/path_extractor.hpp"
#include "apf_planner/core/potential_field_generator.hpp"
#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

using namespace apf_planner;

class PathExtractorTest : public ::testing::Test {
protected:
    PathExtractor extractor;
    PotentialFieldGenerator generator;

    static Grid makeGrid(int rows, int cols, const std::vector<Position>& obstacles,
                         const Position& start, const Position& goal) {
        std::vector<std::vector<CellType>> cells(rows, std::vector<CellType>(cols, CellType::Free));
        for (const auto& obstacle : obstacles) {
            cells[obstacle.row][obstacle.col] = CellType::Obstacle;
        }
        cells[start.row][start.col] = CellType::Start;
        cells[goal.row][goal.col] = CellType::Goal;
        return Grid(cells);
    }

    PotentialField fieldFor(const Grid& grid) const {
        return generator.computeField(grid, grid.goal());
    }

    // 経路が8連結で障害物を通らないことを検証
    static void expectValidPath(const Path& path, const Grid& grid) {
        ASSERT_FALSE(path.empty());
        EXPECT_TRUE(path.is_connected());
        for (const auto& point : path.points) {
            EXPECT_TRUE(grid.contains(point));
            EXPECT_FALSE(grid.is_obstacle(point))
                << "path crosses obstacle (" << point.row << ", " << point.col << ")";
        }
    }
};

// TEST 1: 中央に障害物がある5x5グリッド
TEST_F(PathExtractorTest, RoutesAroundCentralObstacle) {
    // Given: (2,2)に障害物、開始(0,0)、目標(4,4)
    Grid grid = makeGrid(5, 5, {Position(2, 2)}, Position(0, 0), Position(4, 4));
    PotentialField field = fieldFor(grid);

    // When: 経路抽出
    PathResult result = extractor.extract_path(field, grid.start(), grid.goal());

    // Then: A*で目標に到達し、障害物を迂回する
    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.metrics.strategy, ExtractionStrategy::AStar);
    EXPECT_EQ(result.metrics.search_failure, SearchFailure::None);
    EXPECT_FALSE(result.metrics.fallback_used());
    EXPECT_EQ(result.path.points.front(), grid.start());
    EXPECT_EQ(result.path.points.back(), grid.goal());
    EXPECT_GE(result.path.size(), 5u);
    EXPECT_LE(result.path.size(), 9u);
    expectValidPath(result.path, grid);

    // 斥力により(2,2)から離れた左下回りの経路
    const std::vector<Position> expected = {
        Position(0, 0), Position(1, 0), Position(2, 0), Position(3, 0),
        Position(4, 1), Position(4, 2), Position(4, 3), Position(4, 4)};
    EXPECT_EQ(result.path.points, expected);
    EXPECT_EQ(result.metrics.nodes_expanded, 14u);
}

// TEST 2: 障害物なしグリッドの全ペアで到達
TEST_F(PathExtractorTest, ObstacleFreeGridsAlwaysReachGoal) {
    const std::vector<std::pair<int, int>> sizes = {{1, 2}, {3, 3}, {4, 6}, {8, 5}};

    for (const auto& size : sizes) {
        const int rows = size.first;
        const int cols = size.second;
        for (int s = 0; s < rows * cols; ++s) {
            for (int g = 0; g < rows * cols; ++g) {
                if (s == g) {
                    continue;
                }
                const Position start(s / cols, s % cols);
                const Position goal(g / cols, g % cols);
                Grid grid = makeGrid(rows, cols, {}, start, goal);
                PotentialField field = fieldFor(grid);

                // A*
                PathResult result = extractor.extract_path(field, start, goal);
                ASSERT_TRUE(result.success());
                EXPECT_EQ(result.path.points.back(), goal);
                expectValidPath(result.path, grid);

                // 最急降下単体でも到達する
                ExtractionMetrics metrics;
                Path descent = extractor.descend_gradient(field, start, goal, metrics);
                EXPECT_EQ(metrics.termination, TerminationReason::ReachedGoal);
                EXPECT_EQ(descent.points.back(), goal);
                EXPECT_LE(metrics.descent_steps, static_cast<std::size_t>(2 * rows * cols));
            }
        }
    }
}

// TEST 3: 開始位置が障害物に囲まれている
TEST_F(PathExtractorTest, EnclosedStartEndsInDeadEnd) {
    // Given: 開始(2,2)の周囲8セルが障害物
    std::vector<Position> ring;
    for (int r = 1; r <= 3; ++r) {
        for (int c = 1; c <= 3; ++c) {
            if (r != 2 || c != 2) {
                ring.emplace_back(r, c);
            }
        }
    }
    Grid grid = makeGrid(5, 5, ring, Position(2, 2), Position(4, 4));
    PotentialField field = fieldFor(grid);

    // When
    PathResult result = extractor.extract_path(field, grid.start(), grid.goal());

    // Then: 開始位置のみの部分経路
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.path.points, std::vector<Position>{Position(2, 2)});
    EXPECT_EQ(result.metrics.strategy, ExtractionStrategy::GradientDescent);
    EXPECT_EQ(result.metrics.search_failure, SearchFailure::FrontierExhausted);
    EXPECT_EQ(result.metrics.termination, TerminationReason::DeadEnd);
    EXPECT_EQ(result.metrics.nodes_expanded, 1u);
    EXPECT_EQ(result.metrics.descent_steps, 0u);
}

// TEST 4: 壁で分断されたグリッドでは循環を検出して停止
TEST_F(PathExtractorTest, UnreachableGoalBehindWallEndsInCycle) {
    // Given: 列3が全て障害物
    std::vector<Position> wall;
    for (int r = 0; r < 7; ++r) {
        wall.emplace_back(r, 3);
    }
    Grid grid = makeGrid(7, 7, wall, Position(3, 0), Position(3, 6));
    PotentialField field = fieldFor(grid);

    // When
    PathResult result = extractor.extract_path(field, grid.start(), grid.goal());

    // Then: 到達可能な左側を展開しきった後、最急降下が振動して停止
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.metrics.search_failure, SearchFailure::FrontierExhausted);
    EXPECT_EQ(result.metrics.nodes_expanded, 21u);
    EXPECT_TRUE(result.metrics.fallback_used());
    EXPECT_EQ(result.metrics.termination, TerminationReason::Cycle);
    EXPECT_EQ(result.path.size(), static_cast<std::size_t>(PathExtractor::kCycleCheckStartStep + 2));
    EXPECT_EQ(result.path.points.front(), grid.start());
    expectValidPath(result.path, grid);
    for (const auto& point : result.path.points) {
        EXPECT_LT(point.col, 3);
    }
}

// TEST 5: 循環検出後は直近20件で同一セルが3回以上現れない
TEST_F(PathExtractorTest, CycleHaltBoundsRepetitionsInRecentWindow) {
    // Given: 目標が障害物リングに囲まれた8x8グリッド
    std::vector<Position> ring;
    for (int r = 4; r <= 6; ++r) {
        for (int c = 4; c <= 6; ++c) {
            if (r != 5 || c != 5) {
                ring.emplace_back(r, c);
            }
        }
    }
    Grid grid = makeGrid(8, 8, ring, Position(0, 0), Position(5, 5));
    PotentialField field = fieldFor(grid);

    // When
    PathResult result = extractor.extract_path(field, grid.start(), grid.goal());

    // Then
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.metrics.termination, TerminationReason::Cycle);
    expectValidPath(result.path, grid);

    // 循環判定が有効なステップで追加された点について検証
    const auto& points = result.path.points;
    const std::size_t first_checked = PathExtractor::kCycleCheckStartStep + 2;
    for (std::size_t k = first_checked; k < points.size(); ++k) {
        const std::size_t window_begin = k >= PositionHistory::kCapacity ? k - PositionHistory::kCapacity : 0;
        const auto occurrences = std::count(points.begin() + window_begin, points.begin() + k, points[k]);
        EXPECT_LE(static_cast<std::size_t>(occurrences), PathExtractor::kMaxRepetitions) << "index " << k;
    }
}

// TEST 6: U字トラップ：最急降下は捕まるがA*は脱出する
TEST_F(PathExtractorTest, AStarEscapesLocalMinimumThatTrapsDescent) {
    // Given: 目標方向に開いたU字型の障害物
    const std::vector<Position> trap = {
        Position(2, 5), Position(3, 5), Position(4, 5), Position(5, 5), Position(6, 5),
        Position(2, 3), Position(2, 4), Position(6, 3), Position(6, 4)};
    Grid grid = makeGrid(9, 9, trap, Position(4, 0), Position(4, 8));
    PotentialField field = fieldFor(grid);

    // When: 最急降下のみ
    ExtractionMetrics descent_metrics;
    Path descent = extractor.descend_gradient(field, grid.start(), grid.goal(), descent_metrics);

    // Then: 局所最小で振動
    EXPECT_EQ(descent_metrics.termination, TerminationReason::Cycle);
    EXPECT_EQ(descent.size(), 12u);
    EXPECT_EQ(descent_metrics.descent_steps, 11u);

    // When: 通常の抽出
    PathResult result = extractor.extract_path(field, grid.start(), grid.goal());

    // Then: A*で到達
    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.metrics.strategy, ExtractionStrategy::AStar);
    EXPECT_EQ(result.path.size(), 13u);
    expectValidPath(result.path, grid);
}

// TEST 7: 累積コストは単調非減少
TEST_F(PathExtractorTest, AccumulatedCostIsNonDecreasing) {
    Grid grid = makeGrid(9, 9, {Position(3, 3), Position(4, 4), Position(5, 5)},
                         Position(0, 0), Position(8, 8));
    PotentialField field = fieldFor(grid);

    PathResult result = extractor.extract_path(field, grid.start(), grid.goal());
    ASSERT_TRUE(result.success());

    double accumulated = 0.0;
    for (std::size_t i = 1; i < result.path.size(); ++i) {
        const double step = step_cost(result.path.points[i - 1], result.path.points[i]);
        EXPECT_TRUE(step == 1.0 || std::abs(step - std::sqrt(2.0)) < 1e-12);
        const double next = accumulated + step;
        EXPECT_GE(next, accumulated);
        accumulated = next;
    }
    EXPECT_NEAR(accumulated, result.path.total_cost(), 1e-9);
}

// TEST 8: 開始と目標が同一
TEST_F(PathExtractorTest, StartEqualsGoalYieldsSinglePoint) {
    Grid grid = makeGrid(4, 4, {}, Position(0, 0), Position(3, 3));
    PotentialField field = fieldFor(grid);

    PathResult result = extractor.extract_path(field, Position(2, 2), Position(2, 2));

    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.path.points, std::vector<Position>{Position(2, 2)});
    EXPECT_EQ(result.metrics.nodes_expanded, 1u);
}

// TEST 9: 同一入力に対して決定的
TEST_F(PathExtractorTest, ExtractionIsDeterministic) {
    Grid grid = makeGrid(12, 12, {Position(5, 5), Position(5, 6), Position(6, 5)},
                         Position(0, 0), Position(11, 11));
    PotentialField field = fieldFor(grid);

    PathResult first = extractor.extract_path(field, grid.start(), grid.goal());
    PathResult second = extractor.extract_path(field, grid.start(), grid.goal());

    EXPECT_EQ(first.path.points, second.path.points);
    EXPECT_EQ(first.metrics.nodes_expanded, second.metrics.nodes_expanded);
}

// TEST 10: 範囲外の開始・目標
TEST_F(PathExtractorTest, OutOfBoundsEndpointsThrow) {
    Grid grid = makeGrid(4, 4, {}, Position(0, 0), Position(3, 3));
    PotentialField field = fieldFor(grid);

    EXPECT_THROW(extractor.extract_path(field, Position(-1, 0), grid.goal()), MalformedGridError);
    EXPECT_THROW(extractor.extract_path(field, grid.start(), Position(0, 4)), MalformedGridError);
}

// TEST 11: 最急降下は方向順で同値を解決する
TEST_F(PathExtractorTest, DescentBreaksTiesByDirectionOrder) {
    // Given: 全セル同値の平坦な場
    PotentialField flat(3, 3);

    // When: 中央から降下（目標は到達不可能な位置として角を指定）
    ExtractionMetrics metrics;
    Path path = extractor.descend_gradient(flat, Position(1, 1), Position(2, 2), metrics);

    // Then: 最初の一歩は北
    ASSERT_GE(path.size(), 2u);
    EXPECT_EQ(path.points[1], Position(0, 1));
}

// TEST 12: 最急降下の歩数上限
TEST_F(PathExtractorTest, DescentStopsAtStepLimit) {
    // Given: 1x3の平坦な場、目標セルのみ通行不可
    PotentialField field(1, 3);
    field.set(Position(0, 2), PotentialField::kImpassable);

    // When
    PathResult result = extractor.extract_path(field, Position(0, 0), Position(0, 2));

    // Then: 上限2*1*3=6歩で打ち切り（循環検出の開始前）
    EXPECT_FALSE(result.success());
    EXPECT_TRUE(result.metrics.fallback_used());
    EXPECT_EQ(result.metrics.strategy, ExtractionStrategy::GradientDescent);
    EXPECT_EQ(result.metrics.search_failure, SearchFailure::FrontierExhausted);
    EXPECT_EQ(result.metrics.termination, TerminationReason::StepLimit);
    EXPECT_EQ(result.metrics.descent_steps, 6u);
    ASSERT_EQ(result.path.size(), 7u);
    EXPECT_EQ(result.path.points.front(), Position(0, 0));
    EXPECT_EQ(result.path.points[1], Position(0, 1));
    EXPECT_EQ(result.path.points.back(), Position(0, 0));
    EXPECT_TRUE(result.path.is_connected());
}

// TEST 13: リングバッファ
TEST(PositionHistoryTest, KeepsOnlyMostRecentEntries) {
    PositionHistory history;
    EXPECT_EQ(history.size(), 0u);
    EXPECT_EQ(history.count(Position(0, 0)), 0u);

    history.push(Position(0, 0));
    history.push(Position(0, 0));
    EXPECT_EQ(history.size(), 2u);
    EXPECT_EQ(history.count(Position(0, 0)), 2u);

    // 容量分の別位置で押し出す
    for (std::size_t i = 0; i < PositionHistory::kCapacity - 1; ++i) {
        history.push(Position(1, static_cast<int>(i)));
    }
    EXPECT_EQ(history.size(), PositionHistory::kCapacity);
    EXPECT_EQ(history.count(Position(0, 0)), 1u);

    history.push(Position(2, 2));
    EXPECT_EQ(history.size(), PositionHistory::kCapacity);
    EXPECT_EQ(history.count(Position(0, 0)), 0u);
    EXPECT_EQ(history.count(Position(2, 2)), 1u);
}

// TEST 14: 列挙型の文字列表現
TEST(PathExtractorEnumTest, ToStringNames) {
    EXPECT_STREQ(to_string(ExtractionStrategy::AStar), "astar");
    EXPECT_STREQ(to_string(ExtractionStrategy::GradientDescent), "gradient_descent");
    EXPECT_STREQ(to_string(SearchFailure::FrontierExhausted), "frontier_exhausted");
    EXPECT_STREQ(to_string(SearchFailure::IterationLimit), "iteration_limit");
    EXPECT_STREQ(to_string(TerminationReason::DeadEnd), "dead_end");
    EXPECT_STREQ(to_string(TerminationReason::Cycle), "cycle");
    EXPECT_STREQ(to_string(TerminationReason::StepLimit), "step_limit");
}

// メイン関数
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
