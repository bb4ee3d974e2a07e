// test/test_footprint_inflator.cpp

#include <gtest/gtest.h>
#include "apf_planner/core/footprint_inflator.hpp"
#include <stdexcept>
#include <vector>

using namespace apf_planner;

class FootprintInflatorTest : public ::testing::Test {
protected:
    std::vector<std::vector<CellType>> cells;

    void SetUp() override {
        // 7x7の自由空間、開始(0,0)、目標(6,6)
        cells.assign(7, std::vector<CellType>(7, CellType::Free));
        cells[0][0] = CellType::Start;
        cells[6][6] = CellType::Goal;
    }

    static int countObstacles(const Grid& grid) {
        return static_cast<int>(grid.obstacle_count());
    }
};

// TEST 1: 点ロボット(1x1)では変化しない
TEST_F(FootprintInflatorTest, PointFootprintLeavesGridUnchanged) {
    // Given: 中央と角付近に障害物
    cells[3][3] = CellType::Obstacle;
    cells[1][5] = CellType::Obstacle;
    Grid grid(cells);

    // When: 1x1で膨張
    Grid inflated = FootprintInflator::inflate(grid, 1, 1);

    // Then: 元のグリッドと等しい
    EXPECT_EQ(inflated, grid);
}

// TEST 2: 2x2のフットプリントはマージン0（(2-1)/2 = 0）
TEST_F(FootprintInflatorTest, EvenFootprintUsesFloorMargin) {
    cells[3][3] = CellType::Obstacle;
    Grid grid(cells);

    Grid inflated = FootprintInflator::inflate(grid, 2, 2);

    EXPECT_EQ(inflated, grid);
}

// TEST 3: 3x3のフットプリントで周囲1セルが障害物になる
TEST_F(FootprintInflatorTest, SquareFootprintExpandsByOneCell) {
    // Given: 中央に単一障害物
    cells[3][3] = CellType::Obstacle;
    Grid grid(cells);

    // When: 3x3で膨張
    Grid inflated = FootprintInflator::inflate(grid, 3, 3);

    // Then: (2..4, 2..4) の9セルが障害物
    EXPECT_EQ(countObstacles(inflated), 9);
    for (int r = 2; r <= 4; ++r) {
        for (int c = 2; c <= 4; ++c) {
            EXPECT_EQ(inflated.at(r, c), CellType::Obstacle) << "(" << r << ", " << c << ")";
        }
    }
    EXPECT_EQ(inflated.at(1, 3), CellType::Free);
    EXPECT_EQ(inflated.at(3, 5), CellType::Free);
}

// TEST 4: 幅と高さは独立した軸に作用する
TEST_F(FootprintInflatorTest, RectangularFootprintUsesSeparateMargins) {
    cells[3][3] = CellType::Obstacle;
    Grid grid(cells);

    // 幅5（水平マージン2）、高さ1（垂直マージン0）
    Grid inflated = FootprintInflator::inflate(grid, 5, 1);

    EXPECT_EQ(countObstacles(inflated), 5);
    for (int c = 1; c <= 5; ++c) {
        EXPECT_EQ(inflated.at(3, c), CellType::Obstacle);
    }
    EXPECT_EQ(inflated.at(2, 3), CellType::Free);
    EXPECT_EQ(inflated.at(4, 3), CellType::Free);
}

// TEST 5: グリッド境界でクリップされる
TEST_F(FootprintInflatorTest, InflationIsClippedAtBorder) {
    cells[0][6] = CellType::Obstacle;
    Grid grid(cells);

    Grid inflated = FootprintInflator::inflate(grid, 3, 3);

    // (0..1, 5..6) の4セルのみ
    EXPECT_EQ(countObstacles(inflated), 4);
    EXPECT_EQ(inflated.at(1, 5), CellType::Obstacle);
}

// TEST 6: 開始・目標セルは障害物に変更されない
TEST_F(FootprintInflatorTest, StartAndGoalArePreserved) {
    // Given: 開始・目標に隣接する障害物
    cells[1][1] = CellType::Obstacle;
    cells[5][5] = CellType::Obstacle;
    Grid grid(cells);

    // When: 3x3で膨張
    Grid inflated = FootprintInflator::inflate(grid, 3, 3);

    // Then: 開始・目標はそのまま
    EXPECT_EQ(inflated.at(0, 0), CellType::Start);
    EXPECT_EQ(inflated.at(6, 6), CellType::Goal);
    EXPECT_EQ(inflated.start(), Position(0, 0));
    EXPECT_EQ(inflated.goal(), Position(6, 6));
    EXPECT_EQ(inflated.at(0, 1), CellType::Obstacle);
}

// TEST 7: 入力グリッドは変更されない
TEST_F(FootprintInflatorTest, InputGridIsNotModified) {
    cells[3][3] = CellType::Obstacle;
    const Grid grid(cells);
    const Grid original = grid;

    Grid inflated = FootprintInflator::inflate(grid, 5, 5);

    EXPECT_EQ(grid, original);
    EXPECT_NE(inflated, grid);
}

// TEST 8: 膨張は単調（幅を広げても障害物は減らない）
TEST_F(FootprintInflatorTest, InflationIsMonotonicInWidth) {
    cells[2][2] = CellType::Obstacle;
    cells[4][5] = CellType::Obstacle;
    cells[5][1] = CellType::Obstacle;
    Grid grid(cells);

    for (int narrow = 1; narrow <= 5; ++narrow) {
        for (int wide = narrow; wide <= 6; ++wide) {
            Grid narrow_grid = FootprintInflator::inflate(grid, narrow, 3);
            Grid wide_grid = FootprintInflator::inflate(grid, wide, 3);

            for (const auto& cell : narrow_grid.obstacle_cells()) {
                EXPECT_TRUE(wide_grid.is_obstacle(cell))
                    << "width " << narrow << " -> " << wide
                    << " lost obstacle (" << cell.row << ", " << cell.col << ")";
            }
        }
    }
}

// TEST 9: 膨張済みセルから連鎖的に膨張しない
TEST_F(FootprintInflatorTest, InflationDoesNotCascade) {
    cells[3][0] = CellType::Obstacle;
    Grid grid(cells);

    Grid inflated = FootprintInflator::inflate(grid, 3, 1);

    // 水平マージン1のみ：(3,0),(3,1)
    EXPECT_EQ(inflated.at(3, 1), CellType::Obstacle);
    EXPECT_EQ(inflated.at(3, 2), CellType::Free);
}

// TEST 10: 不正なフットプリント
TEST_F(FootprintInflatorTest, RejectsNonPositiveFootprint) {
    Grid grid(cells);

    EXPECT_THROW(FootprintInflator::inflate(grid, 0, 1), std::invalid_argument);
    EXPECT_THROW(FootprintInflator::inflate(grid, 1, -2), std::invalid_argument);
    EXPECT_THROW(FootprintInflator::collides(grid, Position(3, 3), 0, 0), std::invalid_argument);
}

// TEST 11: 衝突判定（障害物）
TEST_F(FootprintInflatorTest, CollidesWithObstacleInsideFootprint) {
    // Given: (1,1)に障害物
    cells[1][1] = CellType::Obstacle;
    Grid grid(cells);

    // Then: 3x3のフットプリントが(1,1)を含む場合は衝突
    EXPECT_TRUE(FootprintInflator::collides(grid, Position(2, 2), 3, 3));
    EXPECT_FALSE(FootprintInflator::collides(grid, Position(3, 3), 3, 3));
    EXPECT_TRUE(FootprintInflator::collides(grid, Position(1, 1), 1, 1));
    EXPECT_FALSE(FootprintInflator::collides(grid, Position(2, 2), 1, 1));
}

// TEST 12: 衝突判定（範囲外）
TEST_F(FootprintInflatorTest, CollidesWithGridBoundary) {
    Grid grid(cells);

    // 3x3のフットプリントは境界セルでははみ出す
    EXPECT_TRUE(FootprintInflator::collides(grid, Position(0, 3), 3, 3));
    EXPECT_TRUE(FootprintInflator::collides(grid, Position(3, 6), 3, 3));
    EXPECT_FALSE(FootprintInflator::collides(grid, Position(1, 1), 3, 3));

    // 衝突判定の半幅は dimension / 2（2セル幅でも±1）
    EXPECT_TRUE(FootprintInflator::collides(grid, Position(0, 0), 2, 2));
    EXPECT_FALSE(FootprintInflator::collides(grid, Position(1, 1), 2, 2));
}

// メイン関数
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
