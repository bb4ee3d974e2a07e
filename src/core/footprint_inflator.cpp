#include "apf_planner/core/footprint_inflator.hpp"
#include "apf_planner/utils/logging.hpp"
#include <stdexcept>
#include <string>

namespace apf_planner {

Grid FootprintInflator::inflate(const Grid& grid, int footprint_width, int footprint_height) {
    validate_footprint(footprint_width, footprint_height);

    Grid inflated_grid = grid;  // コピー作成

    // 膨張マージンをグリッドセルで計算
    const int vertical_margin = (footprint_height - 1) / 2;
    const int horizontal_margin = (footprint_width - 1) / 2;

    if (vertical_margin == 0 && horizontal_margin == 0) {
        return inflated_grid;
    }

    // 元の占有セルを特定（膨張済みセルから連鎖的に膨張させない）
    const auto occupied_cells = grid.obstacle_cells();

    int marked = 0;
    for (const auto& cell : occupied_cells) {
        for (int dr = -vertical_margin; dr <= vertical_margin; ++dr) {
            for (int dc = -horizontal_margin; dc <= horizontal_margin; ++dc) {
                const Position target(cell.row + dr, cell.col + dc);

                if (!inflated_grid.contains(target)) {
                    continue;
                }

                // 元が自由空間の場合のみ障害物に変更
                if (inflated_grid.mark_obstacle(target)) {
                    ++marked;
                }
            }
        }
    }

    APF_LOG_DEBUG("inflator", logging::format_string(
        "footprint %dx%d: %zu obstacles expanded by %d cells",
        footprint_width, footprint_height, occupied_cells.size(), marked));

    return inflated_grid;
}

bool FootprintInflator::collides(const Grid& grid, const Position& center,
                                 int footprint_width, int footprint_height) {
    validate_footprint(footprint_width, footprint_height);

    const int half_height = footprint_height / 2;
    const int half_width = footprint_width / 2;

    for (int dr = -half_height; dr <= half_height; ++dr) {
        for (int dc = -half_width; dc <= half_width; ++dc) {
            const Position cell(center.row + dr, center.col + dc);

            // 境界との衝突
            if (!grid.contains(cell)) {
                return true;
            }

            // 障害物との衝突
            if (grid.is_obstacle(cell)) {
                return true;
            }
        }
    }

    return false;
}

void FootprintInflator::validate_footprint(int footprint_width, int footprint_height) {
    if (footprint_width < 1 || footprint_height < 1) {
        throw std::invalid_argument(
            "footprint must be at least 1x1 cells, got " +
            std::to_string(footprint_width) + "x" + std::to_string(footprint_height));
    }
}

} // namespace apf_planner
