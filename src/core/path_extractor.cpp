#include "apf_planner/core/path_extractor.hpp"
#include "apf_planner/utils/logging.hpp"
#include <algorithm>
#include <limits>
#include <queue>
#include <string>

namespace apf_planner {

// 8方向の移動（軸方向を先、対角線を後に評価する）
const std::array<std::array<int, 2>, PathExtractor::kDirectionCount> PathExtractor::kDirections = {{
    {{-1, 0}},   // 北
    {{1, 0}},    // 南
    {{0, -1}},   // 西
    {{0, 1}},    // 東
    {{-1, -1}},  // 北西
    {{-1, 1}},   // 北東
    {{1, -1}},   // 南西
    {{1, 1}}     // 南東
}};

// PositionHistory implementations
PositionHistory::PositionHistory() : head_(0), size_(0) {}

void PositionHistory::push(const Position& pos) {
    buffer_[head_] = pos;
    head_ = (head_ + 1) % kCapacity;
    if (size_ < kCapacity) {
        ++size_;
    }
}

std::size_t PositionHistory::count(const Position& pos) const {
    // size_ < kCapacity の間は先頭から size_ 個だけが有効
    return static_cast<std::size_t>(
        std::count(buffer_.begin(), buffer_.begin() + size_, pos));
}

// PathExtractor implementations
PathResult PathExtractor::extract_path(const PotentialField& field,
                                       const Position& start, const Position& goal) const {
    if (!field.contains(start)) {
        throw MalformedGridError(
            "start (" + std::to_string(start.row) + ", " + std::to_string(start.col) +
            ") is outside the potential field");
    }
    if (!field.contains(goal)) {
        throw MalformedGridError(
            "goal (" + std::to_string(goal.row) + ", " + std::to_string(goal.col) +
            ") is outside the potential field");
    }

    PathResult result;

    // ポテンシャル場をヒューリスティックとするA*を試行
    result.path = search_astar(field, start, goal, result.metrics);

    if (!result.path.empty() && result.path.points.back() == goal) {
        result.metrics.strategy = ExtractionStrategy::AStar;
        result.metrics.termination = TerminationReason::ReachedGoal;
        return result;
    }

    APF_LOG_WARN("path_extractor", logging::format_string(
        "A* failed (%s after %zu expansions), falling back to gradient descent",
        to_string(result.metrics.search_failure), result.metrics.nodes_expanded));

    // 最急降下にフォールバック
    result.metrics.strategy = ExtractionStrategy::GradientDescent;
    result.path = descend_gradient(field, start, goal, result.metrics);

    return result;
}

Path PathExtractor::search_astar(const PotentialField& field, const Position& start,
                                 const Position& goal, ExtractionMetrics& metrics) const {
    const int rows = field.rows();
    const int cols = field.cols();
    const std::size_t cell_count = static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols);

    auto index_of = [cols](const Position& pos) {
        return static_cast<std::size_t>(pos.row) * static_cast<std::size_t>(cols) +
               static_cast<std::size_t>(pos.col);
    };

    // セルごとの最良累積コストと親セル（経路はゴール到達時に一度だけ再構築）
    std::vector<double> best_cost(cell_count, std::numeric_limits<double>::infinity());
    std::vector<int> parents(cell_count, -1);

    std::priority_queue<FrontierEntry, std::vector<FrontierEntry>, FrontierCompare> frontier;
    std::uint64_t sequence = 0;

    best_cost[index_of(start)] = 0.0;
    frontier.push({field.at(start), 0.0, sequence++, start});

    // 病的な場でも終了させるための反復上限
    const std::size_t iteration_limit = cell_count * kSearchIterationFactor;
    std::size_t iteration_count = 0;

    while (!frontier.empty() && iteration_count < iteration_limit) {
        ++iteration_count;

        const FrontierEntry current = frontier.top();
        frontier.pop();

        const std::size_t current_index = index_of(current.position);

        // より良いコストで再投入済みの古い要素は展開しない
        if (current.g_cost > best_cost[current_index]) {
            continue;
        }

        ++metrics.nodes_expanded;

        if (current.position == goal) {
            metrics.search_failure = SearchFailure::None;
            return reconstruct_path(parents, cols, goal);
        }

        for (const auto& dir : kDirections) {
            const Position next(current.position.row + dir[0], current.position.col + dir[1]);

            if (!field.contains(next) || field.is_impassable(next)) {
                continue;
            }

            const double tentative_g_cost = current.g_cost + step_cost(current.position, next);
            const std::size_t next_index = index_of(next);

            if (tentative_g_cost < best_cost[next_index]) {
                best_cost[next_index] = tentative_g_cost;
                parents[next_index] = static_cast<int>(current_index);
                frontier.push({tentative_g_cost + field.at(next), tentative_g_cost,
                               sequence++, next});
            }
        }
    }

    metrics.search_failure = frontier.empty() ? SearchFailure::FrontierExhausted
                                              : SearchFailure::IterationLimit;
    return Path();
}

Path PathExtractor::descend_gradient(const PotentialField& field, const Position& start,
                                     const Position& goal, ExtractionMetrics& metrics) const {
    Path path;
    path.add_point(start);

    Position current = start;
    PositionHistory history;
    history.push(start);

    const std::size_t cell_count =
        static_cast<std::size_t>(field.rows()) * static_cast<std::size_t>(field.cols());
    const std::size_t step_limit = cell_count * kDescentStepFactor;

    for (std::size_t step = 0; step < step_limit; ++step) {
        if (current == goal) {
            metrics.termination = TerminationReason::ReachedGoal;
            return path;
        }

        // ポテンシャルが最小の隣接セルを探索（同値は方向順で先のもの）
        Position lowest_neighbor = current;
        double lowest_potential = PotentialField::kImpassable;

        for (const auto& dir : kDirections) {
            const Position next(current.row + dir[0], current.col + dir[1]);
            if (!field.contains(next)) {
                continue;
            }

            const double potential = field.at(next);
            if (potential < lowest_potential) {
                lowest_potential = potential;
                lowest_neighbor = next;
            }
        }

        if (lowest_neighbor == current) {
            metrics.termination = TerminationReason::DeadEnd;
            APF_LOG_WARN("path_extractor", logging::format_string(
                "gradient descent halted at (%d, %d): no reachable neighbors",
                current.row, current.col));
            return path;
        }

        // 循環検出
        if (step > kCycleCheckStartStep && history.count(lowest_neighbor) > kMaxRepetitions) {
            metrics.termination = TerminationReason::Cycle;
            APF_LOG_WARN("path_extractor", logging::format_string(
                "gradient descent halted at (%d, %d): cyclic trajectory detected",
                current.row, current.col));
            return path;
        }

        path.add_point(lowest_neighbor);
        history.push(lowest_neighbor);
        current = lowest_neighbor;
        ++metrics.descent_steps;
    }

    if (current == goal) {
        metrics.termination = TerminationReason::ReachedGoal;
        return path;
    }

    metrics.termination = TerminationReason::StepLimit;
    APF_LOG_WARN("path_extractor", logging::format_string(
        "gradient descent halted: step limit %zu reached", step_limit));
    return path;
}

Path PathExtractor::reconstruct_path(const std::vector<int>& parents, int cols,
                                     const Position& goal) {
    std::vector<Position> reversed;

    // 逆順にたどって経路を構築
    int index = goal.row * cols + goal.col;
    while (index >= 0) {
        reversed.emplace_back(index / cols, index % cols);
        index = parents[static_cast<std::size_t>(index)];
    }

    Path path;
    path.points.assign(reversed.rbegin(), reversed.rend());
    return path;
}

const char* to_string(ExtractionStrategy strategy) {
    switch (strategy) {
        case ExtractionStrategy::AStar: return "astar";
        case ExtractionStrategy::GradientDescent: return "gradient_descent";
    }
    return "unknown";
}

const char* to_string(SearchFailure failure) {
    switch (failure) {
        case SearchFailure::None: return "none";
        case SearchFailure::FrontierExhausted: return "frontier_exhausted";
        case SearchFailure::IterationLimit: return "iteration_limit";
    }
    return "unknown";
}

const char* to_string(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::ReachedGoal: return "reached_goal";
        case TerminationReason::DeadEnd: return "dead_end";
        case TerminationReason::Cycle: return "cycle";
        case TerminationReason::StepLimit: return "step_limit";
    }
    return "unknown";
}

} // namespace apf_planner
