#ifndef APF_PLANNER_UTILS_TIME_UTILS_HPP_
#define APF_PLANNER_UTILS_TIME_UTILS_HPP_

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace apf_planner {
namespace time_utils {

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;

/**
 * @brief 秒を単位付き文字列に変換（ns / us / ms / s / 分）
 */
std::string format_duration(double seconds);

/**
 * @brief ログ用のローカル時刻文字列（ミリ秒まで）
 */
std::string get_timestamp_string();

/**
 * @brief 単純な経過時間タイマー
 */
class Timer {
public:
    Timer();

    void start();

    /**
     * @brief タイマーを停止して経過時間を取得
     * @return 経過時間（秒）、動作していない場合は0
     */
    double stop();

    void reset();

    // 経過時間（秒、タイマーは継続）
    double elapsed() const;
    double elapsed_ms() const { return elapsed() * 1000.0; }

    bool is_running() const { return running_; }

private:
    TimePoint start_time_;
    bool running_;
};

/**
 * @brief 計画の段階ごとの所要時間を記録するタイマー
 *
 * begin(label) で計測を開始し、次の begin() または finish() で前の段階を閉じる。
 * 記録は開始順に保持される。
 */
class StageTimer {
public:
    using Stage = std::pair<std::string, double>;  // ラベル、所要時間[ms]

    void begin(const std::string& label);
    void finish();

    /**
     * @return 段階の所要時間[ms]（未記録なら0）
     */
    double stage_ms(const std::string& label) const;
    double total_ms() const;

    const std::vector<Stage>& stages() const { return stages_; }

private:
    Timer timer_;
    std::string current_label_;
    std::vector<Stage> stages_;
};

} // namespace time_utils
} // namespace apf_planner

#endif // APF_PLANNER_UTILS_TIME_UTILS_HPP_
