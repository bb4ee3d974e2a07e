#ifndef APF_PLANNER_UTILS_LOGGING_HPP_
#define APF_PLANNER_UTILS_LOGGING_HPP_

#include <cstdio>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace apf_planner {
namespace logging {

/**
 * @brief ログレベル列挙型
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

/**
 * @brief ログメッセージ構造体
 */
struct LogMessage {
    LogLevel level;
    std::string timestamp;
    std::string category;
    std::string message;
    std::string file;
    int line;
    std::thread::id thread_id;
};

/**
 * @brief ログ出力インターフェース
 */
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogMessage& msg) = 0;
    virtual void flush() = 0;
};

/**
 * @brief コンソール出力用シンク（WARN以上は標準エラー出力）
 */
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool colored = true);
    void write(const LogMessage& msg) override;
    void flush() override;

private:
    bool colored_;
    std::string get_color_code(LogLevel level) const;
};

/**
 * @brief ファイル出力用シンク
 */
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& filename, bool append = true);
    ~FileSink() override;

    void write(const LogMessage& msg) override;
    void flush() override;

    bool is_open() const;

private:
    std::ofstream file_;
};

/**
 * @brief グローバルロガーインスタンス
 *
 * 初回アクセス時にコンソールシンクを1つ持つ。
 * 書き込みはミューテックスで直列化される。
 */
class Logger {
public:
    static Logger& instance();

    void add_sink(std::shared_ptr<LogSink> sink);
    void add_console_sink(bool colored = true);

    /**
     * @brief ファイルシンクを追加
     * @return ファイルを開けた場合true
     */
    bool add_file_sink(const std::string& filename, bool append = true);
    void clear_sinks();

    void set_level(LogLevel level);
    LogLevel level() const;
    bool is_enabled(LogLevel level) const;

    void log(LogLevel level, const std::string& category,
             const std::string& message, const std::string& file, int line);

    void flush();

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
    LogLevel min_level_;
};

const char* get_level_string(LogLevel level);
std::string format_message(const LogMessage& msg);

// ログ出力マクロ
#define APF_LOG_DEBUG(category, message) \
    apf_planner::logging::Logger::instance().log( \
        apf_planner::logging::LogLevel::DEBUG, category, message, __FILE__, __LINE__)

#define APF_LOG_INFO(category, message) \
    apf_planner::logging::Logger::instance().log( \
        apf_planner::logging::LogLevel::INFO, category, message, __FILE__, __LINE__)

#define APF_LOG_WARN(category, message) \
    apf_planner::logging::Logger::instance().log( \
        apf_planner::logging::LogLevel::WARN, category, message, __FILE__, __LINE__)

#define APF_LOG_ERROR(category, message) \
    apf_planner::logging::Logger::instance().log( \
        apf_planner::logging::LogLevel::ERROR, category, message, __FILE__, __LINE__)

#define APF_LOG_FATAL(category, message) \
    apf_planner::logging::Logger::instance().log( \
        apf_planner::logging::LogLevel::FATAL, category, message, __FILE__, __LINE__)

// 文字列フォーマット用ヘルパー
template<typename... Args>
std::string format_string(const std::string& format, Args... args) {
    int size = std::snprintf(nullptr, 0, format.c_str(), args...) + 1;
    if (size <= 0) return "";

    std::unique_ptr<char[]> buf(new char[size]);
    std::snprintf(buf.get(), size, format.c_str(), args...);
    return std::string(buf.get(), buf.get() + size - 1);
}

} // namespace logging
} // namespace apf_planner

#endif // APF_PLANNER_UTILS_LOGGING_HPP_
