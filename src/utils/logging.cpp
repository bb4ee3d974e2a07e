#include "apf_planner/utils/logging.hpp"
#include "apf_planner/utils/time_utils.hpp"
#include <iostream>
#include <sstream>
#include <utility>

namespace apf_planner {
namespace logging {

const char* get_level_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

std::string format_message(const LogMessage& msg) {
    std::ostringstream oss;
    oss << "[" << msg.timestamp << "] [" << get_level_string(msg.level) << "] ["
        << msg.category << "] " << msg.message;
    return oss.str();
}

// ConsoleSink
ConsoleSink::ConsoleSink(bool colored) : colored_(colored) {}

void ConsoleSink::write(const LogMessage& msg) {
    std::ostream& out = (msg.level >= LogLevel::WARN) ? std::cerr : std::cout;

    if (colored_) {
        out << get_color_code(msg.level) << format_message(msg) << "\033[0m" << '\n';
    } else {
        out << format_message(msg) << '\n';
    }
}

void ConsoleSink::flush() {
    std::cout.flush();
    std::cerr.flush();
}

std::string ConsoleSink::get_color_code(LogLevel level) const {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";   // シアン
        case LogLevel::INFO:  return "\033[32m";   // 緑
        case LogLevel::WARN:  return "\033[33m";   // 黄
        case LogLevel::ERROR: return "\033[31m";   // 赤
        case LogLevel::FATAL: return "\033[1;31m"; // 太字赤
    }
    return "";
}

// FileSink
FileSink::FileSink(const std::string& filename, bool append)
    : file_(filename, append ? std::ios::app : std::ios::trunc) {}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::write(const LogMessage& msg) {
    if (!file_.is_open()) {
        return;
    }
    file_ << format_message(msg) << " (" << msg.file << ":" << msg.line << ")\n";
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

bool FileSink::is_open() const {
    return file_.is_open();
}

// Logger
Logger::Logger() : min_level_(LogLevel::INFO) {
    sinks_.push_back(std::make_shared<ConsoleSink>());
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::add_console_sink(bool colored) {
    add_sink(std::make_shared<ConsoleSink>(colored));
}

bool Logger::add_file_sink(const std::string& filename, bool append) {
    auto sink = std::make_shared<FileSink>(filename, append);
    if (!sink->is_open()) {
        return false;
    }
    add_sink(sink);
    return true;
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

bool Logger::is_enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
}

void Logger::log(LogLevel level, const std::string& category,
                 const std::string& message, const std::string& file, int line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_ || sinks_.empty()) {
        return;
    }

    LogMessage msg;
    msg.level = level;
    msg.timestamp = time_utils::get_timestamp_string();
    msg.category = category;
    msg.message = message;
    msg.file = file;
    msg.line = line;
    msg.thread_id = std::this_thread::get_id();

    for (const auto& sink : sinks_) {
        sink->write(msg);
    }

    if (level >= LogLevel::ERROR) {
        for (const auto& sink : sinks_) {
            sink->flush();
        }
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace logging
} // namespace apf_planner
