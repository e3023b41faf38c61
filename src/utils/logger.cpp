#include "logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <thread>

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::set_level(LogLevel p_level) {
    level_ = p_level;
}

void Logger::set_sink(LogSink p_sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(p_sink);
}

void Logger::write(LogLevel p_level, const std::string& p_message) {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm tm_buf{};
    gmtime_r(&seconds, &tm_buf);

    std::ostringstream line;
    line << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.'
         << std::setfill('0') << std::setw(3) << millis << "Z "
         << std::setfill(' ') << std::left << std::setw(5) << level_name(p_level)
         << " [" << std::this_thread::get_id() << "] " << p_message;

    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_(p_level, line.str());
        return;
    }
    auto& out = (p_level >= LogLevel::Warn) ? std::cerr : std::cout;
    out << line.str() << std::endl;
}

LogLevel Logger::parse_level(std::string_view p_name) {
    std::string name(p_name);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Info;
}

const char* Logger::level_name(LogLevel p_level) {
    switch (p_level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}
