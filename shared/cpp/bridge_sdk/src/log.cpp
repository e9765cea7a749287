#include "../include/log.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace {
std::atomic<int>& level_slot() {
    static std::atomic<int> level([] {
        LogLevel l = LogLevel::Info;
        parse_log_level(getenv_or("BRIDGE_LOG_LEVEL", "info"), &l);
        return static_cast<int>(l);
    }());
    return level;
}

std::mutex& out_mtx() {
    static std::mutex m;
    return m;
}

const char* level_name(LogLevel l) {
    switch (l) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}
}

LogLevel log_level() {
    return static_cast<LogLevel>(level_slot().load());
}

void set_log_level(LogLevel level) {
    level_slot().store(static_cast<int>(level));
}

bool parse_log_level(const std::string& s, LogLevel* out) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    if (v == "debug") *out = LogLevel::Debug;
    else if (v == "info") *out = LogLevel::Info;
    else if (v == "warn") *out = LogLevel::Warn;
    else if (v == "error") *out = LogLevel::Error;
    else return false;
    return true;
}

Logger::Logger(std::string tag) : tag_(std::move(tag)) {}

void Logger::debug(const std::string& msg, const nlohmann::json& data) const { write(LogLevel::Debug, msg, data); }
void Logger::info(const std::string& msg, const nlohmann::json& data) const { write(LogLevel::Info, msg, data); }
void Logger::warn(const std::string& msg, const nlohmann::json& data) const { write(LogLevel::Warn, msg, data); }
void Logger::error(const std::string& msg, const nlohmann::json& data) const { write(LogLevel::Error, msg, data); }

std::string Logger::format(const std::string& tag, LogLevel level, const std::string& msg,
                           const nlohmann::json& data) {
    std::string line = "[bridge:" + tag + "] " + level_name(level) + " " + msg;
    if (data.is_object() && !data.empty()) {
        line += "  ";
        line += data.dump();
    }
    return line;
}

void Logger::write(LogLevel level, const std::string& msg, const nlohmann::json& data) const {
    if (static_cast<int>(level) < level_slot().load()) return;
    std::string line = format(tag_, level, msg, data);
    std::lock_guard<std::mutex> lock(out_mtx());
    if (level >= LogLevel::Warn) std::cerr << line << std::endl;
    else std::cout << line << std::endl;
}
