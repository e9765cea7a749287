#pragma once
#include <string>
#include <nlohmann/json.hpp>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Process-wide minimum level. Initialized from BRIDGE_LOG_LEVEL (default info).
LogLevel log_level();
void set_log_level(LogLevel level);
bool parse_log_level(const std::string& s, LogLevel* out);

// Line format: [bridge:<tag>] LEVEL message  {"key":value}
// debug/info go to stdout, warn/error to stderr.
class Logger {
public:
    explicit Logger(std::string tag);

    void debug(const std::string& msg, const nlohmann::json& data = nullptr) const;
    void info(const std::string& msg, const nlohmann::json& data = nullptr) const;
    void warn(const std::string& msg, const nlohmann::json& data = nullptr) const;
    void error(const std::string& msg, const nlohmann::json& data = nullptr) const;

    static std::string format(const std::string& tag, LogLevel level, const std::string& msg,
                              const nlohmann::json& data);

private:
    void write(LogLevel level, const std::string& msg, const nlohmann::json& data) const;
    std::string tag_;
};
