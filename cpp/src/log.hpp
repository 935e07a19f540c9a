// log.hpp
#pragma once

#include <sstream>
#include <string>
#include <utility>

enum class LogLevel { Debug, Info, Warn, Error, Off };

void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);

LogLevel parse_log_level(const std::string& name);

// Writes "[component] message" to stderr.
void log_message(LogLevel level, const std::string& component, const std::string& message);

// Collects one message and writes it on destruction; a disabled level formats nothing.
//   LogLine(LogLevel::Warn, "MarketSession") << "trader " << tid << " failed";
class LogLine {
public:
    LogLine(LogLevel level, std::string component)
        : level_(level), component_(std::move(component)), enabled_(log_enabled(level)) {}
    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    ~LogLine() {
        if (enabled_) {
            log_message(level_, component_, os_.str());
        }
    }

    template <typename T>
    LogLine& operator<<(const T& value) {
        if (enabled_) {
            os_ << value;
        }
        return *this;
    }

private:
    LogLevel level_;
    std::string component_;
    bool enabled_;
    std::ostringstream os_;
};
