#pragma once
#include <string>
#include <mutex>
#include <ostream>

namespace hulud_scan {

enum class LogLevel { Error=0, Warn=1, Info=2, Debug=3, Trace=4 };

// Leveled line logger. Scanners receive one through ScanContext; main() uses instance().
class Logger {
public:
    Logger() = default;
    explicit Logger(std::ostream& out) : out_(&out) {}

    static Logger& instance();

    void set_level(LogLevel lvl);
    LogLevel level() const;

    void log(LogLevel lvl, const std::string& msg);
    void error(const std::string& m){ log(LogLevel::Error, m); }
    void warn(const std::string& m){ log(LogLevel::Warn, m); }
    void info(const std::string& m){ log(LogLevel::Info, m); }
    void debug(const std::string& m){ log(LogLevel::Debug, m); }
    void trace(const std::string& m){ log(LogLevel::Trace, m); }

    bool enabled(LogLevel lvl) const { return static_cast<int>(lvl) <= static_cast<int>(level()); }
private:
    static const char* prefix(LogLevel lvl);
    LogLevel level_ = LogLevel::Info;
    std::ostream* out_ = nullptr; // nullptr = std::cerr
    mutable std::mutex mutex_;
};

}
