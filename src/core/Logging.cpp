#include "Logging.h"
#include <iostream>

namespace hulud_scan {

Logger& Logger::instance(){
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel lvl){
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = lvl;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

const char* Logger::prefix(LogLevel lvl){
    switch(lvl){
        case LogLevel::Error: return "[ERR] ";
        case LogLevel::Warn: return "[WRN] ";
        case LogLevel::Info: return "[INF] ";
        case LogLevel::Debug: return "[DBG] ";
        case LogLevel::Trace: return "[TRC] ";
    }
    return "";
}

void Logger::log(LogLevel lvl, const std::string& msg){
    std::lock_guard<std::mutex> lock(mutex_);
    if(static_cast<int>(lvl) > static_cast<int>(level_)) return;
    std::ostream& os = out_ ? *out_ : std::cerr;
    os << prefix(lvl) << msg << '\n';
}

}
