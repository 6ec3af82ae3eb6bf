// ============================================================================
// logger.cpp — implementation for logger.hpp
// ============================================================================

#include "bravejig/logger.hpp"

#include <chrono>
#include <ostream>

namespace bravejig {

const char* to_string(LogLevel l) {
    switch (l) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:   return "off";
    }
    return "unknown";
}

bool parse_log_level(const std::string& s, LogLevel& out) {
    if      (s == "debug") out = LogLevel::Debug;
    else if (s == "info")  out = LogLevel::Info;
    else if (s == "warn")  out = LogLevel::Warn;
    else if (s == "error") out = LogLevel::Error;
    else if (s == "off")   out = LogLevel::Off;
    else return false;
    return true;
}

Logger::Logger(std::ostream& out, LogLevel level) : out_(out), level_(level) {}

void Logger::set_level(LogLevel l) {
    std::lock_guard<std::mutex> lk(mutex_);
    level_ = l;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return level_;
}

bool Logger::enabled(LogLevel l) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return l != LogLevel::Off && l >= level_;
}

// ---------------------------------------------------------------------------
// log()
// -----
// One record per call, flushed immediately. msg is written bare when it is a
// single token and quoted otherwise, so the line stays key=value parseable.
// ---------------------------------------------------------------------------
void Logger::log(LogLevel l, const char* comp, const std::string& msg, const std::string& fields) {
    using namespace std::chrono;
    const auto ts = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();

    std::lock_guard<std::mutex> lk(mutex_);
    if (l == LogLevel::Off || l < level_) return;

    out_ << "ts=" << ts << " level=" << to_string(l) << " comp=" << comp << " msg=";
    if (msg.find(' ') == std::string::npos) out_ << msg;
    else                                    out_ << '"' << msg << '"';
    if (!fields.empty()) out_ << ' ' << fields;
    out_ << '\n';
    out_.flush();
}

} // namespace bravejig
