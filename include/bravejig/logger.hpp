#pragma once
/**
 * @page bj-logger BraveJIG Logger
 * @file logger.hpp
 * @brief Per-connection, line-oriented key=value logger.
 *
 * @details
 * Output looks like the CLI's own status lines so the two can be grepped
 * together:
 *
 *   ts=1730000000123 level=info comp=transport msg=connected port=/dev/ttyACM0
 *
 * Each Connection owns one Logger. Writes from the reader, writer, worker
 * and caller threads are serialized by an internal mutex; a line is never
 * split across threads.
 */

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>

namespace bravejig {

enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

const char* to_string(LogLevel l);

/// Parse "debug|info|warn|error|off"; false on anything else.
bool parse_log_level(const std::string& s, LogLevel& out);

class Logger {
public:
    explicit Logger(std::ostream& out, LogLevel level = LogLevel::Info);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel l);
    LogLevel level() const;
    bool enabled(LogLevel l) const;

    /// @param fields extra key=value pairs, already formatted, may be empty.
    void log(LogLevel l, const char* comp, const std::string& msg, const std::string& fields = {});

    void debug(const char* comp, const std::string& msg, const std::string& fields = {}) { log(LogLevel::Debug, comp, msg, fields); }
    void info (const char* comp, const std::string& msg, const std::string& fields = {}) { log(LogLevel::Info,  comp, msg, fields); }
    void warn (const char* comp, const std::string& msg, const std::string& fields = {}) { log(LogLevel::Warn,  comp, msg, fields); }
    void error(const char* comp, const std::string& msg, const std::string& fields = {}) { log(LogLevel::Error, comp, msg, fields); }

private:
    std::ostream& out_;
    mutable std::mutex mutex_;
    LogLevel level_;
};

} // namespace bravejig
