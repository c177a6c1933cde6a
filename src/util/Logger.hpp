#pragma once

#include <ostream>
#include <string>

namespace gitscribe {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/// Parse "error|warn|info|debug" or "0".."3"; unknown values map to Info.
LogLevel parseLogLevel(const std::string& value);

/**
 * @brief Process-wide diagnostic logger
 *
 * Every level writes to the diagnostic stream (stderr unless redirected),
 * keeping stdout free for decoded results. The initial level is read from
 * the GITSCRIBE_LOG environment variable.
 */
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;

    /// Redirect diagnostics; nullptr restores std::cerr.
    void setStream(std::ostream* stream);

    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

private:
    Logger();
    void write(LogLevel level, const char* tag, const std::string& msg) const;

    LogLevel currentLevel;
    std::ostream* sink;
};

}
