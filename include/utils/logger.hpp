#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>
#include <fstream>
#include <mutex>
#include <iostream>

namespace sealgate {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& getInstance();
    
    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // Security-relevant events (identity change, revocation, bans).
    // Always emitted at WARNING regardless of the minimum level.
    void audit(const std::string& event, const std::string& details);
    
    void setLogFile(const std::string& filename);
    void setMinLevel(LogLevel level);
    // Tests silence console output; the file sink is unaffected.
    void setConsoleEnabled(bool enabled);

    static bool parseLevel(const std::string& name, LogLevel& level);
    
private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    std::mutex mutex_;
    std::ofstream log_file_;
    bool file_logging_enabled_ = false;
    bool console_enabled_ = true;
    LogLevel min_level_ = LogLevel::DEBUG;
    
    void write(LogLevel level, const std::string& message);
    std::string levelToString(LogLevel level);
    std::string getCurrentTime();
};

} // namespace sealgate

#endif // LOGGER_HPP
