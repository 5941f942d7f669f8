#ifndef AGENTMEM_CORE_LOGGER_HPP
#define AGENTMEM_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <ctime>
#include <cstdarg>
#include <mutex>

namespace agentmem {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

// "debug", "info", "warn"/"warning", "error", "off"; anything else is INFO
LogLevel parse_log_level(const std::string& name);
const char* log_level_str(LogLevel level);

class Logger {
public:
    static Logger& instance();
    
    void set_level(LogLevel level);
    LogLevel level() const;
    
    // Defaults to stderr. NULL restores stderr.
    void set_output(FILE* out);
    
    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);
    
    void log_impl(LogLevel level, const char* fmt, va_list args);
    
    LogLevel level_;
    FILE* out_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) agentmem::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)  agentmem::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)  agentmem::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) agentmem::Logger::instance().error(__VA_ARGS__)

} // namespace agentmem

#endif // AGENTMEM_CORE_LOGGER_HPP
