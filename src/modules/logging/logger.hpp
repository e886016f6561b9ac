#pragma once

#include <functional>
#include <memory>
#include <sstream>
#include <string>

namespace iam_explorer {

enum class LogSeverity {
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    TRACE = 4
};

/**
 * Severity filtered logger with a module tag on every line.
 *
 * The default sink writes to stderr. Graph construction and queries
 * take a shared pointer to a logger, a nullptr logger means silence.
 */
class Logger {
 public:
    typedef std::function<void (LogSeverity severity, const std::string& module, const std::string& message)> Sink;

    Logger();
    Logger(LogSeverity level, Sink sink)
        : level_(level), sink_(sink)
    {
    }

    static std::shared_ptr<Logger> create(const std::string& logLevel);

    /**
     * Parse error|warn|info|trace, returns false for anything else.
     */
    static bool severityFromString(const std::string& str, LogSeverity& severity);
    static std::string severityToString(LogSeverity severity);

    void setLevel(LogSeverity level) { level_ = level; }
    LogSeverity getLevel() const { return level_; }
    void setSink(Sink sink) { sink_ = sink; }

    bool enabled(LogSeverity severity) const
    {
        return static_cast<int>(severity) <= static_cast<int>(level_);
    }

    void log(LogSeverity severity, const std::string& module, const std::string& message) const;

    void error(const std::string& module, const std::string& message) const { log(LogSeverity::ERROR, module, message); }
    void warn(const std::string& module, const std::string& message) const { log(LogSeverity::WARN, module, message); }
    void info(const std::string& module, const std::string& message) const { log(LogSeverity::INFO, module, message); }
    void trace(const std::string& module, const std::string& message) const { log(LogSeverity::TRACE, module, message); }

 private:
    LogSeverity level_;
    Sink sink_;
};

} // namespace

#define IAM_EXPLORER_LOG(logger, severity, module, stream)             \
    do {                                                               \
        if ((logger) && (logger)->enabled(severity)) {                 \
            std::stringstream iamExplorerLogStream_;                   \
            iamExplorerLogStream_ << stream;                           \
            (logger)->log(severity, module, iamExplorerLogStream_.str()); \
        }                                                              \
    } while (0)

#define IAM_EXPLORER_LOG_ERROR(logger, module, stream) IAM_EXPLORER_LOG(logger, ::iam_explorer::LogSeverity::ERROR, module, stream)
#define IAM_EXPLORER_LOG_WARN(logger, module, stream) IAM_EXPLORER_LOG(logger, ::iam_explorer::LogSeverity::WARN, module, stream)
#define IAM_EXPLORER_LOG_INFO(logger, module, stream) IAM_EXPLORER_LOG(logger, ::iam_explorer::LogSeverity::INFO, module, stream)
#define IAM_EXPLORER_LOG_TRACE(logger, module, stream) IAM_EXPLORER_LOG(logger, ::iam_explorer::LogSeverity::TRACE, module, stream)
