#include "logger.hpp"

#include <iostream>

namespace iam_explorer {

static void stderrSink(LogSeverity severity, const std::string& module, const std::string& message)
{
    std::cerr << Logger::severityToString(severity) << " [" << module << "] " << message << std::endl;
}

Logger::Logger()
    : level_(LogSeverity::ERROR), sink_(stderrSink)
{
}

std::shared_ptr<Logger> Logger::create(const std::string& logLevel)
{
    auto logger = std::make_shared<Logger>();
    LogSeverity severity;
    if (severityFromString(logLevel, severity)) {
        logger->setLevel(severity);
    } else {
        logger->error("logging", "Unknown log level '" + logLevel + "', using error");
    }
    return logger;
}

bool Logger::severityFromString(const std::string& str, LogSeverity& severity)
{
    if (str == "error") {
        severity = LogSeverity::ERROR;
    } else if (str == "warn") {
        severity = LogSeverity::WARN;
    } else if (str == "info") {
        severity = LogSeverity::INFO;
    } else if (str == "trace") {
        severity = LogSeverity::TRACE;
    } else {
        return false;
    }
    return true;
}

std::string Logger::severityToString(LogSeverity severity)
{
    switch (severity) {
        case LogSeverity::ERROR: return "ERROR";
        case LogSeverity::WARN: return "WARN";
        case LogSeverity::INFO: return "INFO";
        case LogSeverity::TRACE: return "TRACE";
    }
    return "UNKNOWN";
}

void Logger::log(LogSeverity severity, const std::string& module, const std::string& message) const
{
    if (!enabled(severity) || !sink_) {
        return;
    }
    sink_(severity, module, message);
}

} // namespace
