#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace keepsake::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Directory receiving log files: $KEEPSAKE_LOG_DIR, else
// $HOME/.local/share/keepsake/logs.
QString logsDirPath();

// Path of the main log file for a process name.
QString logFilePath(const QString &processName);

// Identifier shared by every event of this process run.
QString runId();

// Structured log event, written as one JSON object per line. Debug events are
// dropped unless tracing is enabled.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();

} // namespace keepsake::logging

#define KSLOG_DEBUG(component, where, what, ctxJson) \
    ::keepsake::logging::logEvent(::keepsake::logging::LogLevel::Debug, \
                                  ::keepsake::logging::defaultProcessName(), \
                                  (component), (where), (what), (ctxJson))

#define KSLOG_INFO(component, where, what, ctxJson) \
    ::keepsake::logging::logEvent(::keepsake::logging::LogLevel::Info, \
                                  ::keepsake::logging::defaultProcessName(), \
                                  (component), (where), (what), (ctxJson))

#define KSLOG_WARN(component, where, what, ctxJson) \
    ::keepsake::logging::logEvent(::keepsake::logging::LogLevel::Warn, \
                                  ::keepsake::logging::defaultProcessName(), \
                                  (component), (where), (what), (ctxJson))

#define KSLOG_ERROR(component, where, what, ctxJson) \
    ::keepsake::logging::logEvent(::keepsake::logging::LogLevel::Error, \
                                  ::keepsake::logging::defaultProcessName(), \
                                  (component), (where), (what), (ctxJson))
