#ifndef ZTM_LOG_H
#define ZTM_LOG_H

// ============================================================================
// LOGGING
// printf-style log macros routed to a pluggable sink.
// The firmware installs a Serial sink, host tests leave it silent.
// ============================================================================

enum class LogLevel {
    Error = 0,
    Warning,
    Info,
    Debug
};

typedef void (*LogSink)(LogLevel level, const char* message);

// Install a sink; messages above maxLevel are dropped before formatting.
// Passing nullptr disables logging.
void ztmSetLogSink(LogSink sink, LogLevel maxLevel = LogLevel::Debug);

void ztmLog(LogLevel level, const char* format, ...)
    __attribute__((format(printf, 2, 3)));

const char* ztmLogLevelTag(LogLevel level);

#define ZTM_LOGE(...) ztmLog(LogLevel::Error, __VA_ARGS__)
#define ZTM_LOGW(...) ztmLog(LogLevel::Warning, __VA_ARGS__)
#define ZTM_LOGI(...) ztmLog(LogLevel::Info, __VA_ARGS__)
#define ZTM_LOGD(...) ztmLog(LogLevel::Debug, __VA_ARGS__)

#endif // ZTM_LOG_H
