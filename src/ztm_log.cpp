#include "ztm_log.h"

#include <cstdarg>
#include <cstdio>

namespace {
LogSink activeSink = nullptr;
LogLevel activeLevel = LogLevel::Debug;

// Long enough for a full request context line, longer lines get truncated
const size_t LOG_LINE_MAX = 256;
}

void ztmSetLogSink(LogSink sink, LogLevel maxLevel) {
    activeSink = sink;
    activeLevel = maxLevel;
}

void ztmLog(LogLevel level, const char* format, ...) {
    if (activeSink == nullptr || level > activeLevel) {
        return;
    }

    char line[LOG_LINE_MAX];
    va_list args;
    va_start(args, format);
    vsnprintf(line, sizeof(line), format, args);
    va_end(args);

    activeSink(level, line);
}

const char* ztmLogLevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Error:
            return "E";
        case LogLevel::Warning:
            return "W";
        case LogLevel::Info:
            return "I";
        case LogLevel::Debug:
            return "D";
    }
    return "?";
}
