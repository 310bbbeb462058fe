#include "Drivers/Runtime/Log.hpp"
#include "Drivers/STM32HAL/stm32hal.h"

#include <cstdarg>
#include <cstdio>

namespace Drivers {
namespace Runtime {

static void printfSink(LogLevel level, const char* line) {
    (void) level;
    printf("%s\n", line);
}

static LogSink  s_sink  = &printfSink;
static LogLevel s_level = NUSENSE_LOG_LEVEL;

void setLogSink(LogSink sink) {
    s_sink = (sink != nullptr) ? sink : &printfSink;
}

void setLogLevel(LogLevel level) { s_level = level; }
LogLevel getLogLevel() { return s_level; }

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_DEBUG: return "DEBUG";
        case LogLevel::LOG_INFO:  return "INFO";
        case LogLevel::LOG_WARN:  return "WARN";
        case LogLevel::LOG_ERROR: return "ERROR";
    }
    return "?";
}

void log(LogLevel level, const char* fmt, ...) {
    if ((uint8_t)level < (uint8_t)s_level) return;

    char line[kLogLineSize];
    int prefix = snprintf(line, sizeof(line), "[%8lu] %-5s ",
                          (unsigned long)HAL_GetTick(), levelName(level));
    if (prefix < 0) return;
    if ((size_t)prefix >= sizeof(line)) prefix = (int)sizeof(line) - 1;

    va_list args;
    va_start(args, fmt);
    vsnprintf(line + prefix, sizeof(line) - (size_t)prefix, fmt, args);
    va_end(args);

    s_sink(level, line);
}

} // namespace Runtime
} // namespace Drivers
