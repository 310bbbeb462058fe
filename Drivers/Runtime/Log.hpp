#pragma once

#include <cstddef>
#include <cstdint>

namespace Drivers {
namespace Runtime {

    enum class LogLevel : uint8_t {
        LOG_DEBUG = 0,
        LOG_INFO,
        LOG_WARN,
        LOG_ERROR
    };

    // Lines longer than this are truncated
    static constexpr size_t kLogLineSize = 192;

    // Receives one formatted line, without the trailing newline.
    typedef void (*LogSink)(LogLevel level, const char* line);

    // Build-time default; lower levels are compiled in but filtered at run time.
    #ifndef NUSENSE_LOG_LEVEL
    #define NUSENSE_LOG_LEVEL ::Drivers::Runtime::LogLevel::LOG_INFO
    #endif

    /**
     * @brief Install a sink for formatted lines.
     *
     * Passing nullptr restores the default sink, which prints the line with
     * printf (retargeted to the debug probe on the board, stdout on the host).
     */
    void setLogSink(LogSink sink);

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel();

    const char* levelName(LogLevel level);

    void log(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace Runtime
} // namespace Drivers

#define NUSENSE_LOG_DEBUG(...) ::Drivers::Runtime::log(::Drivers::Runtime::LogLevel::LOG_DEBUG, __VA_ARGS__)
#define NUSENSE_LOG_INFO(...)  ::Drivers::Runtime::log(::Drivers::Runtime::LogLevel::LOG_INFO,  __VA_ARGS__)
#define NUSENSE_LOG_WARN(...)  ::Drivers::Runtime::log(::Drivers::Runtime::LogLevel::LOG_WARN,  __VA_ARGS__)
#define NUSENSE_LOG_ERROR(...) ::Drivers::Runtime::log(::Drivers::Runtime::LogLevel::LOG_ERROR, __VA_ARGS__)
