#pragma once

#include <cstdarg>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#define CADENZA_VERSION_MAJOR 1
#define CADENZA_VERSION_MINOR 0

namespace cadenza {

    typedef int64_t cadenza_tick_t;
    typedef uint64_t cadenza_timestamp_t;
    typedef int32_t cadenza_track_index_t;

    inline constexpr int32_t kDefaultTicksPerQuarterNote = 480;
    inline constexpr double kDefaultBpm = 120.0;
    inline constexpr int32_t kMaxTracks = 16;

    enum class StatusCode {
        OK,
        UNKNOWN_PROCESSOR,
        INVALID_PARAMETER,
        INVALID_METADATA,
        FAILED_TO_PROCESS,
        UNSUPPORTED_VERSION,
        MALFORMED_DATA,
        INVALID_STATE
    };

    const char* statusCodeName(StatusCode code);

    // The four failure categories the engine recovers from. None of them escapes processAudio().
    enum class ErrorKind {
        ConfigurationError, // unknown processor id or malformed parameters, found at track setup
        RenderFailure,      // a processor failed inside process(); only its voice (or effect chain) is dropped
        TimingViolation,    // block work exceeded the real-time budget
        ResourceExhaustion  // polyphony cap reached; a voice gets evicted
    };

    const char* errorKindName(ErrorKind kind);

    class Logger {
    public:
        class Impl;

#undef ERROR
        enum LogLevel {
            DIAGNOSTIC,
            INFO,
            WARNING,
            ERROR
        };

        static Logger* global();
        void logError(const char* format, ...);
        void logWarning(const char* format, ...);
        void logInfo(const char* format, ...);
        void logDiagnostic(const char* format, ...);
        static void stopDefaultLogger();

        Logger();
        ~Logger();

        void log(LogLevel level, const char* format, ...);
        void logv(LogLevel level, const char* format, va_list args);

        std::vector<std::function<void(LogLevel level, size_t serial, const char* s)>> callbacks;

    private:
        Impl *impl{nullptr};
    };

}
