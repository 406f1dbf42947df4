#include <array>
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <rtlog/rtlog.h>
#include "cadenza/cadenza.hpp"

namespace {
    constexpr auto kMaxQueuedMessages = 256;
    constexpr auto kMaxMessageLength = 512;

    std::atomic<std::size_t> message_serial{0};

    struct MessageContext {
        cadenza::Logger::LogLevel level;
        const cadenza::Logger* owner;
    };

    // Render-thread writers push into this queue; formatting for the callbacks happens on the drain thread.
    using RenderSafeLogger = rtlog::Logger<MessageContext, kMaxQueuedMessages, kMaxMessageLength, message_serial, rtlog::MultiRealtimeWriterQueueType>;
    RenderSafeLogger render_safe_logger;

    class CallbackDispatcher {
    public:
        CallbackDispatcher() = default;
        CallbackDispatcher(const CallbackDispatcher&) = delete;
        CallbackDispatcher(CallbackDispatcher&&) = delete;
        CallbackDispatcher& operator=(const CallbackDispatcher&) = delete;
        CallbackDispatcher& operator=(CallbackDispatcher&&) = delete;

#if WIN32
        void operator()(const MessageContext& context, size_t serial, const char* format, ...)
#else
        void operator()(const MessageContext& context, size_t serial, const char* format, ...) __attribute__ ((format (printf, 4, 5)))
#endif
        {
            std::array<char, kMaxMessageLength> text;
            va_list args;
            va_start(args, format);
            vsnprintf(text.data(), text.size(), format, args);
            va_end(args);
            for (auto& callback : context.owner->callbacks)
                callback(context.level, serial, text.data());
        }
    };

    CallbackDispatcher dispatcher;

    rtlog::LogProcessingThread<RenderSafeLogger, CallbackDispatcher>* drainThread() {
        static rtlog::LogProcessingThread thread(render_safe_logger, dispatcher, std::chrono::milliseconds(10));
        return &thread;
    }

    char levelLetter(cadenza::Logger::LogLevel level) {
        switch (level) {
            case cadenza::Logger::LogLevel::DIAGNOSTIC: return 'D';
            case cadenza::Logger::LogLevel::INFO: return 'I';
            case cadenza::Logger::LogLevel::WARNING: return 'W';
            case cadenza::Logger::LogLevel::ERROR: return 'E';
        }
        return '?';
    }
}

class cadenza::Logger::Impl {
    Logger* owner;

public:
    explicit Impl(Logger* owner) : owner(owner) {
        installStderrSink();
    }

    void installStderrSink() {
        static std::atomic<bool> installed{false};
        if (installed.exchange(true))
            return;
        // CADENZA_LOG_DIAGNOSTIC=1 turns on the per-block diagnostics, which are otherwise too chatty.
        auto env = std::getenv("CADENZA_LOG_DIAGNOSTIC");
        bool withDiagnostics = env != nullptr && env[0] == '1';
        owner->callbacks.emplace_back([withDiagnostics](LogLevel level, size_t serial, const char* s) {
            if (level == LogLevel::DIAGNOSTIC && !withDiagnostics)
                return;
            std::cerr << "[cadenza #" << serial << " (" << levelLetter(level) << ")]: " << s << std::endl;
        });
        drainThread();
    }

    void logv(LogLevel level, const char* format, va_list args) {
        render_safe_logger.Logv(MessageContext{.level = level, .owner = owner}, format, args);
    }
};

cadenza::Logger::Logger() {
    impl = new Impl(this);
}

cadenza::Logger::~Logger() {
    delete impl;
}

void cadenza::Logger::log(LogLevel level, const char* format, ...) {
    va_list args;
    va_start(args, format);
    impl->logv(level, format, args);
    va_end(args);
}

void cadenza::Logger::logv(LogLevel level, const char* format, va_list args) {
    impl->logv(level, format, args);
}

void cadenza::Logger::stopDefaultLogger() {
    drainThread()->Stop();
}

#define CADENZA_DEFINE_LEVEL_LOGGER(LEVEL, NAME) \
void cadenza::Logger::log##NAME(const char* format, ...) { \
    va_list args; \
    va_start(args, format); \
    impl->logv(LEVEL, format, args); \
    va_end(args); \
}

CADENZA_DEFINE_LEVEL_LOGGER(ERROR, Error)
CADENZA_DEFINE_LEVEL_LOGGER(WARNING, Warning)
CADENZA_DEFINE_LEVEL_LOGGER(INFO, Info)
CADENZA_DEFINE_LEVEL_LOGGER(DIAGNOSTIC, Diagnostic)

cadenza::Logger* cadenza::Logger::global() {
    static Logger instance{};
    return &instance;
}
