#pragma once

#include <mutex>
#include <atomic>
#include <cstdint>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>


namespace sumquery {
namespace log {

// ---------------------------------------------------------
// Log level
// ---------------------------------------------------------
enum class Level : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Map a textual level ("trace", "debug", ...) to Level. Unknown names map to Info.
[[nodiscard]] inline Level parse_level(std::string_view name) noexcept {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    return Level::Info;
}

// Human-readable severity names
[[nodiscard]] inline constexpr const char* level_name(Level lvl) noexcept {
    switch (lvl) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "?????";
}

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }

    Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

    [[nodiscard]] bool enabled(Level lvl) const noexcept { return lvl >= level(); }

    void enable_color(bool on) noexcept { color_enabled_.store(on, std::memory_order_relaxed); }

    // Sink setter (stdout by default). The stream must outlive its use by the logger.
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os;
    }

    void log(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        const bool color = color_enabled_.load(std::memory_order_relaxed);
        if (color) os << color_code(lvl);
        os << timestamp() << " [" << level_name(lvl) << "] " << msg;
        if (color) os << "\033[0m";
        os << std::endl;
    }

private:
    Logger()
        : out_(&std::cout),
          level_(Level::Info),
          color_enabled_(true)
    {}

    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";
            case Level::Debug: return "\033[36m";
            case Level::Info:  return "\033[32m";
            case Level::Warn:  return "\033[33m";
            case Level::Error: return "\033[31m";
            case Level::Fatal: return "\033[1;31m";
        }
        return "\033[0m";
    }

    static std::string timestamp() {
        using namespace std::chrono;
        auto t = system_clock::to_time_t(system_clock::now());
        std::tm tm{};
    #ifdef _WIN32
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        return buf;
    }

private:
    std::ostream* out_;
    std::atomic<Level> level_;
    std::atomic<bool> color_enabled_;
    std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log record (collects << into a string, emits on destruction)
// ---------------------------------------------------------
class LogStream {
public:
    explicit LogStream(Level lvl) : lvl_(lvl) {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

    ~LogStream() {
        Logger::instance().log(lvl_, ss_.str());
    }

private:
    Level lvl_;
    std::ostringstream ss_;
};

} // namespace log
} // namespace sumquery


// ---------------------------------------------------------
// Logging macros
// ---------------------------------------------------------
#define SQ_LOG_LEVEL(lvl) ::sumquery::log::LogStream((lvl))

#define SQ_TRACE(msg)  SQ_LOG_LEVEL(::sumquery::log::Level::Trace) << msg
#define SQ_DEBUG(msg)  SQ_LOG_LEVEL(::sumquery::log::Level::Debug) << msg
#define SQ_INFO(msg)   SQ_LOG_LEVEL(::sumquery::log::Level::Info)  << msg
#define SQ_WARN(msg)   SQ_LOG_LEVEL(::sumquery::log::Level::Warn)  << msg
#define SQ_ERROR(msg)  SQ_LOG_LEVEL(::sumquery::log::Level::Error) << msg
#define SQ_FATAL(msg)  SQ_LOG_LEVEL(::sumquery::log::Level::Fatal) << msg
