#pragma once

#include <mutex>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>

namespace lcr {
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
    Fatal,
    Off
};

// Configuration strings -> level (unknown strings map to Info)
[[nodiscard]]
inline Level parse_level(std::string_view s) noexcept {
    if (s == "trace") return Level::Trace;
    if (s == "debug") return Level::Debug;
    if (s == "warn")  return Level::Warn;
    if (s == "error") return Level::Error;
    if (s == "fatal") return Level::Fatal;
    if (s == "off")   return Level::Off;
    return Level::Info;
}

// ---------------------------------------------------------
// Thread-safe process-wide logger
// ---------------------------------------------------------
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = lvl;
    }

    [[nodiscard]]
    Level level() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    [[nodiscard]]
    bool enabled(Level lvl) const noexcept {
        return lvl != Level::Off && lvl >= level();
    }

    void enable_color(bool on) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        color_enabled_ = on;
    }

    // Sink setter (stdout by default). The stream must outlive the logger use.
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os ? os : &std::cout;
    }

    void log(Level lvl, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (lvl < level_ || lvl == Level::Off) return;
        auto& os = *out_;
        if (color_enabled_) os << color_code(lvl);
        os << timestamp() << " [" << level_name(lvl) << "] " << msg;
        if (color_enabled_) os << "\033[0m";
        os << '\n';
        if (lvl >= Level::Warn) os.flush();
    }

private:
    Logger()
        : out_(&std::cout),
          level_(Level::Info),
          color_enabled_(false)
    {}

    static const char* level_name(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO";
            case Level::Warn:  return "WARN";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
            default:           break;
        }
        return "?????";
    }

    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";
            case Level::Debug: return "\033[36m";
            case Level::Info:  return "\033[32m";
            case Level::Warn:  return "\033[33m";
            case Level::Error: return "\033[31m";
            case Level::Fatal: return "\033[1;31m";
            default:           break;
        }
        return "\033[0m";
    }

    // Wall-clock timestamp with millisecond precision
    static std::string timestamp() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto t = system_clock::to_time_t(now);
        const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
        localtime_r(&t, &tm);
        char buf[64];
        const auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
        return buf;
    }

private:
    std::ostream* out_;
    Level level_;
    bool color_enabled_;
    mutable std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string)
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
} // namespace lcr


// ---------------------------------------------------------
// Logging macros. The message expression is only evaluated
// when the level is enabled.
// ---------------------------------------------------------
#define SW_LOG_LEVEL(lvl, msg)                                              \
    do {                                                                    \
        if (::lcr::log::Logger::instance().enabled((lvl))) {                \
            ::lcr::log::LogStream((lvl)) << msg;                            \
        }                                                                   \
    } while (0)

#define SW_TRACE(msg)  SW_LOG_LEVEL(::lcr::log::Level::Trace, msg)
#define SW_DEBUG(msg)  SW_LOG_LEVEL(::lcr::log::Level::Debug, msg)
#define SW_INFO(msg)   SW_LOG_LEVEL(::lcr::log::Level::Info,  msg)
#define SW_WARN(msg)   SW_LOG_LEVEL(::lcr::log::Level::Warn,  msg)
#define SW_ERROR(msg)  SW_LOG_LEVEL(::lcr::log::Level::Error, msg)
#define SW_FATAL(msg)  SW_LOG_LEVEL(::lcr::log::Level::Fatal, msg)
