#pragma once

#include <string>
#include <string_view>
#include <fstream>
#include <mutex>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <source_location>
#include <format>

namespace sightline::core {

// Log severity levels
enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Critical = 5
};

// Log categories for filtering
enum class LogCategory : uint32_t {
    General = 0,
    Geometry = 1,
    Visibility = 2,
    Lighting = 3,
    Vision = 4,
    Pathfinding = 5,
    Map = 6,
    Performance = 7
};

// Compile-time log level configuration
#ifdef NDEBUG
    constexpr LogLevel COMPILE_TIME_LOG_LEVEL = LogLevel::Info;
    constexpr bool LOG_TO_CONSOLE = false;
#else
    constexpr LogLevel COMPILE_TIME_LOG_LEVEL = LogLevel::Trace;
    constexpr bool LOG_TO_CONSOLE = true;
#endif

// RAII scoped timer for performance logging
class ScopedTimer {
public:
    ScopedTimer(std::string_view name, LogCategory category = LogCategory::Performance);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string name_;
    LogCategory category_;
    std::chrono::steady_clock::time_point start_;
};

// Thread-safe logger shared by every computation in the library
class Logger {
public:
    static Logger& instance();

    // Open the log file. Before this is called messages only go to the console.
    void initialize(const std::string& log_file_path = "sightline.log",
                    bool append = false,
                    LogLevel min_level = COMPILE_TIME_LOG_LEVEL);

    // Flush and close the log file
    void shutdown();

    void set_min_level(LogLevel level) noexcept;
    LogLevel get_min_level() const noexcept { return min_level_.load(std::memory_order_relaxed); }

    void enable_category(LogCategory category, bool enabled = true) noexcept;
    bool is_category_enabled(LogCategory category) const noexcept;

    // Silence console output (tests and tools that print their own results)
    void set_console_output(bool enabled) noexcept { console_enabled_.store(enabled, std::memory_order_relaxed); }

    template<LogLevel Level, LogCategory Category = LogCategory::General>
    void log(std::string_view message,
             const std::source_location& location = std::source_location::current()) {
        if constexpr (Level < COMPILE_TIME_LOG_LEVEL) {
            return;
        }

        if (Level < min_level_.load(std::memory_order_relaxed)) {
            return;
        }

        if (!is_category_enabled(Category)) {
            return;
        }

        log_impl(Level, Category, message, location);
    }

    template<LogLevel Level, LogCategory Category = LogCategory::General, typename... Args>
    void log_fmt(const std::source_location& location, std::format_string<Args...> fmt, Args&&... args) {
        if constexpr (Level < COMPILE_TIME_LOG_LEVEL) {
            return;
        }

        if (Level < min_level_.load(std::memory_order_relaxed)) {
            return;
        }

        if (!is_category_enabled(Category)) {
            return;
        }

        try {
            std::string formatted = std::format(fmt, std::forward<Args>(args)...);
            log_impl(Level, Category, formatted, location);
        } catch (const std::exception& e) {
            log_impl(LogLevel::Error, LogCategory::General,
                     std::format("Log formatting error: {}", e.what()), location);
        }
    }

    void flush();

    struct Stats {
        uint64_t total_logs = 0;
        uint64_t dropped_logs = 0;
        uint64_t file_writes = 0;
        uint64_t console_writes = 0;
    };
    Stats get_stats() const noexcept;

    // Public so ScopedTimer can log with an explicit level and category
    void log_impl(LogLevel level, LogCategory category, std::string_view message,
                  const std::source_location& location);

    static const char* level_to_string(LogLevel level) noexcept;
    static const char* category_to_string(LogCategory category) noexcept;

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write_to_file(std::string_view formatted_message);
    void write_to_console(LogLevel level, std::string_view formatted_message);

    std::string format_log_entry(LogLevel level, LogCategory category,
                                 std::string_view message,
                                 const std::source_location& location) const;

    static const char* level_to_color_code(LogLevel level) noexcept;

    std::atomic<LogLevel> min_level_{COMPILE_TIME_LOG_LEVEL};
    std::atomic<uint32_t> enabled_categories_{0xFFFFFFFF}; // All enabled by default
    std::atomic<bool> console_enabled_{LOG_TO_CONSOLE};

    std::ofstream log_file_;
    std::string log_file_path_;
    std::mutex file_mutex_;
    std::mutex console_mutex_;

    mutable std::atomic<uint64_t> total_logs_{0};
    mutable std::atomic<uint64_t> dropped_logs_{0};
    mutable std::atomic<uint64_t> file_writes_{0};
    mutable std::atomic<uint64_t> console_writes_{0};

    std::atomic<bool> initialized_{false};
};

#define LOG_TRACE(category, ...) \
    ::sightline::core::Logger::instance().log_fmt<::sightline::core::LogLevel::Trace, ::sightline::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_DEBUG(category, ...) \
    ::sightline::core::Logger::instance().log_fmt<::sightline::core::LogLevel::Debug, ::sightline::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_INFO(category, ...) \
    ::sightline::core::Logger::instance().log_fmt<::sightline::core::LogLevel::Info, ::sightline::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_WARNING(category, ...) \
    ::sightline::core::Logger::instance().log_fmt<::sightline::core::LogLevel::Warning, ::sightline::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_ERROR(category, ...) \
    ::sightline::core::Logger::instance().log_fmt<::sightline::core::LogLevel::Error, ::sightline::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_CRITICAL(category, ...) \
    ::sightline::core::Logger::instance().log_fmt<::sightline::core::LogLevel::Critical, ::sightline::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_SCOPE_TIMER(name) \
    ::sightline::core::ScopedTimer SIGHTLINE_UNIQUE_NAME(timer_)(name)

#define LOG_SCOPE_TIMER_CAT(name, category) \
    ::sightline::core::ScopedTimer SIGHTLINE_UNIQUE_NAME(timer_)(name, ::sightline::core::LogCategory::category)

#define SIGHTLINE_CONCAT_IMPL(a, b) a##b
#define SIGHTLINE_CONCAT(a, b) SIGHTLINE_CONCAT_IMPL(a, b)
#define SIGHTLINE_UNIQUE_NAME(prefix) SIGHTLINE_CONCAT(prefix, __LINE__)

} // namespace sightline::core
