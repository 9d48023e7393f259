#pragma once

#include <cstdio>
#include <cstdint>
#include <atomic>
#include <functional>
#include <mutex>
#include <utility>

/**
 * Logging for quicwire
 *
 * The codec itself never logs on the success path. Drops (a datagram that
 * fails to split, a payload length that overruns) are logged at DEBUG under
 * the "QUIC" tag so a receive loop can be traced without a packet capture.
 *
 * Usage:
 *   LOG_DEBUG("QUIC", "Dropping datagram: %s", error_code_to_string(err));
 *   LOG_INFO("Dump", "Datagram %zu: %zu packets", index, count);
 *
 * Runtime control (see configure_from_env):
 *   QUICWIRE_LOG_LEVEL=debug|info|warn|error|none
 *   QUICWIRE_LOG_TAGS=-Dump,QUIC       Comma list; "-" disables a tag
 *
 * Build-time control:
 *   Define QUICWIRE_ENABLE_LOGGING to enable logging.
 *   Without it every LOG_* macro compiles to nothing.
 */

namespace quicwire {
namespace core {

enum class LogLevel : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    NONE = 255  // Disable all logging
};

/**
 * Receives every formatted record that passes the level and tag filters.
 * Called with the logger's lock held.
 */
using LogSink = std::function<void(LogLevel level, const char* tag, const char* message)>;

/**
 * Thread-safe logger singleton
 */
class Logger {
public:
    static Logger& instance() noexcept {
        static Logger logger;
        return logger;
    }

    /**
     * Log a message (called by macros, not meant for direct use)
     *
     * @param level Log level
     * @param tag Subsystem tag ("QUIC", "Dump", "Bench")
     * @param file Source file name
     * @param line Source line number
     * @param fmt Printf-style format string
     */
    void log(LogLevel level, const char* tag, const char* file, int line,
             const char* fmt, ...) noexcept __attribute__((format(printf, 6, 7)));

    void set_level(LogLevel level) noexcept {
        min_level_.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
    }

    LogLevel get_level() const noexcept {
        return static_cast<LogLevel>(min_level_.load(std::memory_order_relaxed));
    }

    /**
     * Parse a level name ("debug", "info", "warn", "error", "none").
     *
     * @param name Level name, case-insensitive
     * @param out Parsed level, untouched on failure
     * @return false if the name is not recognised
     */
    static bool parse_level(const char* name, LogLevel& out) noexcept;

    /**
     * Apply QUICWIRE_LOG_LEVEL and QUICWIRE_LOG_TAGS, if set. Unknown level
     * names are ignored.
     */
    void configure_from_env() noexcept;

    /**
     * Enable or disable one tag. Tags never mentioned are enabled.
     *
     * @return false if the tag table is full or the tag name too long
     */
    bool set_tag_enabled(const char* tag, bool enabled) noexcept;

    bool is_tag_enabled(const char* tag) const noexcept;

    /**
     * Apply a comma separated tag list ("QUIC,-Dump").
     */
    void apply_tag_list(const char* list) noexcept;

    /**
     * Append to a file instead of stderr.
     *
     * @param path File path (nullptr reverts to stderr)
     * @return false if the file cannot be opened
     */
    bool set_output_file(const char* path) noexcept;

    void close_output_file() noexcept;

    /**
     * Route records to a callback instead of the output file. An empty
     * sink restores file output.
     */
    void set_sink(LogSink sink);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

private:
    Logger() noexcept = default;
    ~Logger() noexcept;

    static constexpr size_t MAX_TAGS = 16;
    static constexpr size_t MAX_TAG_LENGTH = 15;

    struct TagFilter {
        char name[MAX_TAG_LENGTH + 1];
        bool enabled;
    };

    // Index into tags_, or MAX_TAGS if absent. Caller holds mutex_.
    size_t find_tag(const char* tag) const noexcept;
    void close_output_file_locked() noexcept;

    std::atomic<uint8_t> min_level_{static_cast<uint8_t>(LogLevel::DEBUG)};

    mutable std::mutex mutex_;
    FILE* output_file_{stderr};
    bool owns_file_{false};
    LogSink sink_;
    TagFilter tags_[MAX_TAGS]{};
    size_t tag_count_{0};
};

const char* log_level_name(LogLevel level) noexcept;

} // namespace core
} // namespace quicwire

// ============================================================================
// Logging Macros
// ============================================================================

#ifdef QUICWIRE_ENABLE_LOGGING

#define LOG_DEBUG(tag, fmt, ...) \
    ::quicwire::core::Logger::instance().log( \
        ::quicwire::core::LogLevel::DEBUG, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_INFO(tag, fmt, ...) \
    ::quicwire::core::Logger::instance().log( \
        ::quicwire::core::LogLevel::INFO, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_WARN(tag, fmt, ...) \
    ::quicwire::core::Logger::instance().log( \
        ::quicwire::core::LogLevel::WARN, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_ERROR(tag, fmt, ...) \
    ::quicwire::core::Logger::instance().log( \
        ::quicwire::core::LogLevel::ERROR, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#else

#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#define LOG_INFO(tag, fmt, ...)  ((void)0)
#define LOG_WARN(tag, fmt, ...)  ((void)0)
#define LOG_ERROR(tag, fmt, ...) ((void)0)

#endif // QUICWIRE_ENABLE_LOGGING
