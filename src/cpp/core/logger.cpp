#include "logger.h"
#include <cstdarg>
#include <cstdlib>
#include <cstring>
#include <chrono>
#include <ctime>
#include <strings.h>

namespace quicwire {
namespace core {

namespace {

// "2026-10-17 09:15:02.417"
void format_timestamp(char* buf, size_t size) noexcept {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    struct tm local;
    localtime_r(&seconds, &local);

    size_t n = std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", &local);
    snprintf(buf + n, size - n, ".%03d", static_cast<int>(millis));
}

const char* basename_of(const char* path) noexcept {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

} // namespace

const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::NONE:  return "NONE";
    }
    return "?";
}

Logger::~Logger() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    close_output_file_locked();
}

void Logger::log(LogLevel level, const char* tag, const char* file, int line,
                 const char* fmt, ...) noexcept {
    if (static_cast<uint8_t>(level) < min_level_.load(std::memory_order_relaxed)) {
        return;
    }

    char message[2048];
    va_list args;
    va_start(args, fmt);
    vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(mutex_);

    size_t index = find_tag(tag);
    if (index != MAX_TAGS && !tags_[index].enabled) {
        return;
    }

    if (sink_) {
        sink_(level, tag, message);
        return;
    }

    char timestamp[32];
    format_timestamp(timestamp, sizeof(timestamp));

    fprintf(output_file_, "%s %-5s %s: %s [%s:%d]\n",
            timestamp, log_level_name(level), tag, message,
            basename_of(file), line);
    fflush(output_file_);
}

size_t Logger::find_tag(const char* tag) const noexcept {
    for (size_t i = 0; i < tag_count_; ++i) {
        if (std::strcmp(tags_[i].name, tag) == 0) {
            return i;
        }
    }
    return MAX_TAGS;
}

bool Logger::set_tag_enabled(const char* tag, bool enabled) noexcept {
    size_t len = std::strlen(tag);
    if (len == 0 || len > MAX_TAG_LENGTH) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    size_t index = find_tag(tag);
    if (index != MAX_TAGS) {
        tags_[index].enabled = enabled;
        return true;
    }

    if (tag_count_ == MAX_TAGS) {
        return false;
    }

    TagFilter& filter = tags_[tag_count_++];
    std::memcpy(filter.name, tag, len + 1);
    filter.enabled = enabled;
    return true;
}

bool Logger::is_tag_enabled(const char* tag) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t index = find_tag(tag);
    return index == MAX_TAGS || tags_[index].enabled;
}

void Logger::apply_tag_list(const char* list) noexcept {
    if (!list) {
        return;
    }

    const char* pos = list;
    while (*pos) {
        const char* end = std::strchr(pos, ',');
        size_t len = end ? static_cast<size_t>(end - pos) : std::strlen(pos);

        bool enabled = true;
        const char* name = pos;
        if (len > 0 && *name == '-') {
            enabled = false;
            ++name;
            --len;
        }

        if (len > 0 && len <= MAX_TAG_LENGTH) {
            char tag[MAX_TAG_LENGTH + 1];
            std::memcpy(tag, name, len);
            tag[len] = '\0';
            set_tag_enabled(tag, enabled);
        }

        if (!end) {
            break;
        }
        pos = end + 1;
    }
}

bool Logger::parse_level(const char* name, LogLevel& out) noexcept {
    if (!name) {
        return false;
    }

    static constexpr LogLevel levels[] = {
        LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN, LogLevel::ERROR, LogLevel::NONE
    };

    for (LogLevel level : levels) {
        if (strcasecmp(name, log_level_name(level)) == 0) {
            out = level;
            return true;
        }
    }
    return false;
}

void Logger::configure_from_env() noexcept {
    LogLevel level;
    if (parse_level(std::getenv("QUICWIRE_LOG_LEVEL"), level)) {
        set_level(level);
    }
    apply_tag_list(std::getenv("QUICWIRE_LOG_TAGS"));
}

bool Logger::set_output_file(const char* path) noexcept {
    FILE* file = nullptr;
    if (path) {
        file = fopen(path, "a");
        if (!file) {
            return false;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    close_output_file_locked();
    if (file) {
        output_file_ = file;
        owns_file_ = true;
    }
    return true;
}

void Logger::close_output_file() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    close_output_file_locked();
}

void Logger::close_output_file_locked() noexcept {
    if (owns_file_) {
        fclose(output_file_);
    }
    output_file_ = stderr;
    owns_file_ = false;
}

void Logger::set_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

} // namespace core
} // namespace quicwire
