#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace tickguard {
namespace logging {

/**
 * Log Level
 */
enum class LogLevel : uint8_t { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Fatal = 5 };

inline const char* level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO ";
    case LogLevel::Warn:
        return "WARN ";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    default:
        return "?????";
    }
}

inline LogLevel string_to_level(const std::string& s) {
    if (s == "trace" || s == "TRACE")
        return LogLevel::Trace;
    if (s == "debug" || s == "DEBUG")
        return LogLevel::Debug;
    if (s == "warn" || s == "WARN" || s == "warning" || s == "WARNING")
        return LogLevel::Warn;
    if (s == "error" || s == "ERROR")
        return LogLevel::Error;
    if (s == "fatal" || s == "FATAL")
        return LogLevel::Fatal;
    return LogLevel::Info;
}

// Category constants for the engine
namespace LogCategory {
constexpr uint8_t System = 0;
constexpr uint8_t Market = 1;
constexpr uint8_t Venue = 2;
constexpr uint8_t Tracker = 3;
constexpr uint8_t Exit = 4;
constexpr uint8_t Milestone = 5;
constexpr uint8_t Risk = 6;
constexpr uint8_t Store = 7;
} // namespace LogCategory

inline const char* category_to_string(uint8_t category) {
    switch (category) {
    case LogCategory::System:
        return "system";
    case LogCategory::Market:
        return "market";
    case LogCategory::Venue:
        return "venue";
    case LogCategory::Tracker:
        return "tracker";
    case LogCategory::Exit:
        return "exit";
    case LogCategory::Milestone:
        return "milestone";
    case LogCategory::Risk:
        return "risk";
    case LogCategory::Store:
        return "store";
    default:
        return "misc";
    }
}

/**
 * Log Entry - Fixed size, four cache lines.
 * Messages carry reason strings and symbols, so 48 bytes was not enough.
 */
struct alignas(64) LogEntry {
    uint64_t timestamp_ns; // wall clock
    LogLevel level;
    uint8_t category;
    uint16_t reserved;
    uint32_t thread_id;
    char message[240];

    void set_message(const char* msg) {
        size_t len = std::strlen(msg);
        if (len >= sizeof(message))
            len = sizeof(message) - 1;
        std::memcpy(message, msg, len);
        message[len] = '\0';
    }
};
static_assert(sizeof(LogEntry) == 256, "LogEntry must be 256 bytes");

/**
 * Lock-Free SPSC Ring Buffer
 *
 * Single consumer. Producers are serialized by AsyncLogger, so the
 * buffer itself only ever sees one writer at a time.
 */
template <size_t Capacity = 4096>
class alignas(64) LogRingBuffer {
public:
    static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");

    LogRingBuffer() : head_(0), tail_(0) {}

    bool try_push(const LogEntry& entry) {
        size_t head = head_.load(std::memory_order_relaxed);
        size_t next_head = (head + 1) & (Capacity - 1);

        if (next_head == tail_.load(std::memory_order_acquire)) {
            return false; // Buffer full
        }

        buffer_[head] = entry;
        head_.store(next_head, std::memory_order_release);
        return true;
    }

    bool try_pop(LogEntry& entry) {
        size_t tail = tail_.load(std::memory_order_relaxed);

        if (tail == head_.load(std::memory_order_acquire)) {
            return false; // Buffer empty
        }

        entry = buffer_[tail];
        tail_.store((tail + 1) & (Capacity - 1), std::memory_order_release);
        return true;
    }

    size_t size() const {
        size_t head = head_.load(std::memory_order_acquire);
        size_t tail = tail_.load(std::memory_order_acquire);
        return (head - tail + Capacity) & (Capacity - 1);
    }

    bool empty() const { return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire); }

private:
    alignas(64) std::atomic<size_t> head_;
    alignas(64) std::atomic<size_t> tail_;
    alignas(64) std::array<LogEntry, Capacity> buffer_{};
};

/**
 * Async Logger
 *
 * Callers format into a fixed entry and push it into the ring buffer.
 * A background thread handles the actual I/O.
 *
 * One instance is created by the executable and handed by reference to every
 * component; watch threads, the timeout checker and the health monitor all
 * log through it concurrently.
 *
 * Usage:
 *   AsyncLogger logger;
 *   logger.start();
 *   TICKGUARD_LOGF(logger, Info, Tracker, "Trade %lld closed: %s", id, "tp3");
 *   logger.stop();
 */
class AsyncLogger {
public:
    using OutputCallback = std::function<void(const LogEntry&)>;

    AsyncLogger() : running_(false), min_level_(LogLevel::Info), dropped_count_(0), total_logged_(0) {}

    ~AsyncLogger() { stop(); }

    // Non-copyable
    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    /**
     * Start the background consumer thread
     */
    void start() {
        if (running_.exchange(true))
            return; // Already running

        consumer_thread_ = std::thread([this]() { consume_loop(); });
    }

    /**
     * Stop the logger and flush remaining entries
     */
    void stop() {
        if (!running_.exchange(false))
            return; // Already stopped

        if (consumer_thread_.joinable()) {
            consumer_thread_.join();
        }

        flush();
    }

    /**
     * Drain pending entries on the calling thread.
     * Only safe while the consumer thread is not running.
     */
    void flush() {
        if (running_.load())
            return;
        LogEntry entry;
        while (buffer_.try_pop(entry)) {
            output_entry(entry);
        }
    }

    void log(LogLevel level, uint8_t category, const char* message) {
        if (level < min_level_.load(std::memory_order_relaxed))
            return;

        LogEntry entry;
        entry.timestamp_ns = get_timestamp_ns();
        entry.level = level;
        entry.category = category;
        entry.reserved = 0;
        entry.thread_id = get_thread_id();
        entry.set_message(message);

        bool pushed;
        {
            std::lock_guard<std::mutex> lock(push_mutex_);
            pushed = buffer_.try_push(entry);
        }
        if (!pushed) {
            dropped_count_.fetch_add(1, std::memory_order_relaxed);
        } else {
            total_logged_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    /**
     * Log with printf-style formatting
     */
    template <typename... Args>
    void logf(LogLevel level, uint8_t category, const char* fmt, Args... args) {
        if (level < min_level_.load(std::memory_order_relaxed))
            return;

        char buffer[sizeof(LogEntry::message)];
        std::snprintf(buffer, sizeof(buffer), fmt, args...);
        log(level, category, buffer);
    }

    void set_min_level(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }
    LogLevel min_level() const { return min_level_.load(std::memory_order_relaxed); }
    void set_output_callback(OutputCallback cb) { output_callback_ = std::move(cb); }

    // Statistics
    uint64_t dropped_count() const { return dropped_count_.load(); }
    uint64_t total_logged() const { return total_logged_.load(); }
    size_t pending_count() const { return buffer_.size(); }

private:
    LogRingBuffer<4096> buffer_;
    std::mutex push_mutex_;
    std::atomic<bool> running_;
    std::thread consumer_thread_;
    std::atomic<LogLevel> min_level_;
    OutputCallback output_callback_;

    std::atomic<uint64_t> dropped_count_;
    std::atomic<uint64_t> total_logged_;

    void consume_loop() {
        LogEntry entry;
        while (running_.load(std::memory_order_relaxed)) {
            while (buffer_.try_pop(entry)) {
                output_entry(entry);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    void output_entry(const LogEntry& entry) {
        if (output_callback_) {
            output_callback_(entry);
            return;
        }

        std::time_t secs = static_cast<std::time_t>(entry.timestamp_ns / 1'000'000'000ULL);
        auto ms = (entry.timestamp_ns / 1'000'000ULL) % 1000;
        std::tm tm{};
        gmtime_r(&secs, &tm);
        char ts[32];
        std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);
        std::fprintf(stderr, "[%s.%03lu] [%s] [%s] %s\n", ts, static_cast<unsigned long>(ms),
                     level_to_string(entry.level), category_to_string(entry.category), entry.message);
    }

    static uint64_t get_timestamp_ns() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
    }

    static uint32_t get_thread_id() {
        static thread_local uint32_t id = 0;
        if (id == 0) {
            std::hash<std::thread::id> hasher;
            id = static_cast<uint32_t>(hasher(std::this_thread::get_id()));
        }
        return id;
    }
};

// Convenience macros
#define TICKGUARD_LOG(logger, level, cat, msg)                                                                        \
    (logger).log(tickguard::logging::LogLevel::level, tickguard::logging::LogCategory::cat, msg)

#define TICKGUARD_LOGF(logger, level, cat, fmt, ...)                                                                  \
    (logger).logf(tickguard::logging::LogLevel::level, tickguard::logging::LogCategory::cat, fmt, ##__VA_ARGS__)

} // namespace logging
} // namespace tickguard
