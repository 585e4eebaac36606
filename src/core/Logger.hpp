#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <optional>
#include <ostream>

namespace fmodpp {

/**
 * @brief A single diagnostic record.
 * Fixed-size so it can be produced from engine threads without allocating.
 */
struct LogEntry {
    enum class Type {
        Message,
        Event
    };

    Type type = Type::Message;
    char tag[32] = {};       // Category or Tag
    float value = 0.0f;      // Numeric value (for Type::Event)
    char message[192] = {};  // Truncated text (for Type::Message)
    uint64_t timestamp = 0;  // Steady clock, nanoseconds
};

/**
 * @brief A bounded lock-free multi-producer multi-consumer queue.
 *
 * Each cell carries a sequence number; producers and consumers claim a slot
 * with a CAS on their cursor and publish through the cell sequence, so any
 * number of engine threads may push concurrently.
 */
template<typename T, size_t Size>
class LockFreeRingBuffer {
public:
    static_assert((Size & (Size - 1)) == 0, "Size must be a power of 2");

    LockFreeRingBuffer() {
        for (size_t i = 0; i < Size; ++i) {
            cells[i].sequence.store(i, std::memory_order_relaxed);
        }
    }

    bool push(const T& item) {
        size_t pos = head.load(std::memory_order_relaxed);
        Cell* cell = nullptr;
        for (;;) {
            cell = &cells[pos & mask];
            size_t seq = cell->sequence.load(std::memory_order_acquire);
            intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos);
            if (diff == 0) {
                if (head.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
                    break;
                }
            } else if (diff < 0) {
                return false; // Full
            } else {
                pos = head.load(std::memory_order_relaxed);
            }
        }
        cell->value = item;
        cell->sequence.store(pos + 1, std::memory_order_release);
        return true;
    }

    std::optional<T> pop() {
        size_t pos = tail.load(std::memory_order_relaxed);
        Cell* cell = nullptr;
        for (;;) {
            cell = &cells[pos & mask];
            size_t seq = cell->sequence.load(std::memory_order_acquire);
            intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos + 1);
            if (diff == 0) {
                if (tail.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
                    break;
                }
            } else if (diff < 0) {
                return std::nullopt; // Empty
            } else {
                pos = tail.load(std::memory_order_relaxed);
            }
        }
        T item = cell->value;
        cell->sequence.store(pos + Size, std::memory_order_release);
        return item;
    }

    bool empty() const {
        return head.load(std::memory_order_acquire) == tail.load(std::memory_order_acquire);
    }

private:
    struct Cell {
        std::atomic<size_t> sequence{0};
        T value{};
    };

    static constexpr size_t mask = Size - 1;
    std::array<Cell, Size> cells;
    alignas(64) std::atomic<size_t> head{0};
    alignas(64) std::atomic<size_t> tail{0};
};

/**
 * @brief Process-wide diagnostic sink.
 *
 * Producers (handle destructors, callback trampolines, the engine debug hook)
 * only copy into a fixed-size entry and push; draining and formatting happen
 * on whichever thread calls pop_entry() or flush(). When the queue is full the
 * entry is dropped and counted.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    // Producer Methods (allocation-free, any thread)
    void log_message(const char* tag, const char* msg) noexcept {
        LogEntry entry;
        entry.type = LogEntry::Type::Message;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        std::strncpy(entry.message, msg, sizeof(entry.message) - 1);
        entry.timestamp = now();
        publish(entry);
    }

    void log_event(const char* tag, float value) noexcept {
        LogEntry entry;
        entry.type = LogEntry::Type::Event;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        entry.value = value;
        entry.timestamp = now();
        publish(entry);
    }

    /**
     * @brief printf-style variant; the text is formatted into the entry itself.
     */
    [[gnu::format(printf, 3, 4)]]
    void log_messagef(const char* tag, const char* format, ...) noexcept {
        LogEntry entry;
        entry.type = LogEntry::Type::Message;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        va_list args;
        va_start(args, format);
        std::vsnprintf(entry.message, sizeof(entry.message), format, args);
        va_end(args);
        entry.timestamp = now();
        publish(entry);
    }

    // Consumer Methods
    std::optional<LogEntry> pop_entry() {
        return ring_buffer.pop();
    }

    /**
     * @brief Drain every pending entry to a stream, one line each.
     * @return Number of entries written.
     */
    size_t flush(std::ostream& out) {
        size_t written = 0;
        while (auto entry = ring_buffer.pop()) {
            out << "[" << entry->tag << "] ";
            if (entry->type == LogEntry::Type::Event) {
                out << entry->value;
            } else {
                out << entry->message;
            }
            out << "\n";
            ++written;
        }
        return written;
    }

    /**
     * @brief Discard pending entries.
     */
    void clear() {
        while (ring_buffer.pop()) {
        }
    }

    uint64_t dropped() const {
        return dropped_count.load(std::memory_order_relaxed);
    }

private:
    Logger() = default;

    void publish(const LogEntry& entry) noexcept {
        if (!ring_buffer.push(entry)) {
            dropped_count.fetch_add(1, std::memory_order_relaxed);
        }
    }

    static uint64_t now() noexcept {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count());
    }

    LockFreeRingBuffer<LogEntry, 1024> ring_buffer;
    std::atomic<uint64_t> dropped_count{0};
};

} // namespace fmodpp
