/**
 * @file Runtime.hpp
 * @brief Process-wide engine state outside any system: disk access and
 * memory usage.
 */

#ifndef FMODPP_ENGINE_RUNTIME_HPP
#define FMODPP_ENGINE_RUNTIME_HPP

#include "core/Error.hpp"

#include <fmod.h>
#include <utility>

namespace fmodpp {

struct MemoryStats {
    int current_allocated = 0;
    int max_allocated = 0;  // Since System::init()
};

/**
 * @brief Bytes the engine has allocated.
 * @param blocking Wait for pending allocations to settle before sampling.
 */
Result<MemoryStats> memory_stats(bool blocking = true);

/**
 * @brief Whether the engine is reading from disk right now. Only a hint; use
 * lock_disk_busy() for mutual exclusion.
 */
Result<bool> disk_busy();

/**
 * @brief Claim or return the engine's disk access semaphore. Claiming blocks
 * until the engine's current read completes. Calls must come in pairs.
 */
Result<> set_disk_busy(bool busy);

/**
 * @brief Holds the disk busy state; the engine does no file I/O while a guard
 * is alive.
 */
class FileBusyGuard {
public:
    FileBusyGuard(const FileBusyGuard&) = delete;
    FileBusyGuard& operator=(const FileBusyGuard&) = delete;

    FileBusyGuard(FileBusyGuard&& other) noexcept : held_(std::exchange(other.held_, false)) {}
    FileBusyGuard& operator=(FileBusyGuard&&) = delete;

    ~FileBusyGuard() { reset(); }

    /**
     * @brief Clear the busy state now and report the native result.
     */
    Result<> unlock() &&;

private:
    friend Result<FileBusyGuard> lock_disk_busy();

    FileBusyGuard() noexcept = default;

    void reset() noexcept;

    bool held_ = true;
};

/**
 * @brief set_disk_busy(true), cleared again when the guard ends.
 */
Result<FileBusyGuard> lock_disk_busy();

} // namespace fmodpp

#endif // FMODPP_ENGINE_RUNTIME_HPP
