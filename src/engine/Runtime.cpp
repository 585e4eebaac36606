#include "engine/Runtime.hpp"
#include "core/Logger.hpp"
#include "engine/System.hpp"

#include <mutex>

namespace fmodpp {

namespace {

// The shared side of the lifecycle mutex keeps these calls off a system that
// is being created or released. Nothing holds the exclusive side while
// waiting on the shared side, so locking cannot fail.
FMOD_RESULT native_set_disk_busy(bool busy) noexcept {
    std::shared_lock lock(detail::system_lifecycle_mutex());
    return FMOD_File_SetDiskBusy(busy ? 1 : 0);
}

} // namespace

Result<MemoryStats> memory_stats(bool blocking) {
    std::shared_lock lock(detail::system_lifecycle_mutex());
    MemoryStats stats;
    FMOD_RESULT result = FMOD_Memory_GetStats(&stats.current_allocated, &stats.max_allocated, blocking ? 1 : 0);
    return check(result, stats);
}

Result<bool> disk_busy() {
    std::shared_lock lock(detail::system_lifecycle_mutex());
    int busy = 0;
    FMOD_RESULT result = FMOD_File_GetDiskBusy(&busy);
    return check(result, busy != 0);
}

Result<> set_disk_busy(bool busy) {
    return check(native_set_disk_busy(busy));
}

Result<FileBusyGuard> lock_disk_busy() {
    if (auto result = set_disk_busy(true); !result) {
        return std::unexpected(result.error());
    }
    return Result<FileBusyGuard>(FileBusyGuard());
}

Result<> FileBusyGuard::unlock() && {
    if (!std::exchange(held_, false)) {
        return {};
    }
    return set_disk_busy(false);
}

void FileBusyGuard::reset() noexcept {
    if (!std::exchange(held_, false)) {
        return;
    }
    FMOD_RESULT result = native_set_disk_busy(false);
    if (result != FMOD_OK) {
        Logger::instance().log_messagef("FileBusyGuard", "clearing disk busy state failed (%s): %s",
                                        kind_name(classify(result)), Error(result).what());
    }
}

} // namespace fmodpp
