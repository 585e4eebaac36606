#include "engine/Debug.hpp"
#include "core/Logger.hpp"
#include "engine/System.hpp"

#include <mutex>

namespace fmodpp {

const char* debug_tag(FMOD_DEBUG_FLAGS flags) noexcept {
    if (flags & FMOD_DEBUG_LEVEL_ERROR) {
        return "fmod.error";
    }
    if (flags & FMOD_DEBUG_LEVEL_WARNING) {
        return "fmod.warning";
    }
    return "fmod.log";
}

void DebugLog::log(FMOD_DEBUG_FLAGS flags, std::string_view file, int line,
                   std::string_view function, std::string_view message) {
    Logger::instance().log_messagef(debug_tag(flags), "%.*s (%.*s:%d %.*s)",
                                    static_cast<int>(message.size()), message.data(),
                                    static_cast<int>(file.size()), file.data(), line,
                                    static_cast<int>(function.size()), function.data());
}

namespace detail {

Result<> debug_initialize(FMOD_DEBUG_FLAGS flags, FMOD_DEBUG_MODE mode,
                          FMOD_DEBUG_CALLBACK callback, const char* filename) {
    std::shared_lock lock(system_lifecycle_mutex());
    return check(FMOD_Debug_Initialize(flags, mode, callback, filename));
}

} // namespace detail

Result<> initialize_debug_log(FMOD_DEBUG_FLAGS flags) {
    return initialize_debug<DebugLog>(flags);
}

Result<> initialize_debug_tty(FMOD_DEBUG_FLAGS flags) {
    return detail::debug_initialize(flags, FMOD_DEBUG_MODE_TTY, nullptr, nullptr);
}

Result<> initialize_debug_file(FMOD_DEBUG_FLAGS flags, const std::string& path) {
    return detail::debug_initialize(flags, FMOD_DEBUG_MODE_FILE, nullptr, path.c_str());
}

} // namespace fmodpp
