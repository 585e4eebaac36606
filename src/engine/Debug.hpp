/**
 * @file Debug.hpp
 * @brief Routing of the engine's own diagnostic output.
 *
 * Only the logging build of the engine (libfmodL) honours these calls; with
 * the release build they fail with FMOD_ERR_UNSUPPORTED.
 */

#ifndef FMODPP_ENGINE_DEBUG_HPP
#define FMODPP_ENGINE_DEBUG_HPP

#include "core/Error.hpp"
#include "core/Trampoline.hpp"

#include <fmod.h>
#include <string>
#include <string_view>

namespace fmodpp {

/**
 * @brief Default debug sink: forwards engine messages to the Logger.
 *
 * Entries are tagged "fmod.error", "fmod.warning" or "fmod.log" after the
 * message level.
 */
struct DebugLog {
    static void log(FMOD_DEBUG_FLAGS flags, std::string_view file, int line,
                    std::string_view function, std::string_view message);
};

const char* debug_tag(FMOD_DEBUG_FLAGS flags) noexcept;

/**
 * @brief Trampoline for FMOD_DEBUG_CALLBACK; forwards to D::log.
 */
template <typename D>
FMOD_RESULT F_CALL debug_callback(FMOD_DEBUG_FLAGS flags, const char* file, int line,
                                  const char* function, const char* message) noexcept {
    std::string_view file_view = file != nullptr ? file : "";
    std::string_view function_view = function != nullptr ? function : "";
    std::string_view message_view = message != nullptr ? message : "";
    while (!message_view.empty() && (message_view.back() == '\n' || message_view.back() == '\r')) {
        message_view.remove_suffix(1);
    }
    return invoke_contained("DebugCallback", [&] {
        D::log(flags, file_view, line, function_view, message_view);
    });
}

namespace detail {

Result<> debug_initialize(FMOD_DEBUG_FLAGS flags, FMOD_DEBUG_MODE mode,
                          FMOD_DEBUG_CALLBACK callback, const char* filename);

} // namespace detail

/**
 * @brief Send engine output to D::log.
 */
template <typename D>
Result<> initialize_debug(FMOD_DEBUG_FLAGS flags) {
    return detail::debug_initialize(flags, FMOD_DEBUG_MODE_CALLBACK, &debug_callback<D>, nullptr);
}

/**
 * @brief Send engine output to the Logger through DebugLog.
 */
Result<> initialize_debug_log(FMOD_DEBUG_FLAGS flags = FMOD_DEBUG_LEVEL_WARNING);

/**
 * @brief Send engine output to the platform's console.
 */
Result<> initialize_debug_tty(FMOD_DEBUG_FLAGS flags = FMOD_DEBUG_LEVEL_WARNING);

/**
 * @brief Send engine output to a file.
 */
Result<> initialize_debug_file(FMOD_DEBUG_FLAGS flags, const std::string& path);

} // namespace fmodpp

#endif // FMODPP_ENGINE_DEBUG_HPP
