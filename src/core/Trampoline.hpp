/**
 * @file Trampoline.hpp
 * @brief Exception containment at the engine callback boundary.
 *
 * The engine calls back into C-linkage function pointers. No exception may
 * unwind through engine frames, so every user callback body runs inside
 * invoke_contained(), which turns whatever escapes into a result code.
 */

#ifndef FMODPP_CORE_TRAMPOLINE_HPP
#define FMODPP_CORE_TRAMPOLINE_HPP

#include "core/Error.hpp"
#include "core/Logger.hpp"

#include <exception>
#include <utility>

namespace fmodpp {

/**
 * @brief Run a callback body and convert any escaping exception.
 *
 * @param site Logger tag identifying the trampoline.
 * @return FMOD_OK when the body returns normally, the code of a thrown Error,
 *         or FMOD_ERR_INTERNAL for any other exception.
 */
template <typename Fn>
FMOD_RESULT invoke_contained(const char* site, Fn&& body) noexcept {
    try {
        std::forward<Fn>(body)();
        return FMOD_OK;
    } catch (const Error& error) {
        Logger::instance().log_messagef(site, "callback returned %s error %d: %s",
                                        kind_name(error.kind()), static_cast<int>(error.code()), error.what());
        return error.code();
    } catch (const std::exception& e) {
        Logger::instance().log_messagef(site, "callback threw: %s", e.what());
        return FMOD_ERR_INTERNAL;
    } catch (...) {
        Logger::instance().log_message(site, "callback threw a non-standard exception");
        return FMOD_ERR_INTERNAL;
    }
}

/**
 * @brief Refuse an invocation without running user code.
 */
inline FMOD_RESULT reject_invocation(const char* site, const char* reason) noexcept {
    Logger::instance().log_message(site, reason);
    return FMOD_ERR_INVALID_PARAM;
}

} // namespace fmodpp

#endif // FMODPP_CORE_TRAMPOLINE_HPP
