/**
 * @file SystemCallbacks.hpp
 * @brief Typed system-level notifications.
 *
 * Same shape as the channel callbacks: derive from SystemCallback, hide the
 * hooks you need and register with System::set_callback<C>(mask). Only the
 * notification kinds in the mask are delivered.
 *
 * Mix notifications arrive on the mixer thread, update notifications on the
 * thread calling System::update(), memory and error notifications on
 * whichever thread hit the condition.
 */

#ifndef FMODPP_ENGINE_SYSTEM_CALLBACKS_HPP
#define FMODPP_ENGINE_SYSTEM_CALLBACKS_HPP

#include "core/Trampoline.hpp"
#include "engine/Sound.hpp"
#include "engine/System.hpp"

#include <cstdint>
#include <string_view>
#include <type_traits>

namespace fmodpp {

/**
 * @brief Details of a failed API call, valid for the duration of the hook.
 */
struct ErrorInfo {
    Error error;
    FMOD_ERRORCALLBACK_INSTANCETYPE instance_type;
    void* instance;
    std::string_view function_name;
    std::string_view function_params;
};

struct SystemCallback {
    static void device_list_changed(System) {}
    static void record_list_changed(System) {}
    static void device_reinitialize(System, FMOD_OUTPUTTYPE /* output */, int /* driver */) {}
    static void memory_allocation_failed(System, std::string_view /* location */, int /* size */) {}
    static void thread_created(System, void* /* thread */, std::string_view /* name */) {}
    static void thread_destroyed(System, void* /* thread */, std::string_view /* name */) {}
    static void error(System, const ErrorInfo&) {}
    static void pre_mix(System) {}
    static void mid_mix(System) {}
    static void post_mix(System) {}
    static void pre_update(System) {}
    static void post_update(System) {}
    static void buffered_no_mix(System) {}
    static void output_underrun(System) {}
    static void record_position_changed(System, Sound, unsigned int /* pcm_position */) {}
};

/**
 * @brief Default system hooks: engine errors, allocation failures and output
 * underruns go to the Logger under "fmod.system".
 */
struct SystemLog : SystemCallback {
    static void memory_allocation_failed(System system, std::string_view location, int size);
    static void error(System system, const ErrorInfo& info);
    static void output_underrun(System system);
};

namespace detail {

inline std::string_view c_string(const void* text) noexcept {
    return text != nullptr ? std::string_view(static_cast<const char*>(text)) : std::string_view();
}

} // namespace detail

/**
 * @brief Trampoline for system registrations.
 */
template <typename C>
FMOD_RESULT F_CALL system_callback(FMOD_SYSTEM* raw,
                                   FMOD_SYSTEM_CALLBACK_TYPE callback_type,
                                   void* command_data1,
                                   void* command_data2,
                                   void* /* user_data */) noexcept {
    constexpr const char* site = "SystemCallback";
    if (raw == nullptr) {
        return reject_invocation(site, "invoked without a system");
    }
    System system = System::from_raw(raw);

    switch (callback_type) {
        case FMOD_SYSTEM_CALLBACK_DEVICELISTCHANGED:
            return invoke_contained(site, [&] { C::device_list_changed(system); });
        case FMOD_SYSTEM_CALLBACK_RECORDLISTCHANGED:
            return invoke_contained(site, [&] { C::record_list_changed(system); });

        case FMOD_SYSTEM_CALLBACK_DEVICEREINITIALIZE: {
            if (command_data2 == nullptr) {
                return reject_invocation(site, "device reinitialize without a driver");
            }
            auto output = static_cast<FMOD_OUTPUTTYPE>(reinterpret_cast<intptr_t>(command_data1));
            int driver = *static_cast<const int*>(command_data2);
            return invoke_contained(site, [&] { C::device_reinitialize(system, output, driver); });
        }

        case FMOD_SYSTEM_CALLBACK_MEMORYALLOCATIONFAILED: {
            if (command_data2 == nullptr) {
                return reject_invocation(site, "allocation failure without a size");
            }
            std::string_view location = detail::c_string(command_data1);
            int size = *static_cast<const int*>(command_data2);
            return invoke_contained(site, [&] { C::memory_allocation_failed(system, location, size); });
        }

        case FMOD_SYSTEM_CALLBACK_THREADCREATED: {
            std::string_view name = detail::c_string(command_data2);
            return invoke_contained(site, [&] { C::thread_created(system, command_data1, name); });
        }
        case FMOD_SYSTEM_CALLBACK_THREADDESTROYED: {
            std::string_view name = detail::c_string(command_data2);
            return invoke_contained(site, [&] { C::thread_destroyed(system, command_data1, name); });
        }

        case FMOD_SYSTEM_CALLBACK_ERROR: {
            const auto* native = static_cast<const FMOD_ERRORCALLBACK_INFO*>(command_data1);
            if (native == nullptr) {
                return reject_invocation(site, "error notification without details");
            }
            ErrorInfo info{Error(native->result), native->instancetype, native->instance,
                           detail::c_string(native->functionname), detail::c_string(native->functionparams)};
            return invoke_contained(site, [&] { C::error(system, info); });
        }

        case FMOD_SYSTEM_CALLBACK_PREMIX:
            return invoke_contained(site, [&] { C::pre_mix(system); });
        case FMOD_SYSTEM_CALLBACK_MIDMIX:
            return invoke_contained(site, [&] { C::mid_mix(system); });
        case FMOD_SYSTEM_CALLBACK_POSTMIX:
            return invoke_contained(site, [&] { C::post_mix(system); });
        case FMOD_SYSTEM_CALLBACK_PREUPDATE:
            return invoke_contained(site, [&] { C::pre_update(system); });
        case FMOD_SYSTEM_CALLBACK_POSTUPDATE:
            return invoke_contained(site, [&] { C::post_update(system); });
        case FMOD_SYSTEM_CALLBACK_BUFFEREDNOMIX:
            return invoke_contained(site, [&] { C::buffered_no_mix(system); });
        case FMOD_SYSTEM_CALLBACK_OUTPUTUNDERRUN:
            return invoke_contained(site, [&] { C::output_underrun(system); });

        case FMOD_SYSTEM_CALLBACK_RECORDPOSITIONCHANGED: {
            auto* sound = static_cast<FMOD_SOUND*>(command_data1);
            if (sound == nullptr) {
                return reject_invocation(site, "record position without a sound");
            }
            auto position = static_cast<unsigned int>(reinterpret_cast<uintptr_t>(command_data2));
            return invoke_contained(site, [&] { C::record_position_changed(system, Sound::from_raw(sound), position); });
        }

        default:
            return reject_invocation(site, "unknown notification kind");
    }
}

template <typename C>
Result<> System::set_callback(FMOD_SYSTEM_CALLBACK_TYPE mask) const {
    static_assert(std::is_base_of_v<SystemCallback, C>, "C must derive from SystemCallback");
    return check(FMOD_System_SetCallback(raw_, &system_callback<C>, mask));
}

} // namespace fmodpp

#endif // FMODPP_ENGINE_SYSTEM_CALLBACKS_HPP
