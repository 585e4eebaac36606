/**
 * @file Callbacks.hpp
 * @brief Typed channel and channel-group notifications.
 *
 * A callback class is stateless and exposes static hooks. Derive from one of
 * the interfaces below and hide the hooks you need; the rest fall back to the
 * empty defaults:
 *
 * @code
 * struct OnEnd : fmodpp::ChannelCallback {
 *     static void end(fmodpp::Channel channel) { ... }
 * };
 * channel.set_callback<OnEnd>();
 * @endcode
 *
 * Each registration installs one trampoline instantiation. The trampoline
 * checks the kind tag supplied by the engine, rejects notifications that do
 * not apply to the kind, and runs the hook inside invoke_contained(). A hook
 * may throw fmodpp::Error to hand a specific code back to the engine.
 *
 * Hooks may run on engine threads. They receive views that are only valid for
 * the duration of the call.
 */

#ifndef FMODPP_CONTROL_CALLBACKS_HPP
#define FMODPP_CONTROL_CALLBACKS_HPP

#include "control/Channel.hpp"
#include "control/ChannelGroup.hpp"
#include "control/Coercion.hpp"
#include "core/Trampoline.hpp"

#include <cstdint>
#include <type_traits>

namespace fmodpp {

struct ChannelCallback {
    static void end(Channel) {}
    static void virtual_voice(Channel, bool /* is_virtual */) {}
    static void sync_point(Channel, int /* point_index */) {}
    static void occlusion(Channel, float& /* direct */, float& /* reverb */) {}
};

struct ChannelGroupCallback {
    static void occlusion(ChannelGroup, float& /* direct */, float& /* reverb */) {}
};

/**
 * @brief Hooks for a registration that may see either kind.
 *
 * A derived class that defines one occlusion overload must re-expose the
 * other with a using-declaration.
 */
struct ChannelControlCallback : ChannelCallback, ChannelGroupCallback {
    using ChannelCallback::occlusion;
    using ChannelGroupCallback::occlusion;
};

namespace detail {

inline int command_int(void* data) noexcept {
    return static_cast<int>(reinterpret_cast<intptr_t>(data));
}

} // namespace detail

/**
 * @brief Trampoline for channel registrations.
 */
template <typename C>
FMOD_RESULT F_CALL channel_callback(FMOD_CHANNELCONTROL* control,
                                    FMOD_CHANNELCONTROL_TYPE control_type,
                                    FMOD_CHANNELCONTROL_CALLBACK_TYPE callback_type,
                                    void* command_data1,
                                    void* command_data2) noexcept {
    auto raw = detail::channel_from(control, control_type);
    if (!raw) {
        return reject_invocation("ChannelCallback", "invoked for a control that is not a channel");
    }
    Channel channel = Channel::from_raw(*raw);

    switch (callback_type) {
        case FMOD_CHANNELCONTROL_CALLBACK_END:
            return invoke_contained("ChannelCallback", [&] { C::end(channel); });

        case FMOD_CHANNELCONTROL_CALLBACK_VIRTUALVOICE: {
            bool is_virtual = detail::command_int(command_data1) != 0;
            return invoke_contained("ChannelCallback", [&] { C::virtual_voice(channel, is_virtual); });
        }

        case FMOD_CHANNELCONTROL_CALLBACK_SYNCPOINT: {
            int point = detail::command_int(command_data1);
            return invoke_contained("ChannelCallback", [&] { C::sync_point(channel, point); });
        }

        case FMOD_CHANNELCONTROL_CALLBACK_OCCLUSION: {
            float* direct = static_cast<float*>(command_data1);
            float* reverb = static_cast<float*>(command_data2);
            if (direct == nullptr || reverb == nullptr) {
                return reject_invocation("ChannelCallback", "occlusion without values");
            }
            return invoke_contained("ChannelCallback", [&] { C::occlusion(channel, *direct, *reverb); });
        }

        default:
            return reject_invocation("ChannelCallback", "unknown notification kind");
    }
}

/**
 * @brief Trampoline for channel group registrations.
 *
 * Groups only receive occlusion; end, virtual-voice and sync-point
 * notifications are channel-only and are rejected.
 */
template <typename C>
FMOD_RESULT F_CALL channel_group_callback(FMOD_CHANNELCONTROL* control,
                                          FMOD_CHANNELCONTROL_TYPE control_type,
                                          FMOD_CHANNELCONTROL_CALLBACK_TYPE callback_type,
                                          void* command_data1,
                                          void* command_data2) noexcept {
    auto raw = detail::channel_group_from(control, control_type);
    if (!raw) {
        return reject_invocation("ChannelGroupCallback", "invoked for a control that is not a group");
    }
    ChannelGroup group = ChannelGroup::from_raw(*raw);

    switch (callback_type) {
        case FMOD_CHANNELCONTROL_CALLBACK_OCCLUSION: {
            float* direct = static_cast<float*>(command_data1);
            float* reverb = static_cast<float*>(command_data2);
            if (direct == nullptr || reverb == nullptr) {
                return reject_invocation("ChannelGroupCallback", "occlusion without values");
            }
            return invoke_contained("ChannelGroupCallback", [&] { C::occlusion(group, *direct, *reverb); });
        }

        case FMOD_CHANNELCONTROL_CALLBACK_END:
        case FMOD_CHANNELCONTROL_CALLBACK_VIRTUALVOICE:
        case FMOD_CHANNELCONTROL_CALLBACK_SYNCPOINT:
            return reject_invocation("ChannelGroupCallback", "channel-only notification delivered to a group");

        default:
            return reject_invocation("ChannelGroupCallback", "unknown notification kind");
    }
}

/**
 * @brief Trampoline for registrations made through ChannelControl; routes on
 * the kind tag.
 */
template <typename C>
FMOD_RESULT F_CALL channel_control_callback(FMOD_CHANNELCONTROL* control,
                                            FMOD_CHANNELCONTROL_TYPE control_type,
                                            FMOD_CHANNELCONTROL_CALLBACK_TYPE callback_type,
                                            void* command_data1,
                                            void* command_data2) noexcept {
    switch (control_type) {
        case FMOD_CHANNELCONTROL_CHANNEL:
            return channel_callback<C>(control, control_type, callback_type, command_data1, command_data2);
        case FMOD_CHANNELCONTROL_CHANNELGROUP:
            return channel_group_callback<C>(control, control_type, callback_type, command_data1, command_data2);
        default:
            return reject_invocation("ChannelControlCallback", "unknown control kind");
    }
}

template <typename C>
Result<> Channel::set_callback() const {
    static_assert(std::is_base_of_v<ChannelCallback, C>, "C must derive from ChannelCallback");
    return check(FMOD_Channel_SetCallback(raw_, &channel_callback<C>));
}

template <typename C>
Result<> ChannelGroup::set_callback() const {
    static_assert(std::is_base_of_v<ChannelGroupCallback, C>, "C must derive from ChannelGroupCallback");
    return check(FMOD_ChannelGroup_SetCallback(raw_, &channel_group_callback<C>));
}

template <typename C>
Result<> ChannelControl::set_callback() const {
    static_assert(std::is_base_of_v<ChannelControlCallback, C>, "C must derive from ChannelControlCallback");
    return check(FMOD_Channel_SetCallback(entry(), &channel_control_callback<C>));
}

} // namespace fmodpp

#endif // FMODPP_CONTROL_CALLBACKS_HPP
