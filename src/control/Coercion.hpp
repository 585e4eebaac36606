/**
 * @file Coercion.hpp
 * @brief The only place pointers move between the channel-control kinds.
 *
 * FMOD implements Channel and ChannelGroup on top of one ChannelControl
 * object: an FMOD_CHANNEL* or FMOD_CHANNELGROUP* and the FMOD_CHANNELCONTROL*
 * of the same object share one address, and every FMOD_Channel_X function
 * that has an FMOD_ChannelGroup_X twin reaches the same implementation.
 * Everything below relies on that layout and nothing outside this file does.
 */

#ifndef FMODPP_CONTROL_COERCION_HPP
#define FMODPP_CONTROL_COERCION_HPP

#include "core/Error.hpp"

#include <fmod_common.h>

namespace fmodpp::detail {

/**
 * @brief Upcast a channel to its shared control surface.
 */
inline FMOD_CHANNELCONTROL* control_from(FMOD_CHANNEL* channel) noexcept {
    return reinterpret_cast<FMOD_CHANNELCONTROL*>(channel);
}

/**
 * @brief Upcast a channel group to its shared control surface.
 */
inline FMOD_CHANNELCONTROL* control_from(FMOD_CHANNELGROUP* group) noexcept {
    return reinterpret_cast<FMOD_CHANNELCONTROL*>(group);
}

/**
 * @brief Entry pointer for a shared operation.
 *
 * The C API has no FMOD_ChannelControl_X functions; shared operations are
 * issued through the FMOD_Channel_X entry points for either kind.
 */
inline FMOD_CHANNEL* shared_entry(FMOD_CHANNELCONTROL* control) noexcept {
    return reinterpret_cast<FMOD_CHANNEL*>(control);
}

/**
 * @brief Downcast guarded by the tag the engine supplied with the pointer.
 * @return FMOD_ERR_INVALID_PARAM when the tag names another kind.
 */
inline Result<FMOD_CHANNEL*> channel_from(FMOD_CHANNELCONTROL* control, FMOD_CHANNELCONTROL_TYPE type) {
    if (type != FMOD_CHANNELCONTROL_CHANNEL) {
        return std::unexpected(Error(FMOD_ERR_INVALID_PARAM));
    }
    return reinterpret_cast<FMOD_CHANNEL*>(control);
}

inline Result<FMOD_CHANNELGROUP*> channel_group_from(FMOD_CHANNELCONTROL* control, FMOD_CHANNELCONTROL_TYPE type) {
    if (type != FMOD_CHANNELCONTROL_CHANNELGROUP) {
        return std::unexpected(Error(FMOD_ERR_INVALID_PARAM));
    }
    return reinterpret_cast<FMOD_CHANNELGROUP*>(control);
}

} // namespace fmodpp::detail

#endif // FMODPP_CONTROL_COERCION_HPP
