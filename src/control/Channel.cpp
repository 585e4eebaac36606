#include "control/Channel.hpp"
#include "control/ChannelGroup.hpp"
#include "core/Handle.hpp"
#include "engine/Sound.hpp"

namespace fmodpp {

Result<> Channel::clear_callback() const {
    return check(FMOD_Channel_SetCallback(raw_, nullptr));
}

Result<> Channel::set_position(unsigned int position, FMOD_TIMEUNIT unit) const {
    return check(FMOD_Channel_SetPosition(raw_, position, unit));
}

Result<unsigned int> Channel::position(FMOD_TIMEUNIT unit) const {
    unsigned int position = 0;
    FMOD_RESULT result = FMOD_Channel_GetPosition(raw_, &position, unit);
    return check(result, position);
}

Result<std::optional<Sound>> Channel::current_sound() const {
    FMOD_SOUND* sound = nullptr;
    FMOD_RESULT result = FMOD_Channel_GetCurrentSound(raw_, &sound);
    if (result != FMOD_OK) {
        return std::unexpected(Error(result));
    }
    if (sound == nullptr) {
        return std::optional<Sound>();
    }
    return std::optional<Sound>(Sound::from_raw(sound));
}

Result<bool> Channel::is_virtual() const {
    FMOD_BOOL is_virtual = 0;
    FMOD_RESULT result = FMOD_Channel_IsVirtual(raw_, &is_virtual);
    return check(result, is_virtual != 0);
}

Result<> Channel::set_channel_group(ChannelGroup group) const {
    return check(FMOD_Channel_SetChannelGroup(raw_, group.as_raw()));
}

Result<ChannelGroup> Channel::channel_group() const {
    FMOD_CHANNELGROUP* group = nullptr;
    FMOD_RESULT result = FMOD_Channel_GetChannelGroup(raw_, &group);
    if (result != FMOD_OK) {
        return std::unexpected(Error(result));
    }
    return borrow<ChannelGroup>(group);
}

} // namespace fmodpp
