/**
 * @file Channel.hpp
 * @brief A playing instance of a sound.
 */

#ifndef FMODPP_CONTROL_CHANNEL_HPP
#define FMODPP_CONTROL_CHANNEL_HPP

#include "control/ChannelControl.hpp"

#include <optional>

namespace fmodpp {

class ChannelGroup;
class Sound;

/**
 * @brief View of a channel.
 *
 * Channels are owned and recycled by the engine, so there is no
 * Handle<Channel>; once a channel ends or is stolen its operations return
 * FMOD_ERR_INVALID_HANDLE or FMOD_ERR_CHANNEL_STOLEN.
 */
class Channel : public ChannelControl {
public:
    using Raw = FMOD_CHANNEL;
    static constexpr const char* TYPE_NAME = "Channel";

    static Channel from_raw(Raw* raw) noexcept { return Channel(raw); }
    Raw* as_raw() const noexcept { return raw_; }

    /**
     * @brief Register ChannelCallback-derived hooks through the channel entry
     * point. Defined in control/Callbacks.hpp.
     */
    template <typename C>
    Result<> set_callback() const;
    Result<> clear_callback() const;

    Result<> set_position(unsigned int position, FMOD_TIMEUNIT unit = FMOD_TIMEUNIT_MS) const;
    Result<unsigned int> position(FMOD_TIMEUNIT unit = FMOD_TIMEUNIT_MS) const;

    /**
     * @brief Sound being played, empty when the channel plays a DSP.
     */
    Result<std::optional<Sound>> current_sound() const;
    Result<bool> is_virtual() const;

    Result<> set_channel_group(ChannelGroup group) const;
    Result<ChannelGroup> channel_group() const;

private:
    explicit Channel(Raw* raw) noexcept : ChannelControl(detail::control_from(raw)), raw_(raw) {}

    Raw* raw_;
};

} // namespace fmodpp

#endif // FMODPP_CONTROL_CHANNEL_HPP
