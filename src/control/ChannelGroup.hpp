/**
 * @file ChannelGroup.hpp
 * @brief Submix bus grouping channels and other groups.
 */

#ifndef FMODPP_CONTROL_CHANNEL_GROUP_HPP
#define FMODPP_CONTROL_CHANNEL_GROUP_HPP

#include "control/ChannelControl.hpp"
#include "engine/DspConnection.hpp"

#include <optional>
#include <string>

namespace fmodpp {

class Channel;

/**
 * @brief View of a channel group.
 *
 * Groups from System::create_channel_group() are owned through
 * Handle<ChannelGroup>. The master group is owned by the System and is only
 * ever borrowed.
 */
class ChannelGroup : public ChannelControl {
public:
    using Raw = FMOD_CHANNELGROUP;
    static constexpr const char* TYPE_NAME = "ChannelGroup";

    static ChannelGroup from_raw(Raw* raw) noexcept { return ChannelGroup(raw); }
    Raw* as_raw() const noexcept { return raw_; }
    static FMOD_RESULT raw_release(Raw* raw) noexcept { return FMOD_ChannelGroup_Release(raw); }

    /// Names longer than MAX_HINTED_STRING_LENGTH fail with FMOD_ERR_TRUNCATED.
    Result<std::string> name() const;

    /**
     * @brief Register ChannelGroupCallback-derived hooks through the group
     * entry point. Defined in control/Callbacks.hpp.
     */
    template <typename C>
    Result<> set_callback() const;
    Result<> clear_callback() const;

    /**
     * @brief Route a group into this one.
     * @return The connection between the two groups' heads, borrowed.
     */
    Result<DspConnection> add_group(ChannelGroup child, bool propagate_dsp_clock = true) const;
    Result<int> num_groups() const;
    Result<ChannelGroup> group(int index) const;

    /**
     * @brief Parent group, empty for the master group.
     */
    Result<std::optional<ChannelGroup>> parent_group() const;

    Result<int> num_channels() const;
    Result<Channel> channel(int index) const;

private:
    explicit ChannelGroup(Raw* raw) noexcept : ChannelControl(detail::control_from(raw)), raw_(raw) {}

    Raw* raw_;
};

} // namespace fmodpp

#endif // FMODPP_CONTROL_CHANNEL_GROUP_HPP
