#include "control/ChannelGroup.hpp"
#include "control/Channel.hpp"
#include "core/Buffer.hpp"
#include "core/Handle.hpp"

namespace fmodpp {

Result<std::string> ChannelGroup::name() const {
    Raw* group = raw_;
    return query_string(with_doubled_size_hint([group](char* buffer, int capacity) {
        return FMOD_ChannelGroup_GetName(group, buffer, capacity);
    }));
}

Result<> ChannelGroup::clear_callback() const {
    return check(FMOD_ChannelGroup_SetCallback(raw_, nullptr));
}

Result<DspConnection> ChannelGroup::add_group(ChannelGroup child, bool propagate_dsp_clock) const {
    FMOD_DSPCONNECTION* connection = nullptr;
    FMOD_RESULT result = FMOD_ChannelGroup_AddGroup(raw_, child.as_raw(), propagate_dsp_clock ? 1 : 0, &connection);
    if (result != FMOD_OK) {
        return std::unexpected(Error(result));
    }
    return borrow<DspConnection>(connection);
}

Result<int> ChannelGroup::num_groups() const {
    int count = 0;
    FMOD_RESULT result = FMOD_ChannelGroup_GetNumGroups(raw_, &count);
    return check(result, count);
}

Result<ChannelGroup> ChannelGroup::group(int index) const {
    FMOD_CHANNELGROUP* group = nullptr;
    FMOD_RESULT result = FMOD_ChannelGroup_GetGroup(raw_, index, &group);
    if (result != FMOD_OK) {
        return std::unexpected(Error(result));
    }
    return borrow<ChannelGroup>(group);
}

Result<std::optional<ChannelGroup>> ChannelGroup::parent_group() const {
    FMOD_CHANNELGROUP* parent = nullptr;
    FMOD_RESULT result = FMOD_ChannelGroup_GetParentGroup(raw_, &parent);
    if (result != FMOD_OK) {
        return std::unexpected(Error(result));
    }
    if (parent == nullptr) {
        return std::optional<ChannelGroup>();
    }
    return std::optional<ChannelGroup>(ChannelGroup::from_raw(parent));
}

Result<int> ChannelGroup::num_channels() const {
    int count = 0;
    FMOD_RESULT result = FMOD_ChannelGroup_GetNumChannels(raw_, &count);
    return check(result, count);
}

Result<Channel> ChannelGroup::channel(int index) const {
    FMOD_CHANNEL* channel = nullptr;
    FMOD_RESULT result = FMOD_ChannelGroup_GetChannel(raw_, index, &channel);
    if (result != FMOD_OK) {
        return std::unexpected(Error(result));
    }
    return borrow<Channel>(channel);
}

} // namespace fmodpp
