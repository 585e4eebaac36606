#include "control/ChannelControl.hpp"
#include "core/Handle.hpp"
#include "engine/System.hpp"

namespace fmodpp {

Result<> ChannelControl::stop() const {
    return check(FMOD_Channel_Stop(entry()));
}

Result<> ChannelControl::set_paused(bool paused) const {
    return check(FMOD_Channel_SetPaused(entry(), paused ? 1 : 0));
}

Result<bool> ChannelControl::paused() const {
    FMOD_BOOL paused = 0;
    FMOD_RESULT result = FMOD_Channel_GetPaused(entry(), &paused);
    return check(result, paused != 0);
}

Result<> ChannelControl::set_volume(float volume) const {
    return check(FMOD_Channel_SetVolume(entry(), volume));
}

Result<float> ChannelControl::volume() const {
    float volume = 0.0f;
    FMOD_RESULT result = FMOD_Channel_GetVolume(entry(), &volume);
    return check(result, volume);
}

Result<> ChannelControl::set_mute(bool mute) const {
    return check(FMOD_Channel_SetMute(entry(), mute ? 1 : 0));
}

Result<bool> ChannelControl::mute() const {
    FMOD_BOOL mute = 0;
    FMOD_RESULT result = FMOD_Channel_GetMute(entry(), &mute);
    return check(result, mute != 0);
}

Result<> ChannelControl::set_pitch(float pitch) const {
    return check(FMOD_Channel_SetPitch(entry(), pitch));
}

Result<float> ChannelControl::pitch() const {
    float pitch = 0.0f;
    FMOD_RESULT result = FMOD_Channel_GetPitch(entry(), &pitch);
    return check(result, pitch);
}

Result<bool> ChannelControl::is_playing() const {
    FMOD_BOOL playing = 0;
    FMOD_RESULT result = FMOD_Channel_IsPlaying(entry(), &playing);
    return check(result, playing != 0);
}

Result<float> ChannelControl::audibility() const {
    float audibility = 0.0f;
    FMOD_RESULT result = FMOD_Channel_GetAudibility(entry(), &audibility);
    return check(result, audibility);
}

Result<> ChannelControl::set_3d_occlusion(Occlusion occlusion) const {
    return check(FMOD_Channel_Set3DOcclusion(entry(), occlusion.direct, occlusion.reverb));
}

Result<Occlusion> ChannelControl::occlusion_3d() const {
    Occlusion occlusion;
    FMOD_RESULT result = FMOD_Channel_Get3DOcclusion(entry(), &occlusion.direct, &occlusion.reverb);
    return check(result, occlusion);
}

Result<> ChannelControl::add_dsp(int index, Dsp dsp) const {
    return check(FMOD_Channel_AddDSP(entry(), index, dsp.as_raw()));
}

Result<> ChannelControl::remove_dsp(Dsp dsp) const {
    return check(FMOD_Channel_RemoveDSP(entry(), dsp.as_raw()));
}

Result<int> ChannelControl::num_dsps() const {
    int count = 0;
    FMOD_RESULT result = FMOD_Channel_GetNumDSPs(entry(), &count);
    return check(result, count);
}

Result<Dsp> ChannelControl::dsp(int index) const {
    FMOD_DSP* dsp = nullptr;
    FMOD_RESULT result = FMOD_Channel_GetDSP(entry(), index, &dsp);
    if (result != FMOD_OK) {
        return std::unexpected(Error(result));
    }
    return borrow<Dsp>(dsp);
}

Result<DspClock> ChannelControl::dsp_clock() const {
    DspClock clock;
    FMOD_RESULT result = FMOD_Channel_GetDSPClock(entry(), &clock.clock, &clock.parent_clock);
    return check(result, clock);
}

Result<> ChannelControl::set_mix_matrix(const MixMatrixView& matrix) const {
    if (auto valid = matrix.validate(); !valid) {
        return valid;
    }
    return check(FMOD_Channel_SetMixMatrix(entry(), matrix.native_data(), matrix.out_channels,
                                           matrix.in_channels, matrix.in_channel_hop));
}

Result<MixMatrix> ChannelControl::mix_matrix() const {
    FMOD_CHANNEL* channel = entry();
    return read_mix_matrix([channel](float* matrix, int* out_channels, int* in_channels, int hop) {
        return FMOD_Channel_GetMixMatrix(channel, matrix, out_channels, in_channels, hop);
    });
}

Result<System> ChannelControl::system_object() const {
    FMOD_SYSTEM* system = nullptr;
    FMOD_RESULT result = FMOD_Channel_GetSystemObject(entry(), &system);
    if (result != FMOD_OK) {
        return std::unexpected(Error(result));
    }
    return borrow<System>(system);
}

Result<> ChannelControl::clear_callback() const {
    return check(FMOD_Channel_SetCallback(entry(), nullptr));
}

} // namespace fmodpp
