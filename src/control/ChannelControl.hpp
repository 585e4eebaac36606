/**
 * @file ChannelControl.hpp
 * @brief Operations shared by channels and channel groups.
 */

#ifndef FMODPP_CONTROL_CHANNEL_CONTROL_HPP
#define FMODPP_CONTROL_CHANNEL_CONTROL_HPP

#include "control/Coercion.hpp"
#include "core/Error.hpp"
#include "core/MixMatrix.hpp"
#include "core/Types.hpp"
#include "engine/Dsp.hpp"

#include <fmod.h>

namespace fmodpp {

class System;

/**
 * @brief Non-owning view of the surface common to Channel and ChannelGroup.
 *
 * A ChannelControl never releases anything; group ownership lives in
 * Handle<ChannelGroup> and channels are owned by the engine.
 */
class ChannelControl {
public:
    using Raw = FMOD_CHANNELCONTROL;
    static constexpr const char* TYPE_NAME = "ChannelControl";

    static ChannelControl from_raw(Raw* raw) noexcept { return ChannelControl(raw); }
    Raw* as_control_raw() const noexcept { return control_; }

    Result<> stop() const;

    Result<> set_paused(bool paused) const;
    Result<bool> paused() const;

    Result<> set_volume(float volume) const;
    Result<float> volume() const;

    Result<> set_mute(bool mute) const;
    Result<bool> mute() const;

    Result<> set_pitch(float pitch) const;
    Result<float> pitch() const;

    Result<bool> is_playing() const;
    Result<float> audibility() const;

    Result<> set_3d_occlusion(Occlusion occlusion) const;
    Result<Occlusion> occlusion_3d() const;

    // DSP chain
    Result<> add_dsp(int index, Dsp dsp) const;
    Result<> remove_dsp(Dsp dsp) const;
    Result<int> num_dsps() const;
    Result<Dsp> dsp(int index) const;
    Result<DspClock> dsp_clock() const;

    /**
     * @brief Set the output-by-input mix matrix. Validated before the call.
     */
    Result<> set_mix_matrix(const MixMatrixView& matrix) const;
    Result<MixMatrix> mix_matrix() const;

    Result<System> system_object() const;

    /**
     * @brief Register C's hooks for whichever kind this control is.
     *
     * The trampoline checks the kind tag on every invocation. Defined in
     * control/Callbacks.hpp.
     */
    template <typename C>
    Result<> set_callback() const;
    Result<> clear_callback() const;

    friend bool operator==(const ChannelControl& lhs, const ChannelControl& rhs) noexcept {
        return lhs.control_ == rhs.control_;
    }

protected:
    explicit ChannelControl(Raw* control) noexcept : control_(control) {}

    FMOD_CHANNEL* entry() const noexcept { return detail::shared_entry(control_); }

private:
    Raw* control_;
};

} // namespace fmodpp

#endif // FMODPP_CONTROL_CHANNEL_CONTROL_HPP
