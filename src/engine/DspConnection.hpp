/**
 * @file DspConnection.hpp
 * @brief Edge between two DSP units in the mixing graph.
 */

#ifndef FMODPP_ENGINE_DSP_CONNECTION_HPP
#define FMODPP_ENGINE_DSP_CONNECTION_HPP

#include "core/Error.hpp"
#include "core/MixMatrix.hpp"

#include <fmod.h>

namespace fmodpp {

class Dsp;

/**
 * @brief Non-owning view of a connection. Connections belong to the graph
 * and go away when either end is disconnected or released.
 */
class DspConnection {
public:
    using Raw = FMOD_DSPCONNECTION;
    static constexpr const char* TYPE_NAME = "DSPConnection";

    static DspConnection from_raw(Raw* raw) noexcept { return DspConnection(raw); }
    Raw* as_raw() const noexcept { return raw_; }

    Result<> set_mix(float volume) const;
    Result<float> mix() const;

    Result<> set_mix_matrix(const MixMatrixView& matrix) const;
    Result<MixMatrix> mix_matrix() const;

    Result<Dsp> input() const;
    Result<Dsp> output() const;
    Result<FMOD_DSPCONNECTION_TYPE> type() const;

    friend bool operator==(const DspConnection& lhs, const DspConnection& rhs) noexcept {
        return lhs.raw_ == rhs.raw_;
    }

private:
    explicit DspConnection(Raw* raw) noexcept : raw_(raw) {}

    Raw* raw_;
};

} // namespace fmodpp

#endif // FMODPP_ENGINE_DSP_CONNECTION_HPP
