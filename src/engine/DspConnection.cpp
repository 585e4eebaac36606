#include "engine/DspConnection.hpp"
#include "core/Handle.hpp"
#include "engine/Dsp.hpp"

namespace fmodpp {

Result<> DspConnection::set_mix(float volume) const {
    return check(FMOD_DSPConnection_SetMix(raw_, volume));
}

Result<float> DspConnection::mix() const {
    float volume = 0.0f;
    FMOD_RESULT result = FMOD_DSPConnection_GetMix(raw_, &volume);
    return check(result, volume);
}

Result<> DspConnection::set_mix_matrix(const MixMatrixView& matrix) const {
    if (auto valid = matrix.validate(); !valid) {
        return valid;
    }
    return check(FMOD_DSPConnection_SetMixMatrix(raw_, matrix.native_data(), matrix.out_channels,
                                                 matrix.in_channels, matrix.in_channel_hop));
}

Result<MixMatrix> DspConnection::mix_matrix() const {
    Raw* connection = raw_;
    return read_mix_matrix([connection](float* matrix, int* out_channels, int* in_channels, int hop) {
        return FMOD_DSPConnection_GetMixMatrix(connection, matrix, out_channels, in_channels, hop);
    });
}

Result<Dsp> DspConnection::input() const {
    FMOD_DSP* dsp = nullptr;
    FMOD_RESULT result = FMOD_DSPConnection_GetInput(raw_, &dsp);
    if (result != FMOD_OK) {
        return std::unexpected(Error(result));
    }
    return borrow<Dsp>(dsp);
}

Result<Dsp> DspConnection::output() const {
    FMOD_DSP* dsp = nullptr;
    FMOD_RESULT result = FMOD_DSPConnection_GetOutput(raw_, &dsp);
    if (result != FMOD_OK) {
        return std::unexpected(Error(result));
    }
    return borrow<Dsp>(dsp);
}

Result<FMOD_DSPCONNECTION_TYPE> DspConnection::type() const {
    FMOD_DSPCONNECTION_TYPE type = FMOD_DSPCONNECTION_TYPE_STANDARD;
    FMOD_RESULT result = FMOD_DSPConnection_GetType(raw_, &type);
    return check(result, type);
}

} // namespace fmodpp
