#include "engine/Dsp.hpp"
#include "core/Handle.hpp"

namespace fmodpp {

Result<std::string> Dsp::name() const {
    char name[32] = {};
    FMOD_RESULT result = FMOD_DSP_GetInfo(raw_, name, nullptr, nullptr, nullptr, nullptr);
    if (result != FMOD_OK) {
        return std::unexpected(Error(result));
    }
    name[sizeof(name) - 1] = '\0';
    return std::string(name);
}

Result<FMOD_DSP_TYPE> Dsp::type() const {
    FMOD_DSP_TYPE type = FMOD_DSP_TYPE_UNKNOWN;
    FMOD_RESULT result = FMOD_DSP_GetType(raw_, &type);
    return check(result, type);
}

Result<> Dsp::set_bypass(bool bypass) const {
    return check(FMOD_DSP_SetBypass(raw_, bypass ? 1 : 0));
}

Result<bool> Dsp::bypass() const {
    FMOD_BOOL bypass = 0;
    FMOD_RESULT result = FMOD_DSP_GetBypass(raw_, &bypass);
    return check(result, bypass != 0);
}

Result<int> Dsp::num_inputs() const {
    int count = 0;
    FMOD_RESULT result = FMOD_DSP_GetNumInputs(raw_, &count);
    return check(result, count);
}

Result<DspInput> Dsp::input(int index) const {
    FMOD_DSP* input = nullptr;
    FMOD_DSPCONNECTION* connection = nullptr;
    FMOD_RESULT result = FMOD_DSP_GetInput(raw_, index, &input, &connection);
    if (result != FMOD_OK) {
        return std::unexpected(Error(result));
    }
    return DspInput{borrow<Dsp>(input), borrow<DspConnection>(connection)};
}

Result<DspConnection> Dsp::add_input(Dsp input, FMOD_DSPCONNECTION_TYPE type) const {
    FMOD_DSPCONNECTION* connection = nullptr;
    FMOD_RESULT result = FMOD_DSP_AddInput(raw_, input.as_raw(), &connection, type);
    if (result != FMOD_OK) {
        return std::unexpected(Error(result));
    }
    return borrow<DspConnection>(connection);
}

} // namespace fmodpp
