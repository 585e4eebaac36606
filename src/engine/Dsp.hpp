/**
 * @file Dsp.hpp
 * @brief DSP units of the mixing graph.
 */

#ifndef FMODPP_ENGINE_DSP_HPP
#define FMODPP_ENGINE_DSP_HPP

#include "core/Error.hpp"
#include "engine/DspConnection.hpp"

#include <fmod.h>
#include <string>

namespace fmodpp {

struct DspInput;

/**
 * @brief View of a DSP unit.
 *
 * Units from System::create_dsp_by_type() are owned through Handle<Dsp>;
 * units reached by walking the graph are borrowed. Releasing a unit that is
 * still connected fails with FMOD_ERR_DSP_INUSE.
 */
class Dsp {
public:
    using Raw = FMOD_DSP;
    static constexpr const char* TYPE_NAME = "DSP";

    static Dsp from_raw(Raw* raw) noexcept { return Dsp(raw); }
    Raw* as_raw() const noexcept { return raw_; }
    static FMOD_RESULT raw_release(Raw* raw) noexcept { return FMOD_DSP_Release(raw); }

    /**
     * @brief Name reported by the unit's description (at most 31 characters).
     */
    Result<std::string> name() const;
    Result<FMOD_DSP_TYPE> type() const;

    Result<> set_bypass(bool bypass) const;
    Result<bool> bypass() const;

    Result<int> num_inputs() const;
    Result<DspInput> input(int index) const;

    /**
     * @brief Connect another unit as an input of this one.
     * @return The new connection, borrowed from the graph.
     */
    Result<DspConnection> add_input(Dsp input, FMOD_DSPCONNECTION_TYPE type = FMOD_DSPCONNECTION_TYPE_STANDARD) const;

    friend bool operator==(const Dsp& lhs, const Dsp& rhs) noexcept {
        return lhs.raw_ == rhs.raw_;
    }

private:
    explicit Dsp(Raw* raw) noexcept : raw_(raw) {}

    Raw* raw_;
};

struct DspInput {
    Dsp dsp;
    DspConnection connection;
};

} // namespace fmodpp

#endif // FMODPP_ENGINE_DSP_HPP
