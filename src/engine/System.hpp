/**
 * @file System.hpp
 * @brief Engine instance: lifecycle, object factories and global queries.
 */

#ifndef FMODPP_ENGINE_SYSTEM_HPP
#define FMODPP_ENGINE_SYSTEM_HPP

#include "control/Channel.hpp"
#include "control/ChannelGroup.hpp"
#include "core/Config.hpp"
#include "core/Error.hpp"
#include "core/Handle.hpp"
#include "core/Types.hpp"
#include "core/Version.hpp"
#include "engine/Dsp.hpp"
#include "engine/Geometry.hpp"
#include "engine/Sound.hpp"

#include <fmod.h>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>

namespace fmodpp {

/**
 * @brief View of an engine instance. Owned through Handle<System>.
 *
 * Creating and releasing a system is not thread-safe with respect to the rest
 * of the API. System::create() therefore allows a single live system per
 * process; create_unchecked() lifts the limit for callers that coordinate
 * several systems themselves. Releasing a system invalidates every object it
 * created.
 */
class System {
public:
    using Raw = FMOD_SYSTEM;
    static constexpr const char* TYPE_NAME = "System";

    static System from_raw(Raw* raw) noexcept { return System(raw); }
    Raw* as_raw() const noexcept { return raw_; }
    /**
     * @brief Release and drop the system from the live count.
     *
     * Takes the lifecycle mutex exclusively. No code path holds that mutex
     * while releasing a handle, so the lock cannot report a deadlock.
     */
    static FMOD_RESULT raw_release(Raw* raw) noexcept;

    /**
     * @brief Create the process's system.
     * @return FMOD_ERR_INITIALIZED if a system created here is still alive,
     *         FMOD_ERR_HEADER_MISMATCH if the runtime library is not
     *         compatible with HEADER_VERSION, or the native creation error.
     */
    static Result<Handle<System>> create();

    /**
     * @brief Create a system without the single-instance check.
     */
    static Result<Handle<System>> create_unchecked();

    Result<> init(int max_channels, FMOD_INITFLAGS flags = FMOD_INIT_NORMAL, void* extra_driver_data = nullptr) const;

    /**
     * @brief Apply pre-init settings from a config, then init.
     */
    Result<> configure(const SystemConfig& config) const;

    /**
     * @brief Close the output, keeping the object for a later init().
     * Every channel and sound from this system becomes invalid.
     */
    Result<> close() const;
    Result<> update() const;

    /**
     * @brief Deliver the notification kinds in mask to the hooks of C.
     *
     * Defined in engine/SystemCallbacks.hpp. A later registration replaces
     * this one.
     */
    template <typename C>
    Result<> set_callback(FMOD_SYSTEM_CALLBACK_TYPE mask) const;
    Result<> clear_callback() const;

    /**
     * @brief Version of the linked runtime library.
     */
    Result<Version> version() const;

    // Output
    Result<> set_output(FMOD_OUTPUTTYPE output) const;
    Result<int> num_drivers() const;
    /// Names longer than MAX_HINTED_STRING_LENGTH fail with FMOD_ERR_TRUNCATED.
    Result<std::string> driver_name(int id) const;
    Result<> set_software_channels(int count) const;
    Result<> set_software_format(int sample_rate, FMOD_SPEAKERMODE speaker_mode, int raw_speakers = 0) const;
    Result<> set_dsp_buffer_size(unsigned int length, int count) const;

    // Factories
    Result<Handle<Sound>> create_sound(const std::string& name_or_path, FMOD_MODE mode = FMOD_DEFAULT,
                                       FMOD_CREATESOUNDEXINFO* info = nullptr) const;
    Result<Handle<Sound>> create_stream(const std::string& name_or_path, FMOD_MODE mode = FMOD_DEFAULT,
                                        FMOD_CREATESOUNDEXINFO* info = nullptr) const;
    Result<Handle<Dsp>> create_dsp_by_type(FMOD_DSP_TYPE type) const;
    Result<Handle<ChannelGroup>> create_channel_group(const std::string& name) const;
    Result<Handle<Geometry>> create_geometry(int max_polygons, int max_vertices) const;

    /**
     * @brief Recreate geometry from a blob produced by Geometry::save().
     */
    Result<Handle<Geometry>> load_geometry(std::span<const uint8_t> data) const;

    /**
     * @brief The system's master group; owned by the system, never released.
     */
    Result<ChannelGroup> master_channel_group() const;

    /**
     * @brief Start a sound on a new channel.
     * @param group Destination group, the master group when empty.
     */
    Result<Channel> play_sound(Sound sound, std::optional<ChannelGroup> group = std::nullopt,
                               bool paused = false) const;

    Result<Occlusion> geometry_occlusion(const Vector& listener, const Vector& source) const;

    friend bool operator==(const System& lhs, const System& rhs) noexcept {
        return lhs.raw_ == rhs.raw_;
    }

private:
    explicit System(Raw* raw) noexcept : raw_(raw) {}

    static Result<Handle<System>> create_guarded(bool exclusive);

    Raw* raw_;
};

namespace detail {

/**
 * @brief Serialises system creation and release (exclusive side) against
 * process-wide native calls such as debug initialisation (shared side).
 */
std::shared_mutex& system_lifecycle_mutex();

/**
 * @brief Systems created through System::create*() and not yet released.
 */
int live_system_count();

} // namespace detail

} // namespace fmodpp

#endif // FMODPP_ENGINE_SYSTEM_HPP
