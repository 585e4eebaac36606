#include "engine/System.hpp"
#include "core/Buffer.hpp"
#include "core/Logger.hpp"
#include "engine/Debug.hpp"

#include <mutex>

namespace fmodpp {

namespace {

int live_systems = 0; // guarded by system_lifecycle_mutex()

} // namespace

namespace detail {

std::shared_mutex& system_lifecycle_mutex() {
    static std::shared_mutex mutex;
    return mutex;
}

int live_system_count() {
    std::shared_lock lock(system_lifecycle_mutex());
    return live_systems;
}

} // namespace detail

FMOD_RESULT System::raw_release(Raw* raw) noexcept {
    std::unique_lock lock(detail::system_lifecycle_mutex());
    FMOD_RESULT result = FMOD_System_Release(raw);
    if (result == FMOD_OK && live_systems > 0) {
        --live_systems;
    }
    return result;
}

Result<Handle<System>> System::create() {
    return create_guarded(true);
}

Result<Handle<System>> System::create_unchecked() {
    return create_guarded(false);
}

Result<Handle<System>> System::create_guarded(bool exclusive) {
    FMOD_SYSTEM* raw = nullptr;
    {
        std::unique_lock lock(detail::system_lifecycle_mutex());
        if (exclusive && live_systems != 0) {
            Logger::instance().log_message("System", "create refused: a system is already alive");
            return std::unexpected(Error(FMOD_ERR_INITIALIZED));
        }
        FMOD_RESULT result = FMOD_System_Create(&raw, FMOD_VERSION);
        if (result != FMOD_OK) {
            return std::unexpected(Error(result));
        }
        ++live_systems;
    }

    // From here the handle owns the system; any early return releases it.
    Handle<System> system = Handle<System>::acquire(raw);

    auto runtime = system->version();
    if (!runtime) {
        return std::unexpected(runtime.error());
    }
    if (!runtime->is_compatible_with(HEADER_VERSION)) {
        Logger::instance().log_messagef("System", "runtime %s is not compatible with headers %s",
                                        runtime->to_string().c_str(), HEADER_VERSION.to_string().c_str());
        return std::unexpected(Error(FMOD_ERR_HEADER_MISMATCH));
    }
    return Result<Handle<System>>(std::move(system));
}

Result<> System::init(int max_channels, FMOD_INITFLAGS flags, void* extra_driver_data) const {
    return check(FMOD_System_Init(raw_, max_channels, flags, extra_driver_data));
}

Result<> System::configure(const SystemConfig& config) const {
    if (config.debug_flags) {
        auto debug = initialize_debug_log(*config.debug_flags);
        if (!debug && debug.error().kind() != ErrorKind::Unavailable) {
            return debug;
        }
        if (!debug) {
            Logger::instance().log_message("System", "engine debug output needs the logging library build");
        }
    }
    if (config.output_type) {
        if (auto result = set_output(static_cast<FMOD_OUTPUTTYPE>(*config.output_type)); !result) {
            return result;
        }
    }
    if (config.software_channels) {
        if (auto result = set_software_channels(*config.software_channels); !result) {
            return result;
        }
    }
    if (config.sample_rate || config.speaker_mode || config.raw_speakers) {
        auto result = set_software_format(config.sample_rate.value_or(48000),
                                          static_cast<FMOD_SPEAKERMODE>(config.speaker_mode.value_or(FMOD_SPEAKERMODE_DEFAULT)),
                                          config.raw_speakers.value_or(0));
        if (!result) {
            return result;
        }
    }
    if (config.dsp_buffer_length || config.dsp_buffer_count) {
        auto result = set_dsp_buffer_size(config.dsp_buffer_length.value_or(1024), config.dsp_buffer_count.value_or(4));
        if (!result) {
            return result;
        }
    }
    return init(config.max_channels, config.init_flags);
}

Result<> System::close() const {
    return check(FMOD_System_Close(raw_));
}

Result<> System::update() const {
    return check(FMOD_System_Update(raw_));
}

Result<> System::clear_callback() const {
    return check(FMOD_System_SetCallback(raw_, nullptr, 0));
}

Result<Version> System::version() const {
    unsigned int version = 0;
    FMOD_RESULT result = FMOD_System_GetVersion(raw_, &version);
    return check(result, Version::from_raw(version));
}

Result<> System::set_output(FMOD_OUTPUTTYPE output) const {
    return check(FMOD_System_SetOutput(raw_, output));
}

Result<int> System::num_drivers() const {
    int count = 0;
    FMOD_RESULT result = FMOD_System_GetNumDrivers(raw_, &count);
    return check(result, count);
}

Result<std::string> System::driver_name(int id) const {
    Raw* system = raw_;
    return query_string(with_doubled_size_hint([system, id](char* buffer, int capacity) {
        return FMOD_System_GetDriverInfo(system, id, buffer, capacity, nullptr, nullptr, nullptr, nullptr);
    }));
}

Result<> System::set_software_channels(int count) const {
    return check(FMOD_System_SetSoftwareChannels(raw_, count));
}

Result<> System::set_software_format(int sample_rate, FMOD_SPEAKERMODE speaker_mode, int raw_speakers) const {
    return check(FMOD_System_SetSoftwareFormat(raw_, sample_rate, speaker_mode, raw_speakers));
}

Result<> System::set_dsp_buffer_size(unsigned int length, int count) const {
    return check(FMOD_System_SetDSPBufferSize(raw_, length, count));
}

Result<Handle<Sound>> System::create_sound(const std::string& name_or_path, FMOD_MODE mode,
                                           FMOD_CREATESOUNDEXINFO* info) const {
    FMOD_SOUND* sound = nullptr;
    FMOD_RESULT result = FMOD_System_CreateSound(raw_, name_or_path.c_str(), mode, info, &sound);
    return adopt<Sound>(result, sound);
}

Result<Handle<Sound>> System::create_stream(const std::string& name_or_path, FMOD_MODE mode,
                                            FMOD_CREATESOUNDEXINFO* info) const {
    FMOD_SOUND* sound = nullptr;
    FMOD_RESULT result = FMOD_System_CreateStream(raw_, name_or_path.c_str(), mode, info, &sound);
    return adopt<Sound>(result, sound);
}

Result<Handle<Dsp>> System::create_dsp_by_type(FMOD_DSP_TYPE type) const {
    FMOD_DSP* dsp = nullptr;
    FMOD_RESULT result = FMOD_System_CreateDSPByType(raw_, type, &dsp);
    return adopt<Dsp>(result, dsp);
}

Result<Handle<ChannelGroup>> System::create_channel_group(const std::string& name) const {
    FMOD_CHANNELGROUP* group = nullptr;
    FMOD_RESULT result = FMOD_System_CreateChannelGroup(raw_, name.c_str(), &group);
    return adopt<ChannelGroup>(result, group);
}

Result<Handle<Geometry>> System::create_geometry(int max_polygons, int max_vertices) const {
    FMOD_GEOMETRY* geometry = nullptr;
    FMOD_RESULT result = FMOD_System_CreateGeometry(raw_, max_polygons, max_vertices, &geometry);
    return adopt<Geometry>(result, geometry);
}

Result<Handle<Geometry>> System::load_geometry(std::span<const uint8_t> data) const {
    if (data.empty()) {
        return std::unexpected(Error(FMOD_ERR_INVALID_PARAM));
    }
    FMOD_GEOMETRY* geometry = nullptr;
    FMOD_RESULT result = FMOD_System_LoadGeometry(raw_, data.data(), static_cast<int>(data.size()), &geometry);
    return adopt<Geometry>(result, geometry);
}

Result<ChannelGroup> System::master_channel_group() const {
    FMOD_CHANNELGROUP* group = nullptr;
    FMOD_RESULT result = FMOD_System_GetMasterChannelGroup(raw_, &group);
    if (result != FMOD_OK) {
        return std::unexpected(Error(result));
    }
    return borrow<ChannelGroup>(group);
}

Result<Channel> System::play_sound(Sound sound, std::optional<ChannelGroup> group, bool paused) const {
    FMOD_CHANNELGROUP* raw_group = group ? group->as_raw() : nullptr;
    FMOD_CHANNEL* channel = nullptr;
    FMOD_RESULT result = FMOD_System_PlaySound(raw_, sound.as_raw(), raw_group, paused ? 1 : 0, &channel);
    if (result != FMOD_OK) {
        return std::unexpected(Error(result));
    }
    return borrow<Channel>(channel);
}

Result<Occlusion> System::geometry_occlusion(const Vector& listener, const Vector& source) const {
    Occlusion occlusion;
    FMOD_RESULT result = FMOD_System_GetGeometryOcclusion(raw_, &listener, &source,
                                                          &occlusion.direct, &occlusion.reverb);
    return check(result, occlusion);
}

} // namespace fmodpp
