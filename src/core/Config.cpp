#include "core/Config.hpp"

#include <fstream>
#include <iostream>
#include <iterator>

namespace fmodpp {

namespace {

template <typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

template <typename T>
void get_optional(const json& j, const char* key, std::optional<T>& value) {
    if (j.contains(key) && !j.at(key).is_null()) {
        value = j.at(key).get<T>();
    } else {
        value.reset();
    }
}

bool in_range(const SystemConfig& config) {
    if (config.max_channels < 0 || config.max_channels > 4095) return false;
    if (config.software_channels && *config.software_channels < 0) return false;
    if (config.sample_rate && *config.sample_rate <= 0) return false;
    if (config.raw_speakers && *config.raw_speakers < 0) return false;
    if (config.dsp_buffer_count && *config.dsp_buffer_count < 0) return false;
    if (config.speaker_mode && (*config.speaker_mode < 0 || *config.speaker_mode >= FMOD_SPEAKERMODE_MAX)) return false;
    if (config.output_type && (*config.output_type < 0 || *config.output_type >= FMOD_OUTPUTTYPE_MAX)) return false;
    return true;
}

} // namespace

void to_json(json& j, const SystemConfig& config) {
    j = json{
        {"version", config.version},
        {"max_channels", config.max_channels},
        {"init_flags", config.init_flags}
    };
    put_optional(j, "software_channels", config.software_channels);
    put_optional(j, "sample_rate", config.sample_rate);
    put_optional(j, "speaker_mode", config.speaker_mode);
    put_optional(j, "raw_speakers", config.raw_speakers);
    put_optional(j, "dsp_buffer_length", config.dsp_buffer_length);
    put_optional(j, "dsp_buffer_count", config.dsp_buffer_count);
    put_optional(j, "output_type", config.output_type);
    put_optional(j, "debug_flags", config.debug_flags);
}

void from_json(const json& j, SystemConfig& config) {
    SystemConfig defaults;
    config.version = j.value("version", defaults.version);
    config.max_channels = j.value("max_channels", defaults.max_channels);
    config.init_flags = j.value("init_flags", defaults.init_flags);
    get_optional(j, "software_channels", config.software_channels);
    get_optional(j, "sample_rate", config.sample_rate);
    get_optional(j, "speaker_mode", config.speaker_mode);
    get_optional(j, "raw_speakers", config.raw_speakers);
    get_optional(j, "dsp_buffer_length", config.dsp_buffer_length);
    get_optional(j, "dsp_buffer_count", config.dsp_buffer_count);
    get_optional(j, "output_type", config.output_type);
    get_optional(j, "debug_flags", config.debug_flags);
}

std::string ConfigStore::serialize(const SystemConfig& config) {
    json j = config;
    return j.dump(4);
}

Result<SystemConfig> ConfigStore::deserialize(const std::string& data) {
    SystemConfig config;
    try {
        json j = json::parse(data);
        if (!j.is_object()) {
            std::cerr << "[ConfigStore] Expected a JSON object" << std::endl;
            return std::unexpected(Error(FMOD_ERR_INVALID_PARAM));
        }
        config = j.get<SystemConfig>();
    } catch (const json::exception& e) {
        std::cerr << "[ConfigStore] Invalid config: " << e.what() << std::endl;
        return std::unexpected(Error(FMOD_ERR_INVALID_PARAM));
    }
    if (!in_range(config)) {
        std::cerr << "[ConfigStore] Config value out of range" << std::endl;
        return std::unexpected(Error(FMOD_ERR_INVALID_PARAM));
    }
    return config;
}

Result<> ConfigStore::save_to_file(const SystemConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ConfigStore] Failed to open file for writing: " << path << std::endl;
        return std::unexpected(Error(FMOD_ERR_FILE_BAD));
    }
    file << serialize(config);
    if (!file) {
        return std::unexpected(Error(FMOD_ERR_FILE_BAD));
    }
    return {};
}

Result<SystemConfig> ConfigStore::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ConfigStore] Failed to open file: " << path << std::endl;
        return std::unexpected(Error(FMOD_ERR_FILE_NOTFOUND));
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    return deserialize(content);
}

} // namespace fmodpp
