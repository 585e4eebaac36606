/**
 * @file Config.hpp
 * @brief Human-readable JSON persistence of engine start-up settings.
 */

#ifndef FMODPP_CORE_CONFIG_HPP
#define FMODPP_CORE_CONFIG_HPP

#include "core/Error.hpp"

#include <fmod_common.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace fmodpp {

using json = nlohmann::json;

/**
 * @brief Settings applied to a System before and during init.
 *
 * Unset optional fields leave the engine default in place.
 */
struct SystemConfig {
    int version = 1;
    int max_channels = 512;
    unsigned int init_flags = FMOD_INIT_NORMAL;

    std::optional<int> software_channels;

    // Software format
    std::optional<int> sample_rate;
    std::optional<int> speaker_mode;   // FMOD_SPEAKERMODE
    std::optional<int> raw_speakers;

    // DSP buffer
    std::optional<unsigned int> dsp_buffer_length;
    std::optional<int> dsp_buffer_count;

    std::optional<int> output_type;    // FMOD_OUTPUTTYPE
    std::optional<unsigned int> debug_flags;  // FMOD_DEBUG_FLAGS, routed to the Logger

    friend bool operator==(const SystemConfig&, const SystemConfig&) = default;
};

void to_json(json& j, const SystemConfig& config);
void from_json(const json& j, SystemConfig& config);

/**
 * @brief Manages saving and loading of SystemConfig.
 */
class ConfigStore {
public:
    /**
     * @brief Convert a SystemConfig to a JSON string.
     */
    static std::string serialize(const SystemConfig& config);

    /**
     * @brief Parse a SystemConfig from a JSON string.
     * @return FMOD_ERR_INVALID_PARAM for malformed JSON, wrong field types or
     *         out-of-range values.
     */
    static Result<SystemConfig> deserialize(const std::string& data);

    static Result<> save_to_file(const SystemConfig& config, const std::string& path);
    static Result<SystemConfig> load_from_file(const std::string& path);
};

} // namespace fmodpp

#endif // FMODPP_CORE_CONFIG_HPP
