/**
 * @file Types.hpp
 * @brief Small value types shared by several engine objects.
 */

#ifndef FMODPP_CORE_TYPES_HPP
#define FMODPP_CORE_TYPES_HPP

#include <fmod_common.h>

namespace fmodpp {

using Vector = FMOD_VECTOR;

/**
 * @brief Direct and reverb occlusion, 0 (none) to 1 (full).
 */
struct Occlusion {
    float direct = 0.0f;
    float reverb = 0.0f;
};

struct DspClock {
    unsigned long long clock = 0;
    unsigned long long parent_clock = 0;
};

struct OpenState {
    FMOD_OPENSTATE state = FMOD_OPENSTATE_READY;
    unsigned int percent_buffered = 0;
    bool starving = false;
    bool disk_busy = false;
};

struct PolygonLimits {
    int max_polygons = 0;
    int max_vertices = 0;
};

} // namespace fmodpp

#endif // FMODPP_CORE_TYPES_HPP
