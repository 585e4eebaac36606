#include "engine/Geometry.hpp"
#include "core/Buffer.hpp"

namespace fmodpp {

Result<int> Geometry::add_polygon(float direct_occlusion, float reverb_occlusion, bool double_sided,
                                  std::span<const Vector> vertices) const {
    if (vertices.size() < 3) {
        return std::unexpected(Error(FMOD_ERR_INVALID_PARAM));
    }
    int index = -1;
    FMOD_RESULT result = FMOD_Geometry_AddPolygon(raw_, direct_occlusion, reverb_occlusion, double_sided ? 1 : 0,
                                                  static_cast<int>(vertices.size()), vertices.data(), &index);
    return check(result, index);
}

Result<int> Geometry::num_polygons() const {
    int count = 0;
    FMOD_RESULT result = FMOD_Geometry_GetNumPolygons(raw_, &count);
    return check(result, count);
}

Result<PolygonLimits> Geometry::max_polygons() const {
    PolygonLimits limits;
    FMOD_RESULT result = FMOD_Geometry_GetMaxPolygons(raw_, &limits.max_polygons, &limits.max_vertices);
    return check(result, limits);
}

Result<> Geometry::set_active(bool active) const {
    return check(FMOD_Geometry_SetActive(raw_, active ? 1 : 0));
}

Result<bool> Geometry::active() const {
    FMOD_BOOL active = 0;
    FMOD_RESULT result = FMOD_Geometry_GetActive(raw_, &active);
    return check(result, active != 0);
}

Result<std::vector<uint8_t>> Geometry::save() const {
    Raw* geometry = raw_;
    return read_blob([geometry](void* data, int* size) {
        return FMOD_Geometry_Save(geometry, data, size);
    });
}

} // namespace fmodpp
