/**
 * @file Geometry.hpp
 * @brief Occluding polygon sets for 3D sound.
 */

#ifndef FMODPP_ENGINE_GEOMETRY_HPP
#define FMODPP_ENGINE_GEOMETRY_HPP

#include "core/Error.hpp"
#include "core/Types.hpp"

#include <fmod.h>
#include <cstdint>
#include <span>
#include <vector>

namespace fmodpp {

/**
 * @brief View of a geometry object. Owned through Handle<Geometry>.
 */
class Geometry {
public:
    using Raw = FMOD_GEOMETRY;
    static constexpr const char* TYPE_NAME = "Geometry";

    static Geometry from_raw(Raw* raw) noexcept { return Geometry(raw); }
    Raw* as_raw() const noexcept { return raw_; }
    static FMOD_RESULT raw_release(Raw* raw) noexcept { return FMOD_Geometry_Release(raw); }

    /**
     * @brief Add a polygon; vertices must be coplanar and convex.
     * @return Index of the new polygon.
     */
    Result<int> add_polygon(float direct_occlusion, float reverb_occlusion, bool double_sided,
                            std::span<const Vector> vertices) const;
    Result<int> num_polygons() const;
    Result<PolygonLimits> max_polygons() const;

    Result<> set_active(bool active) const;
    Result<bool> active() const;

    /**
     * @brief Serialize to an opaque blob for System::load_geometry().
     */
    Result<std::vector<uint8_t>> save() const;

    friend bool operator==(const Geometry& lhs, const Geometry& rhs) noexcept {
        return lhs.raw_ == rhs.raw_;
    }

private:
    explicit Geometry(Raw* raw) noexcept : raw_(raw) {}

    Raw* raw_;
};

} // namespace fmodpp

#endif // FMODPP_ENGINE_GEOMETRY_HPP
