/**
 * @file face.cpp
 * @brief Triangular face implementation
 */

#include "obbcollide/geometry/face.h"

namespace obbcollide::geometry {

Vec3 Face::unit_normal() const noexcept {
    return normal().normalized();
}

Real Face::area() const noexcept {
    return 0.5 * normal().length();
}

Face Face::transformed(const Frame& frame) const noexcept {
    return {frame.to_reference(p), frame.to_reference(q), frame.to_reference(r)};
}

std::vector<Face> make_box_faces(const Vec3& half_extents) {
    const Real a = half_extents.x;
    const Real b = half_extents.y;
    const Real c = half_extents.z;

    const Vec3 corners[8] = {
        Vec3(-a, -b, -c), Vec3(+a, -b, -c), Vec3(+a, +b, -c), Vec3(-a, +b, -c),
        Vec3(-a, -b, +c), Vec3(+a, -b, +c), Vec3(+a, +b, +c), Vec3(-a, +b, +c)
    };

    // Quads as corner indices, counter-clockwise seen from outside
    const int quads[6][4] = {
        {0, 3, 2, 1},  // -z
        {4, 5, 6, 7},  // +z
        {0, 1, 5, 4},  // -y
        {3, 7, 6, 2},  // +y
        {0, 4, 7, 3},  // -x
        {1, 2, 6, 5}   // +x
    };

    std::vector<Face> faces;
    faces.reserve(12);
    for (const auto& quad : quads) {
        faces.emplace_back(corners[quad[0]], corners[quad[1]], corners[quad[2]]);
        faces.emplace_back(corners[quad[0]], corners[quad[2]], corners[quad[3]]);
    }
    return faces;
}

} // namespace obbcollide::geometry
