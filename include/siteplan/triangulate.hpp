#pragma once

#include <array>
#include <cstddef>
#include <vector>

#include "siteplan/polyline.hpp"

namespace siteplan {

    using Triangle = std::array<Point, 3>;

    struct TriangulationResult {
        std::vector<Triangle> triangles;
        std::size_t forced_clips = 0; ///< Passes that found no ear and clipped the first vertices anyway
    };

    /**
     * @brief Ear-clipping triangulation in the XY projection
     *
     * A closing duplicate is stripped first. An ear is a convex vertex whose
     * triangle contains no other remaining vertex. When a full pass finds no
     * ear, the first three remaining vertices are emitted and the second one
     * is removed, so every iteration removes exactly one vertex and N input
     * vertices always give N - 2 triangles.
     *
     * @param polygon Vertex ring, closed or not
     * @param tolerance Closing duplicate tolerance
     */
    TriangulationResult triangulate(const std::vector<Point> &polygon, double tolerance = DEFAULT_TOLERANCE);

    TriangulationResult triangulate(const Polyline &polyline, double tolerance = DEFAULT_TOLERANCE);

    /// Unsigned triangle area in XY
    double triangle_area(const Triangle &tri);

} // namespace siteplan
