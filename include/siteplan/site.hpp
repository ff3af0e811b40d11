#pragma once

#include <vector>

#include <datapod/datapod.hpp>

#include "siteplan/polyline.hpp"

namespace siteplan {

    /**
     * @brief Derived description of a site boundary
     */
    struct SiteRecord {
        Polyline boundary;           ///< Closed site boundary
        double area = 0.0;
        double main_orientation = 0.0; ///< Heading of the longest edge, radians, default layout rotation
        datapod::AABB bounds;
        bool reclosed = false;       ///< A closing vertex was appended to the input ring
    };

    /**
     * @brief Build a site record from a flat (x, y, z) vertex array
     *
     * The inbound ring is a polygon boundary, so a missing closing vertex is
     * appended explicitly and reported through SiteRecord::reclosed.
     *
     * @throws std::invalid_argument if the array is not triple aligned or has fewer than 3 vertices
     */
    SiteRecord make_site(const std::vector<double> &vertices, double tolerance = DEFAULT_TOLERANCE);

} // namespace siteplan
