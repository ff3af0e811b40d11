#pragma once

#include <vector>

#include "siteplan/polyline.hpp"

namespace siteplan {

    /**
     * @brief Outcome tag of one offset attempt
     */
    enum class OffsetStatus {
        Success,    ///< Usable polygon with the source winding
        Degenerate, ///< A polygon was produced but it collapsed or flipped winding
        Failed,     ///< No polygon (invalid input or fewer than 3 vertices survived)
    };

    enum class OffsetMethod {
        None,
        CentroidOffset, ///< Fixed distance toward/away from the centroid, may drop vertices
        ScaledInset,    ///< Uniform scale about the centroid, keeps every vertex
    };

    /**
     * @brief Result of an offset attempt or of a whole fallback chain
     */
    struct OffsetResult {
        OffsetStatus status = OffsetStatus::Failed;
        OffsetMethod method = OffsetMethod::None;
        Polyline polygon; ///< Closed result, empty when Failed
        std::size_t attempts = 0;

        bool ok() const { return status == OffsetStatus::Success; }
    };

    /// One tier of the fallback chain: (polygon, distance, tolerance) -> outcome
    using OffsetStrategy = OffsetResult (*)(const Polyline &, double, double);

    /**
     * @brief Approximate offset by moving every vertex along its centroid ray
     *
     * Positive distance moves vertices toward the centroid (inward), negative
     * distance away from it (outward). Vertices not farther than the distance
     * from the centroid are dropped rather than pushed through it.
     *
     * @param polyline A closed polyline with at least 3 distinct vertices
     * @param distance Offset distance
     * @param tolerance Closure and degeneracy tolerance
     */
    OffsetResult offset_polygon(const Polyline &polyline, double distance, double tolerance = DEFAULT_TOLERANCE);

    /**
     * @brief Approximate inset by a uniform scale about the centroid
     *
     * The scale is 1 - distance / r, r being the mean vertex distance to the
     * centroid. No vertex is dropped; a non-positive scale fails.
     */
    OffsetResult inset_polygon(const Polyline &polyline, double distance, double tolerance = DEFAULT_TOLERANCE);

    /// offset_polygon then inset_polygon
    const std::vector<OffsetStrategy> &default_offset_chain();

    /**
     * @brief Try each strategy in order and return the first success
     *
     * When every tier fails, the outcome of the last tier is returned.
     */
    OffsetResult offset_with_fallback(const Polyline &polyline, double distance, double tolerance = DEFAULT_TOLERANCE,
                                      const std::vector<OffsetStrategy> &chain = default_offset_chain());

    const char *to_string(OffsetStatus status);
    const char *to_string(OffsetMethod method);

} // namespace siteplan
