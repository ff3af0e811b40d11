#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "siteplan/primitives.hpp"

namespace siteplan {

    enum class BuildingStyle { Residential = 0, Office = 1, Commercial = 2, Mixed = 3 };

    /**
     * @brief Request parameters as supplied by the caller, any of them may be missing
     */
    struct PlanOverrides {
        std::optional<int> site_type;       ///< [0, 4]
        std::optional<double> far;          ///< [0, 10]
        std::optional<double> density;      ///< [0, 1]
        std::optional<double> mix_ratio;    ///< [0, 1]
        std::optional<int> building_style;  ///< [0, 3]
        std::optional<double> orientation;  ///< degrees, [0, 180]
    };

    /**
     * @brief Fully resolved request parameters
     *
     * Built once by resolve_parameters() and passed by const reference.
     */
    struct PlanParameters {
        int site_type = 0;
        double far = 1.0;
        double density = 0.5;
        double mix_ratio = 0.0;
        int building_style = 0;
        /// Radians. Unset when no in-range override was given, the site's
        /// dominant edge heading is used instead.
        std::optional<double> orientation;

        /// Names of overrides that were out of range and left at their default
        std::vector<std::string> ignored;
    };

    /**
     * @brief Merge in-range overrides over the defaults
     *
     * Out-of-range or non-finite values are ignored rather than rejected. The
     * orientation has no fixed default and stays unset unless overridden.
     */
    PlanParameters resolve_parameters(const PlanOverrides &overrides);

    /**
     * @brief Per-request processing configuration
     */
    struct PlanConfig {
        double tolerance = DEFAULT_TOLERANCE;
        std::uint32_t seed = 5489u; ///< std::mt19937 default seed
        bool verbose = false;
    };

    /**
     * @brief Tolerance inside [MIN_TOLERANCE, MAX_TOLERANCE], DEFAULT_TOLERANCE otherwise
     */
    double effective_tolerance(const PlanConfig &config);

    /**
     * @brief Fixed empirical constants of the parametric rule engine
     */
    struct DesignRules {
        double base_building_size = 20.0;
        double width_base = 0.7;
        double width_per_density = 0.6;
        double depth_base = 0.6;
        double depth_per_density = 0.5;
        double spacing_factor = 2.0;
        int max_buildings = 8;
        int min_floors = 2;
        int max_floors = 15;
        double low_density_threshold = 0.3;
        double high_density_threshold = 0.7;
        double scatter_spacing = 15.0;
        double medium_grid_spacing = 8.0;
        double tight_grid_spacing = 5.0;
        double jitter = 3.0;
        double min_rotation = 1e-6;
        double setback_base = 3.0;
        double setback_per_density = 2.0;
        double setback_lift = 0.2;

        /// Indexed by BuildingStyle: residential, office, commercial, mixed
        std::array<double, 4> floor_heights = {3.0, 3.5, 4.0, 3.2};
        double default_floor_height = 3.0;

        double floor_height(int building_style) const;

        double setback_distance(double density) const { return setback_base + density * setback_per_density; }
    };

} // namespace siteplan
