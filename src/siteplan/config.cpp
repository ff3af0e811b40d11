#include "siteplan/config.hpp"

#include <cmath>
#include <type_traits>

#include "siteplan/utils/utils.hpp"

namespace siteplan {

    namespace {

        template <typename T> bool in_range(T value, T lo, T hi) {
            if constexpr (std::is_floating_point_v<T>) {
                if (!std::isfinite(value)) {
                    return false;
                }
            }
            return value >= lo && value <= hi;
        }

        template <typename T>
        void merge(const std::optional<T> &override_value, T lo, T hi, T &target, const char *name,
                   std::vector<std::string> &ignored) {
            if (!override_value) {
                return;
            }
            if (in_range(*override_value, lo, hi)) {
                target = *override_value;
            } else {
                ignored.emplace_back(name);
            }
        }

    } // namespace

    PlanParameters resolve_parameters(const PlanOverrides &overrides) {
        PlanParameters params;
        merge(overrides.site_type, 0, 4, params.site_type, "site_type", params.ignored);
        merge(overrides.far, 0.0, 10.0, params.far, "far", params.ignored);
        merge(overrides.density, 0.0, 1.0, params.density, "density", params.ignored);
        merge(overrides.mix_ratio, 0.0, 1.0, params.mix_ratio, "mix_ratio", params.ignored);
        merge(overrides.building_style, 0, 3, params.building_style, "building_style", params.ignored);

        if (overrides.orientation) {
            if (in_range(*overrides.orientation, 0.0, 180.0)) {
                params.orientation = utils::deg_to_rad(*overrides.orientation);
            } else {
                params.ignored.emplace_back("orientation");
            }
        }
        return params;
    }

    double effective_tolerance(const PlanConfig &config) {
        if (std::isfinite(config.tolerance) && config.tolerance >= MIN_TOLERANCE && config.tolerance <= MAX_TOLERANCE) {
            return config.tolerance;
        }
        return DEFAULT_TOLERANCE;
    }

    double DesignRules::floor_height(int building_style) const {
        if (building_style < 0 || building_style >= static_cast<int>(floor_heights.size())) {
            return default_floor_height;
        }
        return floor_heights[static_cast<std::size_t>(building_style)];
    }

} // namespace siteplan
