#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "siteplan/boolean.hpp"
#include "siteplan/config.hpp"
#include "siteplan/design.hpp"
#include "siteplan/offset.hpp"
#include "siteplan/site.hpp"

namespace siteplan {

    /**
     * @brief Classification of an outer operation
     */
    enum class Status {
        Ok,
        InvalidInput,  ///< Input shape error, rejected before any geometry ran
        InternalError, ///< Unexpected failure, no partial data is returned
    };

    const char *to_string(Status status);

    /**
     * @brief The four aligned output collections of a generated plan
     */
    struct LayoutResult {
        std::vector<std::vector<double>> building_layers_heights;               ///< Per building, per floor
        std::vector<std::vector<std::vector<double>>> building_layers_vertices; ///< Per building, per floor ring
        std::vector<std::vector<double>> sub_site_vertices;                     ///< Site boundary
        std::vector<std::vector<double>> sub_site_setback_vertices;             ///< Setback, lifted in z
    };

    struct PlanReport {
        Status status = Status::Ok;
        std::string message;
        LayoutResult layout;
        PlanParameters parameters;
        SiteRecord site;
        DesignResult design;
        OffsetResult setback; ///< Outcome of the setback fallback chain

        bool ok() const { return status == Status::Ok; }
    };

    /**
     * @brief Generate a building layout for a site
     *
     * @param vertices Flat (x, y, z) site boundary, at least 3 vertices
     * @param overrides Optional request parameters; out-of-range values are ignored
     * @param config Tolerance, seed and verbosity
     * @param rules Empirical constants of the rule engine
     */
    PlanReport generate_plan(const std::vector<double> &vertices, const PlanOverrides &overrides = PlanOverrides{},
                             const PlanConfig &config = PlanConfig{}, const DesignRules &rules = DesignRules{});

    struct AnalysisReport {
        Status status = Status::Ok;
        std::string message;
        double area = 0.0;
        double perimeter = 0.0;
        bool is_closed = false;
        bool is_valid = false;
        Point centroid;
        double main_orientation = 0.0;
    };

    AnalysisReport analyze_geometry(const std::vector<double> &vertices, const PlanConfig &config = PlanConfig{});

    struct ValidationOptions {
        bool check_closure = true;
        bool check_self_intersection = true;
        bool check_planarity = true;
    };

    struct ValidationReport {
        Status status = Status::Ok;
        std::string message;
        bool is_valid = false;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
        double polygon_area = 0.0;
        double polygon_perimeter = 0.0;
        bool is_closed = false;
        bool is_planar = false;
        bool self_intersects = false;
    };

    ValidationReport validate_geometry(const std::vector<double> &vertices,
                                       const ValidationOptions &options = ValidationOptions{},
                                       const PlanConfig &config = PlanConfig{});

    enum class OffsetDirection { Inward, Outward };

    struct OffsetReport {
        Status status = Status::Ok;
        bool success = false;
        std::string error_message;
        std::vector<double> offset_vertices;
        OffsetMethod method = OffsetMethod::None;
    };

    OffsetReport offset_geometry(const std::vector<double> &vertices, double distance,
                                 OffsetDirection direction = OffsetDirection::Inward,
                                 const PlanConfig &config = PlanConfig{});

    struct IntersectionReport {
        Status status = Status::Ok;
        std::string message;
        bool intersects = false;
        PolygonRelation relation = PolygonRelation::Separate;
        std::vector<std::vector<double>> intersection_points;
    };

    IntersectionReport test_intersection(const std::vector<double> &vertices_a, const std::vector<double> &vertices_b,
                                         const PlanConfig &config = PlanConfig{});

} // namespace siteplan
