#include "siteplan/plan.hpp"

#include <exception>
#include <iostream>
#include <random>
#include <stdexcept>
#include <utility>

#include "siteplan/intersect.hpp"
#include "siteplan/massing.hpp"
#include "siteplan/placement.hpp"

namespace siteplan {

    namespace {

        std::vector<std::vector<double>> points_as_triples(const std::vector<Point> &points) {
            std::vector<std::vector<double>> out;
            out.reserve(points.size());
            for (const auto &p : points) {
                out.push_back({p.x, p.y, p.z});
            }
            return out;
        }

        void warn(const PlanConfig &config, const std::string &msg) {
            if (config.verbose) {
                std::cerr << "Warning: " << msg << std::endl;
            }
        }

        void report_error(const PlanConfig &config, const char *operation, const std::exception &e) {
            if (config.verbose) {
                std::cerr << "Error: " << operation << ": " << e.what() << std::endl;
            }
        }

        LayoutResult build_layout(const SiteRecord &site, const DesignResult &design, double elevation,
                                  const OffsetResult &setback, const DesignRules &rules) {
            LayoutResult layout;
            layout.building_layers_heights.reserve(design.num_buildings());
            layout.building_layers_vertices.reserve(design.num_buildings());

            for (const auto &pos : design.building_positions) {
                layout.building_layers_vertices.push_back(building_floor_rings(
                    pos, design.building_width, design.building_depth, design.floors_per_building,
                    design.floor_height, elevation));
                layout.building_layers_heights.emplace_back(static_cast<std::size_t>(design.floors_per_building),
                                                            design.floor_height);
            }

            layout.sub_site_vertices.push_back(site.boundary.to_flat());
            if (setback.ok()) {
                layout.sub_site_setback_vertices.push_back(setback.polygon.to_flat(rules.setback_lift));
            }
            return layout;
        }

    } // namespace

    const char *to_string(Status status) {
        switch (status) {
        case Status::Ok:
            return "ok";
        case Status::InvalidInput:
            return "invalid_input";
        case Status::InternalError:
            return "internal_error";
        }
        return "unknown";
    }

    PlanReport generate_plan(const std::vector<double> &vertices, const PlanOverrides &overrides,
                             const PlanConfig &config, const DesignRules &rules) {
        PlanReport report;
        double tolerance = effective_tolerance(config);

        try {
            report.site = make_site(vertices, tolerance);
            if (report.site.reclosed) {
                warn(config, "site boundary was not closed, appended the first vertex");
            }

            report.parameters = resolve_parameters(overrides);
            for (const auto &name : report.parameters.ignored) {
                warn(config, "parameter '" + name + "' out of range, using default");
            }
            if (!report.parameters.orientation) {
                report.parameters.orientation = report.site.main_orientation;
            }

            std::mt19937 rng(config.seed);
            report.design =
                apply_site_parameters(report.site.boundary, report.site.area, report.parameters, rng, rules, tolerance);
            if (report.design.num_buildings() < report.design.requested_buildings) {
                warn(config, "placed " + std::to_string(report.design.num_buildings()) + " of " +
                                 std::to_string(report.design.requested_buildings) + " buildings");
            }

            report.setback = offset_with_fallback(report.site.boundary,
                                                  rules.setback_distance(report.parameters.density), tolerance);
            if (!report.setback.ok()) {
                warn(config, std::string("setback ") + to_string(report.setback.status) + ", omitted from layout");
            } else if (report.setback.method != OffsetMethod::CentroidOffset) {
                warn(config, std::string("setback produced by ") + to_string(report.setback.method));
            }

            report.layout = build_layout(report.site, report.design, mean_elevation(report.site.boundary),
                                         report.setback, rules);
        } catch (const std::invalid_argument &e) {
            report_error(config, "generate_plan", e);
            report = PlanReport{};
            report.status = Status::InvalidInput;
            report.message = e.what();
        } catch (const std::exception &e) {
            report_error(config, "generate_plan", e);
            report = PlanReport{};
            report.status = Status::InternalError;
            report.message = e.what();
        }
        return report;
    }

    AnalysisReport analyze_geometry(const std::vector<double> &vertices, const PlanConfig &config) {
        AnalysisReport report;
        double tolerance = effective_tolerance(config);

        try {
            Polyline polyline = Polyline::from_flat(vertices);
            if (polyline.size() < 3) {
                throw std::invalid_argument("at least 3 vertices (9 values) required");
            }
            report.is_closed = polyline.is_closed(tolerance);
            report.is_valid = polyline.is_valid(tolerance);
            report.area = polyline.get_area(tolerance);
            report.perimeter = polyline.length();
            report.centroid = polyline.get_centroid(tolerance);
            report.main_orientation = polyline.get_main_orientation();
        } catch (const std::invalid_argument &e) {
            report_error(config, "analyze_geometry", e);
            report = AnalysisReport{};
            report.status = Status::InvalidInput;
            report.message = e.what();
        } catch (const std::exception &e) {
            report_error(config, "analyze_geometry", e);
            report = AnalysisReport{};
            report.status = Status::InternalError;
            report.message = e.what();
        }
        return report;
    }

    ValidationReport validate_geometry(const std::vector<double> &vertices, const ValidationOptions &options,
                                       const PlanConfig &config) {
        ValidationReport report;
        double tolerance = effective_tolerance(config);

        try {
            Polyline polyline = Polyline::from_flat(vertices);
            if (polyline.size() < 3) {
                report.is_valid = false;
                report.errors.emplace_back("Insufficient vertices for polygon (minimum 3 required)");
                return report;
            }

            report.is_closed = polyline.make_closed(tolerance);
            if (!report.is_closed && options.check_closure) {
                report.warnings.emplace_back("Polygon is not closed");
            }

            if (options.check_self_intersection) {
                report.self_intersects = polyline_self_intersection_check(polyline, tolerance);
                if (report.self_intersects) {
                    report.errors.emplace_back("Polygon self-intersects");
                }
            }

            report.is_planar = true;
            if (options.check_planarity) {
                report.is_planar = polyline.get_plane().has_value();
                if (!report.is_planar) {
                    report.warnings.emplace_back("Polygon is not planar");
                }
            }

            report.polygon_area = report.is_closed ? polyline.get_area(tolerance) : 0.0;
            report.polygon_perimeter = polyline.length();
            report.is_valid = report.errors.empty();
        } catch (const std::invalid_argument &e) {
            report_error(config, "validate_geometry", e);
            report = ValidationReport{};
            report.status = Status::InvalidInput;
            report.message = e.what();
        } catch (const std::exception &e) {
            report_error(config, "validate_geometry", e);
            report = ValidationReport{};
            report.status = Status::InternalError;
            report.message = e.what();
        }
        return report;
    }

    OffsetReport offset_geometry(const std::vector<double> &vertices, double distance, OffsetDirection direction,
                                 const PlanConfig &config) {
        OffsetReport report;
        double tolerance = effective_tolerance(config);

        try {
            Polyline polyline = Polyline::from_flat(vertices);
            if (polyline.size() < 3) {
                report.error_message = "Insufficient vertices for polygon";
                return report;
            }
            if (!polyline.make_closed(tolerance)) {
                report.error_message = "Cannot close polygon within tolerance";
                return report;
            }

            double signed_distance = direction == OffsetDirection::Inward ? distance : -distance;
            OffsetResult result = offset_with_fallback(polyline, signed_distance, tolerance);
            if (!result.ok()) {
                warn(config, std::string("offset ") + to_string(result.status) + " after " +
                                 std::to_string(result.attempts) + " attempts");
                report.error_message = "Unable to create valid offset polygon";
                return report;
            }

            report.success = true;
            report.method = result.method;
            report.offset_vertices = result.polygon.to_flat();
        } catch (const std::invalid_argument &e) {
            report_error(config, "offset_geometry", e);
            report = OffsetReport{};
            report.status = Status::InvalidInput;
            report.error_message = e.what();
        } catch (const std::exception &e) {
            report_error(config, "offset_geometry", e);
            report = OffsetReport{};
            report.status = Status::InternalError;
            report.error_message = e.what();
        }
        return report;
    }

    IntersectionReport test_intersection(const std::vector<double> &vertices_a, const std::vector<double> &vertices_b,
                                         const PlanConfig &config) {
        IntersectionReport report;
        double tolerance = effective_tolerance(config);

        try {
            Polyline a = Polyline::from_flat(vertices_a);
            Polyline b = Polyline::from_flat(vertices_b);

            RelationReport relation = polygon_relation(a.points(), b.points(), tolerance);
            report.relation = relation.relation;
            report.intersects = relation.intersects();
            report.intersection_points = points_as_triples(relation.crossing_points);
        } catch (const std::invalid_argument &e) {
            report_error(config, "test_intersection", e);
            report = IntersectionReport{};
            report.status = Status::InvalidInput;
            report.message = e.what();
        } catch (const std::exception &e) {
            report_error(config, "test_intersection", e);
            report = IntersectionReport{};
            report.status = Status::InternalError;
            report.message = e.what();
        }
        return report;
    }

} // namespace siteplan
