#include "siteplan/placement.hpp"

#include <algorithm>
#include <stdexcept>

#include "siteplan/intersect.hpp"
#include "siteplan/utils/utils.hpp"

namespace siteplan {

    namespace {

        void check_footprint(double width, double depth, double spacing) {
            if (width <= 0.0 || depth <= 0.0) {
                throw std::invalid_argument("building footprint must have positive width and depth");
            }
            if (spacing < 0.0) {
                throw std::invalid_argument("negative building spacing");
            }
        }

    } // namespace

    std::array<Point, 4> footprint_corners(const Point &center, double width, double depth) {
        double hw = width / 2.0;
        double hd = depth / 2.0;
        return {Point{center.x - hw, center.y - hd, center.z}, Point{center.x + hw, center.y - hd, center.z},
                Point{center.x + hw, center.y + hd, center.z}, Point{center.x - hw, center.y + hd, center.z}};
    }

    double mean_elevation(const Polyline &site) {
        auto unique = site.unique_points();
        if (unique.empty()) {
            return 0.0;
        }
        double sum_z = 0.0;
        for (const auto &p : unique) {
            sum_z += p.z;
        }
        return sum_z / static_cast<double>(unique.size());
    }

    BuildingPlacer::BuildingPlacer(const Polyline &site, std::mt19937 &rng)
        : ring_(site.points()), bounds_(utils::bounds_of(site.points())), elevation_(mean_elevation(site)), rng_(rng) {}

    void BuildingPlacer::set_attempts_per_building(std::size_t attempts) {
        if (attempts == 0) {
            throw std::invalid_argument("attempts per building must be positive");
        }
        attempts_per_building_ = attempts;
    }

    bool BuildingPlacer::contains(const Point &p) const { return point_in_polygon_2d(p, ring_); }

    bool BuildingPlacer::footprint_fits(const Point &center, double width, double depth) const {
        if (!contains(center)) {
            return false;
        }
        auto corners = footprint_corners(center, width, depth);
        return std::all_of(corners.begin(), corners.end(), [this](const Point &c) { return contains(c); });
    }

    std::vector<Point> BuildingPlacer::scatter(std::size_t count, double width, double depth, double min_spacing) {
        check_footprint(width, depth, min_spacing);
        last_attempts_ = 0;

        std::vector<Point> positions;
        if (ring_.size() < 3 || count == 0) {
            return positions;
        }

        double lo_x = bounds_.min_point.x + width / 2.0;
        double hi_x = bounds_.max_point.x - width / 2.0;
        double lo_y = bounds_.min_point.y + depth / 2.0;
        double hi_y = bounds_.max_point.y - depth / 2.0;
        if (lo_x > hi_x || lo_y > hi_y) {
            return positions; // footprint larger than the site box
        }

        std::uniform_real_distribution<double> dist_x(lo_x, hi_x);
        std::uniform_real_distribution<double> dist_y(lo_y, hi_y);

        double clearance = std::max(width, depth) + min_spacing;
        std::size_t max_attempts = count * attempts_per_building_;
        datapod::PointRTree<std::size_t> accepted;

        while (positions.size() < count && last_attempts_ < max_attempts) {
            last_attempts_ += 1;

            Point candidate{dist_x(rng_), dist_y(rng_), elevation_};
            if (!footprint_fits(candidate, width, depth)) {
                continue;
            }

            // Radius query is inclusive, the spacing rule is strict
            auto nearby = accepted.query_radius(candidate, clearance);
            bool too_close = false;
            for (const auto &entry : nearby) {
                if (candidate.distance_to(entry.point) < clearance) {
                    too_close = true;
                    break;
                }
            }
            if (!too_close) {
                accepted.insert(candidate, positions.size());
                positions.push_back(candidate);
            }
        }

        return positions;
    }

    std::vector<Point> BuildingPlacer::grid(double width, double depth, double spacing) const {
        check_footprint(width, depth, spacing);

        std::vector<Point> positions;
        if (ring_.size() < 3) {
            return positions;
        }

        double step_x = width + spacing;
        double step_y = depth + spacing;

        for (double x = bounds_.min_point.x + width / 2.0; x + width / 2.0 <= bounds_.max_point.x; x += step_x) {
            for (double y = bounds_.min_point.y + depth / 2.0; y + depth / 2.0 <= bounds_.max_point.y; y += step_y) {
                Point candidate{x, y, elevation_};
                if (footprint_fits(candidate, width, depth)) {
                    positions.push_back(candidate);
                }
            }
        }

        return positions;
    }

} // namespace siteplan
