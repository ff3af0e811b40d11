#include "siteplan/polyline.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

#include "siteplan/utils/utils.hpp"

namespace siteplan {

    namespace {

        // Minimum cross product length for a non-collinear point triple
        constexpr double PLANE_MIN_NORMAL = 1e-6;

        enum class Projection { XY, YZ, ZX };

        // Newell normal picks the projection with the least foreshortening
        Projection dominant_projection(const std::vector<Point> &ring) {
            double nx = 0.0, ny = 0.0, nz = 0.0;
            std::size_t n = ring.size();
            for (std::size_t i = 0; i < n; ++i) {
                const auto &a = ring[i];
                const auto &b = ring[(i + 1) % n];
                nx += (a.y - b.y) * (a.z + b.z);
                ny += (a.z - b.z) * (a.x + b.x);
                nz += (a.x - b.x) * (a.y + b.y);
            }
            double ax = std::abs(nx), ay = std::abs(ny), az = std::abs(nz);
            if (ax > ay && ax > az) {
                return Projection::YZ;
            }
            if (ay > az && ay > ax) {
                return Projection::ZX;
            }
            return Projection::XY;
        }

        double shoelace(const std::vector<Point> &ring, Projection projection) {
            double area = 0.0;
            std::size_t n = ring.size();
            for (std::size_t i = 0; i < n; ++i) {
                const auto &a = ring[i];
                const auto &b = ring[(i + 1) % n];
                switch (projection) {
                case Projection::XY:
                    area += a.x * b.y - b.x * a.y;
                    break;
                case Projection::YZ:
                    area += a.y * b.z - b.y * a.z;
                    break;
                case Projection::ZX:
                    area += a.z * b.x - b.z * a.x;
                    break;
                }
            }
            return area * 0.5;
        }

    } // namespace

    Polyline::Polyline(std::vector<Point> points) : points_(std::move(points)) {}

    Polyline Polyline::from_flat(const std::vector<double> &values) {
        if (values.size() % 3 != 0) {
            throw std::invalid_argument("flattened vertices must come in groups of 3 (x, y, z)");
        }
        std::vector<Point> pts;
        pts.reserve(values.size() / 3);
        for (std::size_t i = 0; i < values.size(); i += 3) {
            pts.push_back(Point{values[i], values[i + 1], values[i + 2]});
        }
        return Polyline(std::move(pts));
    }

    std::vector<double> Polyline::to_flat(double z_offset) const { return utils::flatten(points_, z_offset); }

    bool Polyline::is_closed(double tolerance) const {
        if (points_.size() < 3) {
            return false;
        }
        return points_coincide(points_.front(), points_.back(), tolerance);
    }

    bool Polyline::make_closed(double tolerance) { return is_closed(tolerance); }

    void Polyline::close(double tolerance) {
        if (points_.size() < 3) {
            throw std::invalid_argument("cannot close a polyline with fewer than 3 points");
        }
        if (!is_closed(tolerance)) {
            points_.push_back(points_.front());
        }
    }

    std::vector<Point> Polyline::unique_points(double tolerance) const {
        if (is_closed(tolerance)) {
            return std::vector<Point>(points_.begin(), points_.end() - 1);
        }
        return points_;
    }

    std::vector<Line> Polyline::segments() const {
        std::vector<Line> out;
        if (points_.size() < 2) {
            return out;
        }
        out.reserve(points_.size() - 1);
        for (std::size_t i = 0; i + 1 < points_.size(); ++i) {
            out.emplace_back(points_[i], points_[i + 1]);
        }
        return out;
    }

    double Polyline::length() const {
        double total = 0.0;
        for (std::size_t i = 0; i + 1 < points_.size(); ++i) {
            total += Vector::between(points_[i], points_[i + 1]).length();
        }
        return total;
    }

    double Polyline::get_area(double tolerance) const {
        if (!is_closed(tolerance)) {
            return 0.0;
        }
        auto ring = unique_points(tolerance);
        return std::abs(shoelace(ring, dominant_projection(ring)));
    }

    Point Polyline::get_centroid(double tolerance) const {
        if (!is_closed(tolerance)) {
            return Point{0.0, 0.0, 0.0};
        }
        auto ring = unique_points(tolerance);
        double sx = 0.0, sy = 0.0, sz = 0.0;
        for (const auto &p : ring) {
            sx += p.x;
            sy += p.y;
            sz += p.z;
        }
        double n = static_cast<double>(ring.size());
        return Point{sx / n, sy / n, sz / n};
    }

    datapod::AABB Polyline::get_bounding_box() const { return utils::bounds_of(points_); }

    bool Polyline::is_valid(double tolerance) const {
        if (points_.size() < 3) {
            return false;
        }
        for (std::size_t i = 0; i + 1 < points_.size(); ++i) {
            if (points_coincide(points_[i], points_[i + 1], tolerance)) {
                return false;
            }
        }

        // Distinct count, the closing duplicate does not count twice
        std::vector<Point> distinct;
        for (const auto &p : points_) {
            bool seen = false;
            for (const auto &q : distinct) {
                if (points_coincide(p, q, tolerance)) {
                    seen = true;
                    break;
                }
            }
            if (!seen) {
                distinct.push_back(p);
            }
        }
        return distinct.size() >= 3;
    }

    std::optional<Plane> Polyline::get_plane() const {
        if (points_.size() < 3) {
            return std::nullopt;
        }
        const Point &p0 = points_[0];
        Vector v1 = Vector::between(p0, points_[1]);

        for (std::size_t i = 2; i < points_.size(); ++i) {
            Vector v2 = Vector::between(p0, points_[i]);
            Vector normal = v1.cross(v2);
            if (normal.length() > PLANE_MIN_NORMAL) {
                return Plane::from_normal(p0, normal);
            }
        }
        return std::nullopt;
    }

    double Polyline::get_main_orientation() const {
        if (points_.size() < 2) {
            return 0.0;
        }
        double max_length = 0.0;
        double main_angle = 0.0;
        std::size_t n = points_.size();
        for (std::size_t i = 0; i < n; ++i) {
            const auto &a = points_[i];
            const auto &b = points_[(i + 1) % n];
            double len = std::hypot(b.x - a.x, b.y - a.y);
            if (len > max_length) {
                max_length = len;
                main_angle = utils::heading_between(a, b);
            }
        }
        return main_angle;
    }

    datapod::Polygon Polyline::to_polygon() const {
        datapod::Polygon poly;
        for (const auto &p : points_) {
            poly.vertices.push_back(p);
        }
        return poly;
    }

} // namespace siteplan
