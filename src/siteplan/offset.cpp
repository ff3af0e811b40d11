#include "siteplan/offset.hpp"

#include <cmath>
#include <utility>

#include "siteplan/utils/utils.hpp"

namespace siteplan {

    namespace {

        // Classify a produced ring against the source winding
        OffsetResult finish(std::vector<Point> ring, double source_area, OffsetMethod method, double tolerance) {
            OffsetResult result;
            result.method = method;
            result.attempts = 1;

            if (ring.size() < 3) {
                result.status = OffsetStatus::Failed;
                return result;
            }

            double area = utils::signed_area_2d(ring);
            ring.push_back(ring.front());
            result.polygon = Polyline(std::move(ring));

            bool flipped = (area > 0.0) != (source_area > 0.0);
            if (std::abs(area) <= tolerance || flipped) {
                result.status = OffsetStatus::Degenerate;
            } else {
                result.status = OffsetStatus::Success;
            }
            return result;
        }

    } // namespace

    OffsetResult offset_polygon(const Polyline &polyline, double distance, double tolerance) {
        OffsetResult failed;
        failed.method = OffsetMethod::CentroidOffset;
        failed.attempts = 1;

        if (!polyline.is_closed(tolerance) || polyline.size() < 4) {
            return failed;
        }

        auto ring = polyline.unique_points(tolerance);
        Point centroid = polyline.get_centroid(tolerance);

        std::vector<Point> moved;
        moved.reserve(ring.size());
        for (const auto &p : ring) {
            Vector to_point = Vector::between(centroid, p);
            if (to_point.length() > distance) {
                moved.push_back(translate(p, to_point.normalize() * -distance));
            }
        }

        return finish(std::move(moved), utils::signed_area_2d(ring), OffsetMethod::CentroidOffset, tolerance);
    }

    OffsetResult inset_polygon(const Polyline &polyline, double distance, double tolerance) {
        OffsetResult failed;
        failed.method = OffsetMethod::ScaledInset;
        failed.attempts = 1;

        auto ring = polyline.unique_points(tolerance);
        if (ring.size() < 3) {
            return failed;
        }

        double sx = 0.0, sy = 0.0, sz = 0.0;
        for (const auto &p : ring) {
            sx += p.x;
            sy += p.y;
            sz += p.z;
        }
        double n = static_cast<double>(ring.size());
        Point centroid{sx / n, sy / n, sz / n};

        double mean_radius = 0.0;
        for (const auto &p : ring) {
            mean_radius += Vector::between(centroid, p).length();
        }
        mean_radius /= n;
        if (mean_radius <= tolerance) {
            return failed;
        }

        double scale = 1.0 - distance / mean_radius;
        if (scale <= tolerance) {
            return failed;
        }

        std::vector<Point> scaled;
        scaled.reserve(ring.size());
        for (const auto &p : ring) {
            scaled.push_back(translate(centroid, Vector::between(centroid, p) * scale));
        }

        return finish(std::move(scaled), utils::signed_area_2d(ring), OffsetMethod::ScaledInset, tolerance);
    }

    const std::vector<OffsetStrategy> &default_offset_chain() {
        static const std::vector<OffsetStrategy> chain = {&offset_polygon, &inset_polygon};
        return chain;
    }

    OffsetResult offset_with_fallback(const Polyline &polyline, double distance, double tolerance,
                                      const std::vector<OffsetStrategy> &chain) {
        OffsetResult last;
        std::size_t attempts = 0;
        for (auto strategy : chain) {
            last = strategy(polyline, distance, tolerance);
            attempts += 1;
            last.attempts = attempts;
            if (last.ok()) {
                return last;
            }
        }
        return last;
    }

    const char *to_string(OffsetStatus status) {
        switch (status) {
        case OffsetStatus::Success:
            return "success";
        case OffsetStatus::Degenerate:
            return "degenerate";
        case OffsetStatus::Failed:
            return "failed";
        }
        return "unknown";
    }

    const char *to_string(OffsetMethod method) {
        switch (method) {
        case OffsetMethod::None:
            return "none";
        case OffsetMethod::CentroidOffset:
            return "centroid_offset";
        case OffsetMethod::ScaledInset:
            return "scaled_inset";
        }
        return "unknown";
    }

} // namespace siteplan
