#include "siteplan/site.hpp"

#include <stdexcept>

namespace siteplan {

    SiteRecord make_site(const std::vector<double> &vertices, double tolerance) {
        SiteRecord site;
        site.boundary = Polyline::from_flat(vertices);
        if (site.boundary.size() < 3) {
            throw std::invalid_argument("at least 3 vertices (9 values) required");
        }

        if (!site.boundary.make_closed(tolerance)) {
            site.boundary.close(tolerance);
            site.reclosed = true;
        }

        site.area = site.boundary.get_area(tolerance);
        site.main_orientation = site.boundary.get_main_orientation();
        site.bounds = site.boundary.get_bounding_box();
        return site;
    }

} // namespace siteplan
