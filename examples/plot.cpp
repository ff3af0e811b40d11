#include <iostream>
#include <memory>
#include <vector>

#include "rerun.hpp"
#include "rerun/recording_stream.hpp"

#include "siteplan/plan.hpp"
#include "siteplan/utils/visualize.hpp"

int main() {
    auto rec = std::make_shared<rerun::RecordingStream>("siteplan", "space");
    if (rec->connect_grpc("rerun+http://0.0.0.0:9876/proxy").is_err()) {
        std::cerr << "Failed to connect to rerun\n";
        return 1;
    }

    // L-shaped site
    std::vector<double> site = {
        0.0,   0.0,   0.0, //
        180.0, 0.0,   0.0, //
        180.0, 60.0,  0.0, //
        80.0,  60.0,  0.0, //
        80.0,  140.0, 0.0, //
        0.0,   140.0, 0.0, //
        0.0,   0.0,   0.0, //
    };

    siteplan::PlanOverrides overrides;
    overrides.density = 0.8;
    overrides.far = 3.0;
    overrides.building_style = static_cast<int>(siteplan::BuildingStyle::Mixed);

    siteplan::PlanConfig config;
    config.verbose = true;

    auto report = siteplan::generate_plan(site, overrides, config);
    if (!report.ok()) {
        std::cerr << "Plan failed: " << report.message << "\n";
        return 1;
    }

    std::cout << "Placed " << report.design.num_buildings() << " buildings with "
              << report.design.floors_per_building << " floors each\n";

    siteplan::visualize::show_layout(report, rec);
    return 0;
}
