#pragma once

#ifdef SITEPLAN_HAS_RERUN

#include <array>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "rerun.hpp"
#include <rerun/recording_stream.hpp>

#include "../plan.hpp"

namespace siteplan {
    namespace visualize {

        /**
         * @brief Flat (x, y, z) triples to a closed rerun strip
         */
        inline std::vector<std::array<float, 3>> to_strip(const std::vector<double> &flat) {
            std::vector<std::array<float, 3>> pts;
            for (std::size_t i = 0; i + 2 < flat.size(); i += 3) {
                pts.push_back({float(flat[i]), float(flat[i + 1]), float(flat[i + 2])});
            }
            // Close the ring if not already closed
            if (!pts.empty() && (pts.front()[0] != pts.back()[0] || pts.front()[1] != pts.back()[1] ||
                                 pts.front()[2] != pts.back()[2])) {
                pts.push_back(pts.front());
            }
            return pts;
        }

        inline void show_strip(std::shared_ptr<rerun::RecordingStream> rec, const std::string &path,
                               const std::vector<double> &flat, const rerun::Color &color, float radius = 0.2f) {
            rec->log_static(path, rerun::LineStrips3D(rerun::components::LineStrip3D(to_strip(flat)))
                                      .with_colors({{color}})
                                      .with_radii({{radius}}));
        }

        /**
         * @brief Log the site boundary, the setback and every floor ring of a generated plan
         */
        inline void show_layout(const PlanReport &report, std::shared_ptr<rerun::RecordingStream> rec) {
            const auto &layout = report.layout;

            for (std::size_t i = 0; i < layout.sub_site_vertices.size(); ++i) {
                std::cout << "Visualizing site boundary with " << layout.sub_site_vertices[i].size() / 3
                          << " points" << std::endl;
                show_strip(rec, "/site/boundary" + std::to_string(i), layout.sub_site_vertices[i],
                           rerun::Color(120, 70, 70));
            }

            for (std::size_t i = 0; i < layout.sub_site_setback_vertices.size(); ++i) {
                show_strip(rec, "/site/setback" + std::to_string(i), layout.sub_site_setback_vertices[i],
                           rerun::Color(70, 120, 70));
            }

            for (std::size_t b = 0; b < layout.building_layers_vertices.size(); ++b) {
                const auto &floors = layout.building_layers_vertices[b];
                for (std::size_t f = 0; f < floors.size(); ++f) {
                    show_strip(rec, "/buildings/b" + std::to_string(b) + "/floor" + std::to_string(f), floors[f],
                               rerun::Color(70, 70, 120), 0.1f);
                }
            }
        }

    } // namespace visualize
} // namespace siteplan

#endif
