#pragma once

#ifdef HAS_RERUN

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <rerun.hpp>
#include <rerun/archetypes/geo_line_strings.hpp>
#include <rerun/archetypes/geo_points.hpp>
#include <rerun/components/geo_line_string.hpp>
#include <rerun/components/lat_lon.hpp>
#include <rerun/recording_stream.hpp>

#include "../corridor.hpp"
#include "../types.hpp"

namespace geotrax {
    namespace visualize {

        inline rerun::LatLon to_latlon(const Coordinate &c) {
            return rerun::LatLon{float(c.latitude), float(c.longitude)};
        }

        /// Route or track as a map line
        inline void show_route(const GeoLine &line, std::shared_ptr<rerun::RecordingStream> rec,
                               const std::string &path = "/corridor/route") {
            std::vector<rerun::LatLon> pts;
            pts.reserve(line.size());
            for (const auto &c : line)
                pts.push_back(to_latlon(c));

            auto geo_line = rerun::components::GeoLineString::from_lat_lon(pts);
            rec->log_static(path, rerun::archetypes::GeoLineStrings(geo_line)
                                      .with_colors({{rerun::Color(70, 70, 120)}})
                                      .with_radii({{2.0f}}));
        }

        /// Outline (outer and inner rings) of a WGS84 area; rings are already closed
        inline void show_area(const BMultiPolygon &area, std::shared_ptr<rerun::RecordingStream> rec,
                              const std::string &path = "/corridor/area") {
            std::vector<rerun::components::GeoLineString> rings;
            auto add_ring = [&rings](const auto &ring) {
                std::vector<rerun::LatLon> pts;
                pts.reserve(ring.size());
                for (const auto &p : ring)
                    pts.push_back(rerun::LatLon{float(p.y()), float(p.x())});
                rings.push_back(rerun::components::GeoLineString::from_lat_lon(pts));
            };
            for (const auto &poly : area) {
                add_ring(poly.outer());
                for (const auto &inner : poly.inners())
                    add_ring(inner);
            }

            rec->log_static(path, rerun::archetypes::GeoLineStrings(rings)
                                      .with_colors({{rerun::Color(120, 70, 70)}})
                                      .with_radii({{1.0f}}));
        }

        inline void show_points(const std::vector<ListingPoint> &points, std::shared_ptr<rerun::RecordingStream> rec,
                                const std::string &path = "/corridor/matches") {
            std::vector<rerun::LatLon> pts;
            pts.reserve(points.size());
            for (const auto &p : points)
                pts.push_back(to_latlon(p.coordinate));

            rec->log_static(path, rerun::archetypes::GeoPoints::from_lat_lon(pts)
                                      .with_colors({{rerun::Color(70, 120, 70)}})
                                      .with_radii({{rerun::Radius::ui_points(6.0f)}}));
        }

        inline void show_corridor(const Corridor &corridor, std::shared_ptr<rerun::RecordingStream> rec) {
            std::cout << "Visualizing corridor: " << corridor.line.size() << " route points, "
                      << corridor.match_count << " matches" << std::endl;
            show_route(corridor.line, rec);
            show_area(corridor.polygon, rec);
            show_points(corridor.matches, rec);
        }

    } // namespace visualize
} // namespace geotrax

#endif
