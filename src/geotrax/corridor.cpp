#include "geotrax/corridor.hpp"
#include "geotrax/errors.hpp"
#include "geotrax/geometry/buffer.hpp"
#include "geotrax/utils/utils.hpp"
#include "geotrax/wkt.hpp"

namespace geotrax {

    CorridorBuilder::CorridorBuilder(CorridorConfig config, ProximityIndex &index)
        : config_(config), projection_(config.datum), index_(index) {}

    void CorridorBuilder::validate_buffer(int buffer_meters) const {
        if (buffer_meters < config_.min_buffer_meters || buffer_meters > config_.max_buffer_meters)
            throw ValidationError("buffer_meters must be between " + std::to_string(config_.min_buffer_meters) +
                                  " and " + std::to_string(config_.max_buffer_meters) + ", got " +
                                  std::to_string(buffer_meters));
    }

    BMultiPolygon CorridorBuilder::buffer(const GeoLine &line, int buffer_meters) const {
        validate_buffer(buffer_meters);
        if (line.size() < 2)
            throw ValidationError("corridor line needs at least two points");
        for (const auto &c : line) {
            if (!utils::in_range(c))
                throw ValidationError("corridor line point " + wkt::format_pair(c) + " is out of range");
        }

        BLineString metric = projection_.forward(line);
        BMultiPolygon buffered = geometry::buffer_line(metric, buffer_meters, config_.points_per_circle);
        if (buffered.empty())
            throw Error("buffering the corridor line produced no polygon");

        return projection_.inverse(buffered);
    }

    Corridor CorridorBuilder::build_corridor(const std::string &line_wkt, int buffer_meters,
                                             const CorridorOptions &options, std::stop_token stop) {
        validate_buffer(buffer_meters);
        return build_corridor_from_line(wkt::parse_line(line_wkt), buffer_meters, options, stop);
    }

    Corridor CorridorBuilder::build_corridor_from_line(const GeoLine &line, int buffer_meters,
                                                       const CorridorOptions &options, std::stop_token stop) {
        Corridor corridor;
        corridor.line = line;
        corridor.buffer_meters = buffer_meters;
        corridor.polygon = buffer(line, buffer_meters);
        corridor.polygon_wkt = wkt::area(corridor.polygon);

        if (stop.stop_requested())
            throw Cancelled("corridor build cancelled");

        if (options.list_matches) {
            auto within = index_.list_within(corridor.polygon, options.list_limit);
            corridor.match_count = within.count;
            corridor.matches = std::move(within.points);
        } else {
            corridor.match_count = index_.count_within(corridor.polygon);
        }
        return corridor;
    }

    double CorridorBuilder::metric_area(const BMultiPolygon &polygon) const {
        BMultiPolygon metric;
        metric.reserve(polygon.size());
        for (const auto &poly : polygon)
            metric.push_back(projection_.forward(poly));
        return geometry::area(metric);
    }

} // namespace geotrax
