#pragma once

#include <cstddef>
#include <string>

#include "geotrax/types.hpp"

namespace geotrax {

    /**
     * @brief Route line read from a GPS track
     */
    struct TrackParseResult {
        GeoLine line; ///< Points in file order
        Coordinate start;
        Coordinate end;
        std::size_t point_count = 0;
        std::string name; ///< <name> of the track/route if present
    };

    /**
     * @brief Parse GPX bytes into a route line
     *
     * Track points are preferred, then route points, then waypoints; the first
     * kind with at least two usable points wins. Points with a missing or
     * out-of-range lat/lon are skipped. The parser never touches the network.
     *
     * @throws TrackFormatError if the bytes are not XML or the root is not <gpx>
     * @throws EmptyTrackError if fewer than two usable points remain
     */
    TrackParseResult parse_track(const std::string &bytes);

    /**
     * @brief Read a GPX file and parse it
     *
     * @throws TrackFormatError if the file cannot be read, plus everything parse_track() throws
     */
    TrackParseResult parse_track_file(const std::string &path);

} // namespace geotrax
