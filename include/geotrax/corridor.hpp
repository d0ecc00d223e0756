#pragma once

#include <cstdint>
#include <stop_token>
#include <string>
#include <vector>

#include "geotrax/config.hpp"
#include "geotrax/geometry/types.hpp"
#include "geotrax/projection.hpp"
#include "geotrax/proximity.hpp"
#include "geotrax/types.hpp"

namespace geotrax {

    struct CorridorOptions {
        bool list_matches = false; ///< Also return the matching listings
        int list_limit = 0;        ///< Cap on listed matches, <= 0 for the map limit
    };

    /**
     * @brief Buffered route and the listings inside it
     */
    struct Corridor {
        GeoLine line;
        BMultiPolygon polygon; ///< WGS84, x = lon, y = lat
        std::string polygon_wkt;
        int buffer_meters = 0;
        std::int64_t match_count = 0;
        std::vector<ListingPoint> matches; ///< Filled only with CorridorOptions::list_matches
    };

    /**
     * @brief Route line -> search polygon -> matching listings
     *
     * The line is buffered in the fixed metric frame of MetricProjection, never
     * in degrees, then projected back. Matching runs as a single statement with
     * the polygon bound in memory.
     */
    class CorridorBuilder {
        CorridorConfig config_;
        MetricProjection projection_;
        ProximityIndex &index_;

      public:
        CorridorBuilder(CorridorConfig config, ProximityIndex &index);

        /// @throws ValidationError unless buffer_meters is within the configured bounds
        void validate_buffer(int buffer_meters) const;

        /**
         * @brief Buffer a geographic line, no store access
         *
         * @return Corridor polygon in WGS84
         * @throws ValidationError on a bad buffer, fewer than two points or out-of-range points
         */
        BMultiPolygon buffer(const GeoLine &line, int buffer_meters) const;

        /**
         * @brief Build a corridor from LINESTRING text
         *
         * @throws ValidationError on malformed text or a bad buffer
         * @throws Cancelled if a stop was requested before the store round trip
         */
        Corridor build_corridor(const std::string &line_wkt, int buffer_meters, const CorridorOptions &options = {},
                                std::stop_token stop = {});

        /// Same as build_corridor() for a line the caller already has (e.g. a GPS track)
        Corridor build_corridor_from_line(const GeoLine &line, int buffer_meters,
                                          const CorridorOptions &options = {}, std::stop_token stop = {});

        /// Area of a WGS84 polygon in square metres, measured in the metric frame
        double metric_area(const BMultiPolygon &polygon) const;

        const MetricProjection &projection() const { return projection_; }
        const CorridorConfig &config() const { return config_; }
    };

} // namespace geotrax
