#pragma once

#include <optional>
#include <string>

#include "geotrax/geometry/types.hpp"
#include "geotrax/types.hpp"

namespace geotrax {

    /**
     * @brief Geometry text (WKT) encoding used between components and the store
     *
     * Geometry text is lon-before-lat: POINT(16.5678 49.1234). Plain coordinate
     * pairs are lat-before-lon: "49.1234,16.5678". Mixing the two up silently
     * mirrors every point across the diagonal, so keep conversions in here.
     */
    namespace wkt {

        /// "lat,lon"
        std::string format_pair(const Coordinate &c);

        /**
         * @brief Parse a "lat,lon" pair
         *
         * Both halves must be complete decimal numbers and within WGS84 range,
         * otherwise nullopt. Whitespace around either half is allowed.
         */
        std::optional<Coordinate> parse_pair(const std::string &text);

        std::string point(const Coordinate &c);
        std::string line(const GeoLine &line);
        std::string polygon(const BPolygon &poly);

        /// POLYGON for a single part, MULTIPOLYGON otherwise
        std::string area(const BMultiPolygon &area);

        /// Closed rectangle ring of a bounding box
        std::string bbox(const BoundingBox &box);

        /**
         * @brief Parse LINESTRING text into an ordered coordinate list
         *
         * @throws ValidationError on malformed text or fewer than two points
         */
        GeoLine parse_line(const std::string &text);

        /**
         * @brief Parse POLYGON or MULTIPOLYGON text; rings are closed and oriented
         *
         * @throws ValidationError on malformed or empty geometry
         */
        BMultiPolygon parse_area(const std::string &text);

        BLineString to_boost(const GeoLine &line);
        GeoLine from_boost(const BLineString &line);

    } // namespace wkt

} // namespace geotrax
