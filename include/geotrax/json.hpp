#pragma once

#include <nlohmann/json.hpp>

#include "geotrax/enricher.hpp"
#include "geotrax/geocoder.hpp"
#include "geotrax/service.hpp"
#include "geotrax/types.hpp"

namespace geotrax {

    // Response shapes of the command-line tool. Coordinates are written as
    // {"latitude": .., "longitude": ..} objects, geometry as WKT strings.

    void to_json(nlohmann::json &j, const Coordinate &c);
    void to_json(nlohmann::json &j, const ListingPoint &p);
    void to_json(nlohmann::json &j, const SavedArea &a);
    void to_json(nlohmann::json &j, const GeocodeStats &s);
    void to_json(nlohmann::json &j, const GeocodeHit &h);
    void to_json(nlohmann::json &j, const EnrichReport &r);
    void to_json(nlohmann::json &j, const CorridorResponse &r);

    /**
     * @brief Listing ingestion record from JSON
     *
     * Required: external_id, title. Optional latitude/longitude pair becomes the
     * provider-supplied coordinate.
     *
     * @throws ValidationError on missing or mistyped fields
     */
    ListingRecord listing_from_json(const nlohmann::json &j);

} // namespace geotrax
