#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "geotrax/areas.hpp"
#include "geotrax/config.hpp"
#include "geotrax/corridor.hpp"
#include "geotrax/enricher.hpp"
#include "geotrax/geocoder.hpp"
#include "geotrax/proximity.hpp"
#include "geotrax/router.hpp"
#include "geotrax/store.hpp"
#include "geotrax/track.hpp"

namespace geotrax {

    /**
     * @brief Corridor between two places
     *
     * start and end are place names or "lat,lon" pairs.
     */
    struct CorridorRequest {
        std::string start;
        std::string end;
        int buffer_meters = 5000;
        bool use_route = true;
        std::optional<std::string> save_as;
        bool list_matches = false;
    };

    struct TrackCorridorRequest {
        std::string track_bytes; ///< Raw GPX upload
        int buffer_meters = 5000;
        std::optional<std::string> save_as;
        bool list_matches = false;
    };

    struct CorridorResponse {
        std::string polygon_wkt;
        std::string route_wkt;
        Coordinate start;
        Coordinate end;
        int buffer_meters = 0;
        std::int64_t match_count = 0;
        std::optional<std::string> saved_area_id;
        bool straight_line = false; ///< Route unavailable (or not requested), straight line used
        std::vector<ListingPoint> matches;
    };

    /**
     * @brief Request-level entry point of the spatial engine
     *
     * Wires the components together from one Config. Errors surface as the
     * geotrax exception types; provider trouble is absorbed wherever a fallback
     * exists. One instance may serve requests from several threads.
     */
    class SpatialService {
        Config config_;
        PointStore &store_;
        Geocoder geocoder_;
        RouteProvider router_;
        ProximityIndex index_;
        CorridorBuilder corridor_;
        AreaRegistry areas_;
        BulkEnricher enricher_;

      public:
        SpatialService(const Config &config, PointStore &store, std::shared_ptr<GeocodingProvider> geocoding,
                       std::shared_ptr<RoutingProvider> routing, std::optional<RateLimiter> limiter = std::nullopt);

        // corridor_ and enricher_ refer to index_ and geocoder_ of this instance
        SpatialService(const SpatialService &) = delete;
        SpatialService &operator=(const SpatialService &) = delete;

        /**
         * @brief Resolve both places, route, buffer, count and optionally save
         *
         * @throws ValidationError on a bad buffer or a blank place
         * @throws NotFound naming the place that could not be resolved
         * @throws Cancelled if stop was requested
         */
        CorridorResponse build_corridor(const CorridorRequest &request, std::stop_token stop = {});

        /**
         * @throws TrackFormatError / EmptyTrackError naming the track problem
         * @throws ValidationError on a bad buffer
         */
        CorridorResponse build_corridor_from_track(const TrackCorridorRequest &request, std::stop_token stop = {});

        std::vector<ListingPoint> search(const SearchRequest &request);

        std::vector<ListingPoint> map_points(const ListingFilters &filters);

        EnrichReport bulk_geocode(int batch_size, std::stop_token stop = {});

        bool regeocode(std::int64_t listing_id);

        /// Active saved areas, newest first
        std::vector<SavedArea> list_areas();

        std::optional<SavedArea> get_area(const std::string &id);

        bool deactivate_area(const std::string &id);

        /// @throws NotFound if the address cannot be resolved
        GeocodeHit geocode(const std::string &address);

        GeocodeStats geocode_stats();

        const Config &config() const { return config_; }
        CorridorBuilder &corridor_builder() { return corridor_; }
        ProximityIndex &index() { return index_; }
        AreaRegistry &areas() { return areas_; }
    };

} // namespace geotrax
