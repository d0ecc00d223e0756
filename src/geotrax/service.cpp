#include "geotrax/service.hpp"
#include "geotrax/errors.hpp"
#include "geotrax/utils/utils.hpp"
#include "geotrax/wkt.hpp"

#include <iostream>

namespace geotrax {

    namespace {

        void check_stop(const std::stop_token &stop, const char *what) {
            if (stop.stop_requested())
                throw Cancelled(std::string("corridor build cancelled before ") + what);
        }

        CorridorResponse to_response(Corridor corridor) {
            CorridorResponse response;
            response.polygon_wkt = std::move(corridor.polygon_wkt);
            response.route_wkt = wkt::line(corridor.line);
            response.start = corridor.line.front();
            response.end = corridor.line.back();
            response.buffer_meters = corridor.buffer_meters;
            response.match_count = corridor.match_count;
            response.matches = std::move(corridor.matches);
            return response;
        }

    } // namespace

    SpatialService::SpatialService(const Config &config, PointStore &store,
                                   std::shared_ptr<GeocodingProvider> geocoding,
                                   std::shared_ptr<RoutingProvider> routing, std::optional<RateLimiter> limiter)
        : config_(config), store_(store), geocoder_(std::move(geocoding)), router_(std::move(routing)),
          index_(store, config.search), corridor_(config.corridor, index_), areas_(store),
          enricher_(store, geocoder_, config.enrich,
                    limiter ? std::move(*limiter) : RateLimiter(config.enrich.min_request_interval)) {}

    CorridorResponse SpatialService::build_corridor(const CorridorRequest &request, std::stop_token stop) {
        corridor_.validate_buffer(request.buffer_meters);
        if (utils::is_blank(request.start))
            throw ValidationError("missing parameter: start location");
        if (utils::is_blank(request.end))
            throw ValidationError("missing parameter: end location");

        check_stop(stop, "geocoding");
        auto start = geocoder_.resolve(request.start);
        if (!start)
            throw NotFound("cannot resolve start location '" + request.start + "'", request.start);

        check_stop(stop, "geocoding");
        auto end = geocoder_.resolve(request.end);
        if (!end)
            throw NotFound("cannot resolve end location '" + request.end + "'", request.end);

        GeoLine line;
        bool straight = true;
        if (request.use_route) {
            check_stop(stop, "routing");
            if (auto route = router_.get_route(*start, *end)) {
                line = std::move(*route);
                straight = false;
            }
        }
        if (straight)
            line = straight_line(*start, *end);

        CorridorOptions options;
        options.list_matches = request.list_matches;
        auto response = to_response(corridor_.build_corridor_from_line(line, request.buffer_meters, options, stop));
        // The route may start/end on the nearest road; report what was resolved
        response.start = *start;
        response.end = *end;
        response.straight_line = straight;

        if (request.save_as && !utils::is_blank(*request.save_as)) {
            AreaMetadata meta;
            meta.start_label = request.start;
            meta.end_label = request.end;
            meta.buffer_meters = request.buffer_meters;
            response.saved_area_id = areas_.save_area(*request.save_as, response.polygon_wkt, AreaType::Corridor, meta);
        }

        std::clog << "Corridor " << request.start << " -> " << request.end << " (" << request.buffer_meters
                  << " m" << (straight ? ", straight line" : "") << "): " << response.match_count << " matches"
                  << std::endl;
        return response;
    }

    CorridorResponse SpatialService::build_corridor_from_track(const TrackCorridorRequest &request,
                                                               std::stop_token stop) {
        corridor_.validate_buffer(request.buffer_meters);

        TrackParseResult track;
        try {
            track = parse_track(request.track_bytes);
        } catch (const EmptyTrackError &e) {
            throw EmptyTrackError(std::string("cannot build corridor from track: ") + e.what());
        } catch (const TrackFormatError &e) {
            throw TrackFormatError(std::string("cannot build corridor from track: ") + e.what());
        }

        CorridorOptions options;
        options.list_matches = request.list_matches;
        auto response =
            to_response(corridor_.build_corridor_from_line(track.line, request.buffer_meters, options, stop));

        if (request.save_as && !utils::is_blank(*request.save_as)) {
            AreaMetadata meta;
            if (!track.name.empty())
                meta.description = track.name;
            meta.start_label = wkt::format_pair(track.start);
            meta.end_label = wkt::format_pair(track.end);
            meta.buffer_meters = request.buffer_meters;
            response.saved_area_id =
                areas_.save_area(*request.save_as, response.polygon_wkt, AreaType::TrackCorridor, meta);
        }
        return response;
    }

    std::vector<ListingPoint> SpatialService::search(const SearchRequest &request) { return index_.search(request); }

    std::vector<ListingPoint> SpatialService::map_points(const ListingFilters &filters) {
        return index_.all_points(filters);
    }

    EnrichReport SpatialService::bulk_geocode(int batch_size, std::stop_token stop) {
        return enricher_.enrich_batch(batch_size, stop);
    }

    bool SpatialService::regeocode(std::int64_t listing_id) { return enricher_.regeocode(listing_id); }

    std::vector<SavedArea> SpatialService::list_areas() { return areas_.list_areas(true); }

    std::optional<SavedArea> SpatialService::get_area(const std::string &id) { return areas_.get_area(id); }

    bool SpatialService::deactivate_area(const std::string &id) { return areas_.deactivate_area(id); }

    GeocodeHit SpatialService::geocode(const std::string &address) {
        if (utils::is_blank(address))
            throw ValidationError("missing parameter: address");
        auto hit = geocoder_.lookup(address);
        if (!hit)
            throw NotFound("cannot resolve address '" + address + "'", address);
        return *hit;
    }

    GeocodeStats SpatialService::geocode_stats() { return store_.stats(); }

} // namespace geotrax
