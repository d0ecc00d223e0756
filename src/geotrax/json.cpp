#include "geotrax/json.hpp"
#include "geotrax/errors.hpp"

namespace geotrax {

    namespace {

        template <typename T> nlohmann::json optional_json(const std::optional<T> &v) {
            if (!v)
                return nullptr;
            return *v;
        }

    } // namespace

    void to_json(nlohmann::json &j, const Coordinate &c) {
        j = nlohmann::json{{"latitude", c.latitude}, {"longitude", c.longitude}};
    }

    void to_json(nlohmann::json &j, const ListingPoint &p) {
        j = nlohmann::json{{"id", p.id},
                           {"title", p.title},
                           {"price", optional_json(p.price)},
                           {"location_text", p.location_text},
                           {"latitude", p.coordinate.latitude},
                           {"longitude", p.coordinate.longitude},
                           {"property_type", p.property_type},
                           {"offer_type", p.offer_type},
                           {"thumbnail_url", optional_json(p.thumbnail_url)},
                           {"source_code", p.source_code}};
    }

    void to_json(nlohmann::json &j, const SavedArea &a) {
        j = nlohmann::json{{"id", a.id},
                           {"name", a.name},
                           {"description", optional_json(a.description)},
                           {"area_type", to_string(a.type)},
                           {"geometry_wkt", a.geometry_wkt},
                           {"start_label", optional_json(a.start_label)},
                           {"end_label", optional_json(a.end_label)},
                           {"buffer_meters", optional_json(a.buffer_meters)},
                           {"is_active", a.active},
                           {"created_at", a.created_at},
                           {"updated_at", a.updated_at}};
    }

    void to_json(nlohmann::json &j, const GeocodeStats &s) {
        j = nlohmann::json{{"total", s.total},
                           {"with_coordinates", s.with_coordinates},
                           {"active_without_coordinates", s.active_without_coordinates},
                           {"from_provider", s.from_provider},
                           {"from_geocoder", s.from_geocoder},
                           {"manual", s.manual}};
    }

    void to_json(nlohmann::json &j, const GeocodeHit &h) {
        j = nlohmann::json{{"latitude", h.coordinate.latitude},
                           {"longitude", h.coordinate.longitude},
                           {"display_name", h.display_name}};
    }

    void to_json(nlohmann::json &j, const EnrichReport &r) {
        j = nlohmann::json{{"attempted", r.attempted},
                           {"succeeded", r.succeeded},
                           {"failed", r.failed},
                           {"remaining", r.remaining},
                           {"avg_latency_ms", r.avg_latency_ms},
                           {"cancelled", r.cancelled}};
    }

    void to_json(nlohmann::json &j, const CorridorResponse &r) {
        j = nlohmann::json{{"polygon_wkt", r.polygon_wkt},
                           {"route_wkt", r.route_wkt},
                           {"start", r.start},
                           {"end", r.end},
                           {"buffer_meters", r.buffer_meters},
                           {"match_count", r.match_count},
                           {"saved_area_id", optional_json(r.saved_area_id)},
                           {"straight_line", r.straight_line}};
        if (!r.matches.empty())
            j["matches"] = r.matches;
    }

    ListingRecord listing_from_json(const nlohmann::json &j) {
        if (!j.is_object())
            throw ValidationError("listing must be a JSON object");

        try {
            ListingRecord rec;
            rec.external_id = j.at("external_id").get<std::string>();
            rec.title = j.at("title").get<std::string>();
            if (j.contains("price") && !j["price"].is_null())
                rec.price = j["price"].get<double>();
            rec.location_text = j.value("location_text", std::string{});
            rec.property_type = j.value("property_type", std::string{});
            rec.offer_type = j.value("offer_type", std::string{});
            if (j.contains("thumbnail_url") && !j["thumbnail_url"].is_null())
                rec.thumbnail_url = j["thumbnail_url"].get<std::string>();
            rec.source_code = j.value("source_code", std::string{});
            rec.active = j.value("is_active", true);
            rec.first_seen_at = j.value("first_seen_at", std::string{});

            const bool has_lat = j.contains("latitude") && !j["latitude"].is_null();
            const bool has_lon = j.contains("longitude") && !j["longitude"].is_null();
            if (has_lat != has_lon)
                throw ValidationError("listing '" + rec.external_id + "' has only one of latitude/longitude");
            if (has_lat)
                rec.coordinate = Coordinate{j["latitude"].get<double>(), j["longitude"].get<double>()};
            return rec;
        } catch (const nlohmann::json::exception &e) {
            throw ValidationError(std::string("bad listing record: ") + e.what());
        }
    }

} // namespace geotrax
