#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace geotrax {

    /**
     * @brief WGS84 position in degrees
     *
     * Plain pairs are written lat-before-lon ("49.1234,16.5678"). Geometry text
     * is always lon-before-lat, see wkt.hpp.
     */
    struct Coordinate {
        double latitude = 0.0;
        double longitude = 0.0;

        bool operator==(const Coordinate &other) const {
            return latitude == other.latitude && longitude == other.longitude;
        }
        bool operator!=(const Coordinate &other) const { return !(*this == other); }
    };

    /// Ordered route or track in WGS84 degrees
    using GeoLine = std::vector<Coordinate>;

    /**
     * @brief Axis-aligned lat/lon rectangle
     */
    struct BoundingBox {
        double min_lat = 0.0;
        double min_lon = 0.0;
        double max_lat = 0.0;
        double max_lon = 0.0;

        bool contains(const Coordinate &c) const {
            return c.latitude >= min_lat && c.latitude <= max_lat && c.longitude >= min_lon &&
                   c.longitude <= max_lon;
        }
    };

    /**
     * @brief Where a listing coordinate came from
     */
    enum class GeocodeSource {
        None,             ///< No coordinate yet
        ExternalGeocoder, ///< Resolved by the bulk enricher
        Manual,           ///< Set by hand
        ProviderSupplied, ///< Delivered by the listing source at ingestion
    };

    std::string to_string(GeocodeSource source);
    GeocodeSource geocode_source_from_string(const std::string &text);

    /**
     * @brief Kind of a persisted area
     */
    enum class AreaType {
        Corridor,
        BBox,
        Polygon,
        TrackCorridor,
    };

    std::string to_string(AreaType type);
    AreaType area_type_from_string(const std::string &text);

    /**
     * @brief Map projection of a listing, the row shape every spatial query returns
     */
    struct ListingPoint {
        std::int64_t id = 0;
        std::string title;
        std::optional<double> price;
        std::string location_text;
        Coordinate coordinate;
        std::string property_type;
        std::string offer_type;
        std::optional<std::string> thumbnail_url;
        std::string source_code;
    };

    /**
     * @brief Ingestion shape of a listing
     *
     * Listings are owned by the listing subsystem; the store only needs enough of
     * them to keep the coordinate pool and the spatial filters working.
     */
    struct ListingRecord {
        std::string external_id;
        std::string title;
        std::optional<double> price;
        std::string location_text;
        std::string property_type;
        std::string offer_type;
        std::optional<std::string> thumbnail_url;
        std::string source_code;
        bool active = true;
        std::optional<Coordinate> coordinate; ///< Set when the source supplies it
        std::string first_seen_at;            ///< ISO-8601 UTC, now when empty
    };

    /**
     * @brief Per-listing geocoding state
     */
    struct GeocodeState {
        std::optional<Coordinate> coordinate;
        GeocodeSource source = GeocodeSource::None;
        std::optional<std::string> geocoded_at;
    };

    /**
     * @brief Named area persisted for reuse. Geometry never changes after insert.
     */
    struct SavedArea {
        std::string id;
        std::string name;
        std::optional<std::string> description;
        AreaType type = AreaType::Corridor;
        std::string geometry_wkt;
        std::optional<std::string> start_label;
        std::optional<std::string> end_label;
        std::optional<int> buffer_meters;
        bool active = true;
        std::string created_at;
        std::string updated_at;
    };

    /**
     * @brief Coordinate coverage of the listing pool
     */
    struct GeocodeStats {
        std::int64_t total = 0;
        std::int64_t with_coordinates = 0;
        std::int64_t active_without_coordinates = 0;
        std::int64_t from_provider = 0;
        std::int64_t from_geocoder = 0;
        std::int64_t manual = 0;
    };

} // namespace geotrax
