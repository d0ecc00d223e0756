#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "geotrax/config.hpp"
#include "geotrax/geometry/types.hpp"
#include "geotrax/store.hpp"
#include "geotrax/types.hpp"

namespace geotrax {

    /**
     * @brief Points inside or on a polygon area
     *
     * The text is parsed once when the predicate is made; the parsed area is
     * what the query binds.
     */
    struct PolygonIntersects {
        std::string geometry_wkt;
        BMultiPolygon area;

        /// @throws ValidationError on unparseable geometry text
        static PolygonIntersects from_text(const std::string &wkt);
    };

    /// Points inside or on a lat/lon rectangle
    struct BBoxOverlap {
        BoundingBox box;
    };

    using SpatialPredicate = std::variant<PolygonIntersects, BBoxOverlap>;

    /**
     * @brief Attribute filters, AND-combined with the spatial predicate
     */
    struct ListingFilters {
        std::optional<std::string> property_type;
        std::optional<std::string> offer_type;
        std::optional<double> min_price;
        std::optional<double> max_price;
    };

    /**
     * @brief Proximity search request as callers send it
     *
     * Exactly one of polygon_wkt and the four bbox bounds must be supplied. A
     * bbox with some bounds missing counts as not supplied.
     */
    struct SearchRequest {
        std::optional<std::string> polygon_wkt;
        std::optional<double> min_lat;
        std::optional<double> min_lon;
        std::optional<double> max_lat;
        std::optional<double> max_lon;
        ListingFilters filters;
        int page = 1;
        int page_size = 50;
    };

    /**
     * @brief Pick the spatial predicate of a request
     *
     * @throws ValidationError if both or neither predicate is supplied, the
     *         polygon text is malformed or the bbox is inverted
     */
    SpatialPredicate make_predicate(const SearchRequest &request);

    /// Count and (capped) list of points inside an area
    struct WithinResult {
        std::int64_t count = 0;
        std::vector<ListingPoint> points;
    };

    /**
     * @brief Spatial queries over active listings that have a coordinate
     *
     * Results are ordered by listing id. Ids only grow, so a page never shifts
     * when listings are inserted later.
     */
    class ProximityIndex {
        PointStore &store_;
        SearchConfig config_;

      public:
        ProximityIndex(PointStore &store, SearchConfig config);

        /**
         * @brief One page of listings matching the predicate and filters
         *
         * @param page 1-based page number
         * @param page_size Rows per page, clamped to the configured maximum
         * @throws ValidationError if page or page_size is below 1
         */
        std::vector<ListingPoint> search_in_area(const SpatialPredicate &predicate, const ListingFilters &filters,
                                                 int page, int page_size);

        /// make_predicate() followed by search_in_area()
        std::vector<ListingPoint> search(const SearchRequest &request);

        /// Every matching point, no spatial predicate, hard-capped for map rendering
        std::vector<ListingPoint> all_points(const ListingFilters &filters);

        /// Number of points inside or on the area, one statement
        std::int64_t count_within(const BMultiPolygon &area);

        /**
         * @brief Points inside or on the area with their total count, one statement
         *
         * @param limit Maximum rows listed (count is never capped); <= 0 means the map limit
         */
        WithinResult list_within(const BMultiPolygon &area, int limit = 0);

        const SearchConfig &config() const { return config_; }
    };

} // namespace geotrax
