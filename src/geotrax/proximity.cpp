#include "geotrax/proximity.hpp"
#include "geotrax/errors.hpp"
#include "geotrax/utils/utils.hpp"
#include "geotrax/wkt.hpp"

#include <algorithm>

namespace geotrax {

    namespace {

        const char *kPointColumns = "id, title, price, location_text, latitude, longitude, property_type, offer_type, "
                                    "thumbnail_url, source_code";

        const char *kPointBase = " FROM listings WHERE is_active = 1 AND latitude IS NOT NULL AND longitude IS NOT NULL";

        ListingPoint to_point(const SqlRow &row) {
            ListingPoint p;
            p.id = sql::as_int(row[0]);
            p.title = sql::as_text(row[1]);
            p.price = sql::as_optional_double(row[2]);
            p.location_text = sql::as_text(row[3]);
            p.coordinate = Coordinate{sql::as_double(row[4]), sql::as_double(row[5])};
            p.property_type = sql::as_text(row[6]);
            p.offer_type = sql::as_text(row[7]);
            p.thumbnail_url = sql::as_optional_text(row[8]);
            p.source_code = sql::as_text(row[9]);
            return p;
        }

        // Only bind placeholders are appended to the SQL; values go to params
        void append_filters(std::string &query, std::vector<SqlValue> &params, const ListingFilters &filters) {
            if (filters.property_type) {
                query += " AND property_type = ?";
                params.emplace_back(*filters.property_type);
            }
            if (filters.offer_type) {
                query += " AND offer_type = ?";
                params.emplace_back(*filters.offer_type);
            }
            if (filters.min_price) {
                query += " AND price >= ?";
                params.emplace_back(*filters.min_price);
            }
            if (filters.max_price) {
                query += " AND price <= ?";
                params.emplace_back(*filters.max_price);
            }
        }

        void append_box(std::string &query, std::vector<SqlValue> &params, const BoundingBox &box) {
            query += " AND latitude BETWEEN ? AND ? AND longitude BETWEEN ? AND ?";
            params.emplace_back(box.min_lat);
            params.emplace_back(box.max_lat);
            params.emplace_back(box.min_lon);
            params.emplace_back(box.max_lon);
        }

        // Envelope prefilter lets the coordinate index drop most rows before geo_within runs
        void append_area(std::string &query, std::vector<SqlValue> &params, const BMultiPolygon &area) {
            append_box(query, params, utils::envelope(area));
            query += " AND geo_within(?, longitude, latitude) = 1";
            params.emplace_back(AreaRef{&area});
        }

        void append_predicate(std::string &query, std::vector<SqlValue> &params, const SpatialPredicate &predicate) {
            std::visit(
                [&](const auto &p) {
                    using T = std::decay_t<decltype(p)>;
                    if constexpr (std::is_same_v<T, PolygonIntersects>)
                        append_area(query, params, p.area);
                    else
                        append_box(query, params, p.box);
                },
                predicate);
        }

        std::vector<ListingPoint> to_points(const std::vector<SqlRow> &rows) {
            std::vector<ListingPoint> out;
            out.reserve(rows.size());
            for (const auto &row : rows)
                out.push_back(to_point(row));
            return out;
        }

    } // namespace

    PolygonIntersects PolygonIntersects::from_text(const std::string &text) {
        return PolygonIntersects{text, wkt::parse_area(text)};
    }

    SpatialPredicate make_predicate(const SearchRequest &request) {
        const bool has_polygon = request.polygon_wkt && !utils::is_blank(*request.polygon_wkt);
        const bool has_bbox = request.min_lat && request.min_lon && request.max_lat && request.max_lon;

        if (has_polygon && has_bbox)
            throw ValidationError("supply either polygon or bbox (min_lat, min_lon, max_lat, max_lon), not both");
        if (!has_polygon && !has_bbox)
            throw ValidationError("missing spatial predicate: supply polygon or bbox (min_lat, min_lon, max_lat, "
                                  "max_lon)");

        if (has_polygon)
            return PolygonIntersects::from_text(*request.polygon_wkt);

        BoundingBox box{*request.min_lat, *request.min_lon, *request.max_lat, *request.max_lon};
        if (box.min_lat > box.max_lat || box.min_lon > box.max_lon)
            throw ValidationError("bbox minimum exceeds maximum");
        return BBoxOverlap{box};
    }

    ProximityIndex::ProximityIndex(PointStore &store, SearchConfig config) : store_(store), config_(config) {}

    std::vector<ListingPoint> ProximityIndex::search_in_area(const SpatialPredicate &predicate,
                                                             const ListingFilters &filters, int page, int page_size) {
        if (page < 1)
            throw ValidationError("page must be at least 1");
        if (page_size < 1)
            throw ValidationError("page_size must be at least 1");
        page_size = std::min(page_size, config_.max_page_size);

        std::string query = std::string("SELECT ") + kPointColumns + kPointBase;
        std::vector<SqlValue> params;
        append_predicate(query, params, predicate);
        append_filters(query, params, filters);
        query += " ORDER BY id ASC LIMIT ? OFFSET ?";
        params.emplace_back(std::int64_t{page_size});
        params.emplace_back(static_cast<std::int64_t>(page - 1) * page_size);

        return to_points(store_.db().query(query, params));
    }

    std::vector<ListingPoint> ProximityIndex::search(const SearchRequest &request) {
        return search_in_area(make_predicate(request), request.filters, request.page, request.page_size);
    }

    std::vector<ListingPoint> ProximityIndex::all_points(const ListingFilters &filters) {
        std::string query = std::string("SELECT ") + kPointColumns + kPointBase;
        std::vector<SqlValue> params;
        append_filters(query, params, filters);
        query += " ORDER BY id ASC LIMIT ?";
        params.emplace_back(std::int64_t{config_.map_points_limit});
        return to_points(store_.db().query(query, params));
    }

    std::int64_t ProximityIndex::count_within(const BMultiPolygon &area) {
        std::string query = std::string("SELECT COUNT(*)") + kPointBase;
        std::vector<SqlValue> params;
        append_area(query, params, area);
        auto rows = store_.db().query(query, params);
        return rows.empty() ? 0 : sql::as_int(rows.front()[0]);
    }

    WithinResult ProximityIndex::list_within(const BMultiPolygon &area, int limit) {
        if (limit <= 0)
            limit = config_.map_points_limit;

        // The window count is taken before LIMIT, so it stays the full match count
        std::string query = std::string("SELECT ") + kPointColumns + ", COUNT(*) OVER ()" + kPointBase;
        std::vector<SqlValue> params;
        append_area(query, params, area);
        query += " ORDER BY id ASC LIMIT ?";
        params.emplace_back(std::int64_t{limit});

        auto rows = store_.db().query(query, params);
        WithinResult result;
        if (!rows.empty())
            result.count = sql::as_int(rows.front()[10]);
        result.points = to_points(rows);
        return result;
    }

} // namespace geotrax
