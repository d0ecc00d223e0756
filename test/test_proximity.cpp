#include "doctest/doctest.h"
#include "geotrax/errors.hpp"
#include "geotrax/proximity.hpp"
#include "geotrax/wkt.hpp"
#include "support.hpp"

#include <algorithm>
#include <set>

using namespace geotrax;

namespace {

    const char *kSquare = "POLYGON((16 49, 16 50, 17 50, 17 49, 16 49))";

    SearchRequest bbox_request(double min_lat, double min_lon, double max_lat, double max_lon) {
        SearchRequest r;
        r.min_lat = min_lat;
        r.min_lon = min_lon;
        r.max_lat = max_lat;
        r.max_lon = max_lon;
        return r;
    }

    std::vector<std::int64_t> ids_of(const std::vector<ListingPoint> &points) {
        std::vector<std::int64_t> ids;
        for (const auto &p : points)
            ids.push_back(p.id);
        return ids;
    }

    // n listings on a diagonal inside kSquare
    void fill_grid(PointStore &store, int n, const std::string &prefix = "grid-") {
        for (int i = 0; i < n; ++i) {
            const double t = 0.01 + 0.98 * i / n;
            store.insert_listing(testing::listing(prefix + std::to_string(i), Coordinate{49.0 + t, 16.0 + t}));
        }
    }

} // namespace

TEST_CASE("Exactly one spatial predicate") {
    SUBCASE("Both") {
        auto r = bbox_request(49, 16, 50, 17);
        r.polygon_wkt = kSquare;
        CHECK_THROWS_AS(make_predicate(r), ValidationError);
    }

    SUBCASE("Neither") { CHECK_THROWS_AS(make_predicate(SearchRequest{}), ValidationError); }

    SUBCASE("Partial bbox is not a bbox") {
        SearchRequest r;
        r.min_lat = 49.0;
        r.min_lon = 16.0;
        r.max_lat = 50.0;
        CHECK_THROWS_AS(make_predicate(r), ValidationError);
    }

    SUBCASE("Blank polygon is not a polygon") {
        SearchRequest r;
        r.polygon_wkt = "   ";
        CHECK_THROWS_AS(make_predicate(r), ValidationError);
    }

    SUBCASE("Inverted bbox") { CHECK_THROWS_AS(make_predicate(bbox_request(50, 16, 49, 17)), ValidationError); }

    SUBCASE("Malformed polygon") {
        SearchRequest r;
        r.polygon_wkt = "POLYGON((16 49, 16 50";
        CHECK_THROWS_AS(make_predicate(r), ValidationError);
    }

    SUBCASE("Polygon") {
        SearchRequest r;
        r.polygon_wkt = kSquare;
        auto p = make_predicate(r);
        REQUIRE(std::holds_alternative<PolygonIntersects>(p));
        CHECK(std::get<PolygonIntersects>(p).geometry_wkt == kSquare);
        CHECK(std::get<PolygonIntersects>(p).area.size() == 1);
    }

    SUBCASE("Bbox") {
        auto p = make_predicate(bbox_request(49, 16, 50, 17));
        REQUIRE(std::holds_alternative<BBoxOverlap>(p));
        CHECK(std::get<BBoxOverlap>(p).box.max_lon == 17.0);
    }
}

TEST_CASE("Spatial search") {
    PointStore store(testing::memory_store());
    const auto inside = store.insert_listing(testing::listing("inside", Coordinate{49.5, 16.5}));
    const auto edge = store.insert_listing(testing::listing("edge", Coordinate{49.5, 16.0}));
    const auto corner = store.insert_listing(testing::listing("corner", Coordinate{49.0, 16.0}));
    store.insert_listing(testing::listing("outside", Coordinate{48.5, 16.5}));
    store.insert_listing(testing::listing("swapped", Coordinate{16.5, 49.5}));
    store.insert_listing(testing::listing("pending", std::nullopt, "Brno"));
    const auto inactive = store.insert_listing(testing::listing("inactive", Coordinate{49.6, 16.6}));
    store.set_active(inactive, false);

    ProximityIndex index(store, SearchConfig{});

    SUBCASE("Polygon includes its boundary") {
        SearchRequest r;
        r.polygon_wkt = kSquare;
        CHECK(ids_of(index.search(r)) == std::vector<std::int64_t>{inside, edge, corner});
    }

    SUBCASE("Bbox includes its boundary") {
        CHECK(ids_of(index.search(bbox_request(49, 16, 50, 17))) == std::vector<std::int64_t>{inside, edge, corner});
    }

    SUBCASE("Multipolygon") {
        SearchRequest r;
        r.polygon_wkt = "MULTIPOLYGON(((16.4 49.4, 16.4 49.6, 16.6 49.6, 16.6 49.4, 16.4 49.4)),"
                        "((16.4 48.4, 16.4 48.6, 16.6 48.6, 16.6 48.4, 16.4 48.4)))";
        auto found = index.search(r);
        REQUIRE(found.size() == 2);
        CHECK(found[0].title == "Listing inside");
        CHECK(found[1].title == "Listing outside");
    }

    SUBCASE("Row shape") {
        auto found = index.search(bbox_request(49.4, 16.4, 49.6, 16.6));
        REQUIRE(found.size() == 1);
        const auto &p = found.front();
        CHECK(p.id == inside);
        CHECK(p.coordinate == Coordinate{49.5, 16.5});
        CHECK(p.property_type == "house");
        CHECK(p.offer_type == "sale");
        CHECK(p.source_code == "test");
        REQUIRE(p.price.has_value());
        CHECK(*p.price == 1000000.0);
        CHECK_FALSE(p.thumbnail_url.has_value());
    }
}

TEST_CASE("Attribute filters combine with the area") {
    PointStore store(testing::memory_store());
    auto cheap_flat = testing::listing("cheap-flat", Coordinate{49.5, 16.5});
    cheap_flat.property_type = "flat";
    cheap_flat.price = 2000000.0;
    auto rent = testing::listing("rent", Coordinate{49.5, 16.5});
    rent.offer_type = "rent";
    rent.price = 15000.0;
    auto big_house = testing::listing("big-house", Coordinate{49.5, 16.5});
    big_house.price = 9000000.0;
    auto unpriced = testing::listing("unpriced", Coordinate{49.5, 16.5});
    unpriced.price.reset();
    store.insert_listing(cheap_flat);
    store.insert_listing(rent);
    store.insert_listing(big_house);
    store.insert_listing(unpriced);

    ProximityIndex index(store, SearchConfig{});
    auto r = bbox_request(49, 16, 50, 17);
    auto titles = [&] {
        std::vector<std::string> out;
        for (const auto &p : index.search(r))
            out.push_back(p.title);
        return out;
    };

    CHECK(titles().size() == 4);

    r.filters.property_type = "flat";
    CHECK(titles() == std::vector<std::string>{"Listing cheap-flat"});

    r.filters = {};
    r.filters.offer_type = "rent";
    CHECK(titles() == std::vector<std::string>{"Listing rent"});

    r.filters = {};
    r.filters.min_price = 1000000.0;
    r.filters.max_price = 5000000.0;
    CHECK(titles() == std::vector<std::string>{"Listing cheap-flat"});

    r.filters = {};
    r.filters.max_price = 5000000.0;
    r.filters.offer_type = "sale";
    CHECK(titles() == std::vector<std::string>{"Listing cheap-flat"});
}

TEST_CASE("Paging") {
    PointStore store(testing::memory_store());
    fill_grid(store, 25);

    SearchConfig config;
    config.max_page_size = 10;
    ProximityIndex index(store, config);
    SearchRequest r;
    r.polygon_wkt = kSquare;

    SUBCASE("Pages are disjoint and tile the ordered result") {
        r.page_size = 5;
        r.page = 1;
        auto first = ids_of(index.search(r));
        r.page = 2;
        auto second = ids_of(index.search(r));
        REQUIRE(first.size() == 5);
        REQUIRE(second.size() == 5);

        std::set<std::int64_t> both(first.begin(), first.end());
        both.insert(second.begin(), second.end());
        CHECK(both.size() == 10);

        r.page = 1;
        r.page_size = 10;
        auto unpaged = ids_of(index.search(r));
        std::vector<std::int64_t> joined = first;
        joined.insert(joined.end(), second.begin(), second.end());
        CHECK(joined == unpaged);
        CHECK(std::is_sorted(unpaged.begin(), unpaged.end()));
    }

    SUBCASE("Past the end is empty") {
        r.page = 4;
        r.page_size = 10;
        CHECK(index.search(r).empty());
        r.page = 3;
        CHECK(index.search(r).size() == 5);
    }

    SUBCASE("Page size is clamped") {
        r.page_size = 1000;
        CHECK(index.search(r).size() == 10);
    }

    SUBCASE("Bad paging") {
        r.page = 0;
        CHECK_THROWS_AS(index.search(r), ValidationError);
        r.page = 1;
        r.page_size = 0;
        CHECK_THROWS_AS(index.search(r), ValidationError);
    }

    SUBCASE("Later inserts do not shift earlier pages") {
        r.page_size = 10;
        auto before = ids_of(index.search(r));
        fill_grid(store, 5, "late-");
        CHECK(ids_of(index.search(r)) == before);
    }
}

TEST_CASE("Map points and area counts") {
    PointStore store(testing::memory_store());
    fill_grid(store, 12);
    store.insert_listing(testing::listing("elsewhere", Coordinate{50.5, 14.5}));
    store.insert_listing(testing::listing("pending", std::nullopt, "Praha"));

    SearchConfig config;
    config.map_points_limit = 8;
    ProximityIndex index(store, config);

    SUBCASE("Capped") { CHECK(index.all_points({}).size() == 8); }

    SUBCASE("Filtered") {
        ListingFilters f;
        f.property_type = "flat";
        CHECK(index.all_points(f).empty());
    }

    SUBCASE("Count and list in one") {
        auto area = wkt::parse_area(kSquare);
        CHECK(index.count_within(area) == 12);

        auto within = index.list_within(area, 3);
        CHECK(within.count == 12);
        CHECK(within.points.size() == 3);

        auto capped = index.list_within(area);
        CHECK(capped.count == 12);
        CHECK(capped.points.size() == 8);
    }

    SUBCASE("Empty area") {
        auto area = wkt::parse_area("POLYGON((10 40, 10 41, 11 41, 11 40, 10 40))");
        CHECK(index.count_within(area) == 0);
        auto within = index.list_within(area);
        CHECK(within.count == 0);
        CHECK(within.points.empty());
    }
}
