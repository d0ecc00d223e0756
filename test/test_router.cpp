#include "doctest/doctest.h"
#include "geotrax/router.hpp"
#include "support.hpp"

using namespace geotrax;

TEST_CASE("OSRM request is lon,lat") {
    auto http = std::make_shared<testing::FakeHttpClient>();
    RouterConfig config;
    config.base_url = "https://route.example";
    OsrmProvider provider(config, http);

    auto url = provider.route_url(Coordinate{49.1951, 16.6068}, Coordinate{48.8555, 16.0488});
    CHECK(url == "https://route.example/route/v1/driving/16.6068,49.1951;16.0488,48.8555"
                 "?geometries=geojson&overview=full");
}

TEST_CASE("OSRM response") {
    auto http = std::make_shared<testing::FakeHttpClient>();
    OsrmProvider provider(RouterConfig{}, http);
    const Coordinate brno{49.1951, 16.6068};
    const Coordinate znojmo{48.8555, 16.0488};

    SUBCASE("GeoJSON positions are re-ordered to lat,lon") {
        http->response = {200, R"({"code": "Ok", "routes": [{"geometry": {"type": "LineString",
            "coordinates": [[16.6068, 49.1951], [16.3, 49.0], [16.0488, 48.8555]]}}]})"};
        auto line = provider.route(brno, znojmo);
        REQUIRE(line.size() == 3);
        CHECK(line[0] == brno);
        CHECK(line[1] == Coordinate{49.0, 16.3});
        CHECK(line[2] == znojmo);
        REQUIRE(http->headers.size() == 1);
        CHECK(http->headers.front().count("User-Agent") == 1);
    }

    SUBCASE("No route") {
        http->response = {200, R"({"code": "NoRoute", "routes": []})"};
        CHECK_THROWS_AS(provider.route(brno, znojmo), UpstreamUnavailable);
    }

    SUBCASE("Server error") {
        http->response = {503, ""};
        CHECK_THROWS_AS(provider.route(brno, znojmo), UpstreamUnavailable);
    }
}

TEST_CASE("RouteProvider never throws") {
    auto http = std::make_shared<testing::FakeHttpClient>();
    RouteProvider routes(std::make_shared<OsrmProvider>(RouterConfig{}, http));
    const Coordinate brno{49.1951, 16.6068};
    const Coordinate znojmo{48.8555, 16.0488};

    SUBCASE("Usable route") {
        http->response = {200, R"({"code": "Ok", "routes": [{"geometry": {"coordinates": [[16.6068, 49.1951],
            [16.0488, 48.8555]]}}]})"};
        auto line = routes.get_route(brno, znojmo);
        REQUIRE(line.has_value());
        CHECK(line->size() == 2);
    }

    SUBCASE("Non-Ok code") {
        http->response = {200, R"({"code": "InvalidQuery"})"};
        CHECK_FALSE(routes.get_route(brno, znojmo).has_value());
    }

    SUBCASE("Single point") {
        http->response = {200, R"({"code": "Ok", "routes": [{"geometry": {"coordinates": [[16.6068, 49.1951]]}}]})"};
        CHECK_FALSE(routes.get_route(brno, znojmo).has_value());
    }

    SUBCASE("All points identical") {
        http->response = {200, R"({"code": "Ok", "routes": [{"geometry": {"coordinates": [[16.6, 49.1],
            [16.6, 49.1], [16.6, 49.1]]}}]})"};
        CHECK_FALSE(routes.get_route(brno, znojmo).has_value());
    }

    SUBCASE("Empty routes") {
        http->response = {200, R"({"code": "Ok", "routes": []})"};
        CHECK_FALSE(routes.get_route(brno, znojmo).has_value());
    }

    SUBCASE("Malformed body") {
        http->response = {200, "not json"};
        CHECK_FALSE(routes.get_route(brno, znojmo).has_value());
    }

    SUBCASE("Transport failure") {
        http->fail = true;
        CHECK_FALSE(routes.get_route(brno, znojmo).has_value());
    }

    SUBCASE("Injected provider failure") {
        auto fake = std::make_shared<testing::FakeRoutingProvider>();
        fake->fail = true;
        RouteProvider failing(fake);
        CHECK_FALSE(failing.get_route(brno, znojmo).has_value());
        CHECK(fake->calls == 1);
    }
}

TEST_CASE("Straight line fallback") {
    const Coordinate a{49.1951, 16.6068};
    const Coordinate b{48.8555, 16.0488};
    auto line = straight_line(a, b);
    REQUIRE(line.size() == 2);
    CHECK(line.front() == a);
    CHECK(line.back() == b);
}
