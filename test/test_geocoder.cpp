#include "doctest/doctest.h"
#include "geotrax/geocoder.hpp"
#include "support.hpp"

using namespace geotrax;

TEST_CASE("Coordinate pairs bypass the provider") {
    auto provider = std::make_shared<testing::FakeGeocodingProvider>();
    Geocoder geocoder(provider);

    auto c = geocoder.resolve("49.1951,16.6068");
    REQUIRE(c.has_value());
    CHECK(c->latitude == 49.1951);
    CHECK(c->longitude == 16.6068);

    auto hit = geocoder.lookup("  49.1951, 16.6068 ");
    REQUIRE(hit.has_value());
    CHECK(hit->display_name == "49.1951, 16.6068");

    CHECK(provider->queries.empty());
}

TEST_CASE("Place names go to the provider") {
    auto provider = std::make_shared<testing::FakeGeocodingProvider>();
    provider->places["Brno"] = Coordinate{49.1951, 16.6068};
    Geocoder geocoder(provider);

    SUBCASE("Hit") {
        auto hit = geocoder.lookup("  Brno ");
        REQUIRE(hit.has_value());
        CHECK(hit->coordinate == Coordinate{49.1951, 16.6068});
        CHECK(hit->display_name == "Brno, Czechia");
        REQUIRE(provider->queries.size() == 1);
        CHECK(provider->queries.front() == "Brno");
    }

    SUBCASE("Miss") { CHECK_FALSE(geocoder.resolve("Nonexistent Place XYZ").has_value()); }

    SUBCASE("Provider failure is a miss") {
        provider->failing.insert("Brno");
        CHECK_FALSE(geocoder.resolve("Brno").has_value());
    }

    SUBCASE("Blank text is never sent") {
        CHECK_FALSE(geocoder.resolve("").has_value());
        CHECK_FALSE(geocoder.resolve("   ").has_value());
        CHECK(provider->queries.empty());
    }

    SUBCASE("Out-of-range pair is treated as a place name") {
        CHECK_FALSE(geocoder.resolve("95.0,16.0").has_value());
        CHECK(provider->queries.size() == 1);
    }
}

TEST_CASE("Nominatim request") {
    auto http = std::make_shared<testing::FakeHttpClient>();
    GeocoderConfig config;
    config.base_url = "https://geo.example";
    NominatimProvider provider(config, http);

    SUBCASE("Restricted to one result in the configured country and language") {
        auto url = provider.search_url("Znojmo");
        CHECK(url.rfind("https://geo.example/search?q=Znojmo", 0) == 0);
        CHECK(url.find("countrycodes=cz") != std::string::npos);
        CHECK(url.find("limit=1") != std::string::npos);
        CHECK(url.find("format=json") != std::string::npos);
        CHECK(url.find("accept-language=cs") != std::string::npos);
    }

    SUBCASE("Query is escaped") {
        auto url = provider.search_url("Nové Město, Praha");
        CHECK(url.find("q=Nov%C3%A9%20M%C4%9Bsto%2C%20Praha") != std::string::npos);
    }

    SUBCASE("User agent is sent") {
        provider.search("Brno");
        REQUIRE(http->headers.size() == 1);
        CHECK(http->headers.front().at("User-Agent") == config.user_agent);
        REQUIRE(http->urls.size() == 1);
        CHECK(http->urls.front() == provider.search_url("Brno"));
    }
}

TEST_CASE("Nominatim response") {
    auto http = std::make_shared<testing::FakeHttpClient>();
    NominatimProvider provider(GeocoderConfig{}, http);

    SUBCASE("String coordinates") {
        http->response = {200, R"([{"lat": "49.1951", "lon": "16.6068", "display_name": "Brno, Czechia"}])"};
        auto hit = provider.search("Brno");
        REQUIRE(hit.has_value());
        CHECK(hit->coordinate.latitude == doctest::Approx(49.1951));
        CHECK(hit->coordinate.longitude == doctest::Approx(16.6068));
        CHECK(hit->display_name == "Brno, Czechia");
    }

    SUBCASE("Numeric coordinates") {
        http->response = {200, R"([{"lat": 48.8555, "lon": 16.0488}])"};
        auto hit = provider.search("Znojmo");
        REQUIRE(hit.has_value());
        CHECK(hit->coordinate.latitude == doctest::Approx(48.8555));
        CHECK(hit->display_name.empty());
    }

    SUBCASE("No result") {
        http->response = {200, "[]"};
        CHECK_FALSE(provider.search("Nowhere").has_value());
    }

    SUBCASE("Unparseable coordinate") {
        http->response = {200, R"([{"lat": "north", "lon": "16.0"}])"};
        CHECK_FALSE(provider.search("Brno").has_value());
    }

    SUBCASE("Server error") {
        http->response = {500, "oops"};
        CHECK_THROWS_AS(provider.search("Brno"), UpstreamUnavailable);
    }

    SUBCASE("Through Geocoder every failure is not found") {
        Geocoder geocoder(std::make_shared<NominatimProvider>(GeocoderConfig{}, http));

        http->response = {500, "oops"};
        CHECK_FALSE(geocoder.resolve("Brno").has_value());

        http->response = {200, "<html>not json</html>"};
        CHECK_FALSE(geocoder.resolve("Brno").has_value());

        http->response = {200, R"({"error": "rate limited"})"};
        CHECK_FALSE(geocoder.resolve("Brno").has_value());

        http->fail = true;
        CHECK_FALSE(geocoder.resolve("Brno").has_value());
    }
}
