#include "doctest/doctest.h"
#include "geotrax/errors.hpp"
#include "geotrax/wkt.hpp"

using namespace geotrax;

TEST_CASE("Coordinate pairs are lat before lon") {
    Coordinate c{49.1234, 16.5678};
    CHECK(wkt::format_pair(c) == "49.1234,16.5678");

    auto parsed = wkt::parse_pair("49.1234,16.5678");
    REQUIRE(parsed.has_value());
    CHECK(parsed->latitude == 49.1234);
    CHECK(parsed->longitude == 16.5678);

    SUBCASE("Whitespace around the halves") {
        auto p = wkt::parse_pair(" 49.5 , 16.25 ");
        REQUIRE(p.has_value());
        CHECK(p->latitude == 49.5);
        CHECK(p->longitude == 16.25);
    }

    SUBCASE("Rejected pairs") {
        CHECK_FALSE(wkt::parse_pair("Brno").has_value());
        CHECK_FALSE(wkt::parse_pair("Brno, Jihomoravský kraj").has_value());
        CHECK_FALSE(wkt::parse_pair("49.1").has_value());
        CHECK_FALSE(wkt::parse_pair("49.1,16.5,3").has_value());
        CHECK_FALSE(wkt::parse_pair("49.1x,16.5").has_value());
        CHECK_FALSE(wkt::parse_pair("91.0,16.5").has_value());
        CHECK_FALSE(wkt::parse_pair("49.0,181.0").has_value());
        CHECK_FALSE(wkt::parse_pair(",").has_value());
    }
}

TEST_CASE("Geometry text is lon before lat") {
    Coordinate c{49.1234, 16.5678};
    CHECK(wkt::point(c) == "POINT(16.5678 49.1234)");

    GeoLine line{{49.0, 16.0}, {49.5, 16.1}};
    CHECK(wkt::line(line) == "LINESTRING(16 49, 16.1 49.5)");

    auto back = wkt::parse_line("LINESTRING(16 49, 16.1 49.5)");
    REQUIRE(back.size() == 2);
    CHECK(back[0].latitude == 49.0);
    CHECK(back[0].longitude == 16.0);
    CHECK(back[1].latitude == 49.5);
    CHECK(back[1].longitude == doctest::Approx(16.1));
}

TEST_CASE("Line parsing errors") {
    CHECK_THROWS_AS(wkt::parse_line("POINT(16 49)"), ValidationError);
    CHECK_THROWS_AS(wkt::parse_line("LINESTRING(16 49)"), ValidationError);
    CHECK_THROWS_AS(wkt::parse_line("LINESTRING(16 49, oops)"), ValidationError);
    CHECK_THROWS_AS(wkt::parse_line(""), ValidationError);
}

TEST_CASE("Area parsing") {
    SUBCASE("Polygon is closed and oriented") {
        auto area = wkt::parse_area("POLYGON((16 49, 16 50, 17 50, 17 49))");
        REQUIRE(area.size() == 1);
        const auto &ring = area.front().outer();
        CHECK(ring.front().x() == ring.back().x());
        CHECK(ring.front().y() == ring.back().y());
        CHECK(boost::geometry::area(area) > 0.0);
    }

    SUBCASE("Multipolygon keeps every part") {
        auto area = wkt::parse_area("MULTIPOLYGON(((16 49, 16 49.1, 16.1 49.1, 16.1 49, 16 49)),"
                                    "((17 49, 17 49.1, 17.1 49.1, 17.1 49, 17 49)))");
        CHECK(area.size() == 2);
        CHECK(wkt::area(area).rfind("MULTIPOLYGON(", 0) == 0);
    }

    SUBCASE("Lower case keyword") {
        auto area = wkt::parse_area("polygon((16 49, 16 50, 17 50, 16 49))");
        CHECK(area.size() == 1);
    }

    SUBCASE("Rejected text") {
        CHECK_THROWS_AS(wkt::parse_area("LINESTRING(16 49, 17 50)"), ValidationError);
        CHECK_THROWS_AS(wkt::parse_area("POLYGON((16 49, 16 50"), ValidationError);
    }
}

TEST_CASE("Bounding box text") {
    BoundingBox box{49.0, 16.0, 49.5, 16.5};
    auto text = wkt::bbox(box);
    CHECK(text == "POLYGON((16 49, 16 49.5, 16.5 49.5, 16.5 49, 16 49))");

    auto area = wkt::parse_area(text);
    CHECK(boost::geometry::covered_by(BPoint(16.25, 49.25), area));
    CHECK_FALSE(boost::geometry::covered_by(BPoint(49.25, 16.25), area));
}
