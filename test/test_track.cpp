#include "doctest/doctest.h"
#include "geotrax/errors.hpp"
#include "geotrax/track.hpp"

using namespace geotrax;

TEST_CASE("GPX track points") {
    const std::string gpx = R"(<?xml version="1.0" encoding="UTF-8"?>
<gpx version="1.1" creator="test" xmlns="http://www.topografix.com/GPX/1/1">
  <metadata><name>file name</name></metadata>
  <wpt lat="50.0" lon="14.0"><name>ignored</name></wpt>
  <trk>
    <name> Brno - Znojmo </name>
    <trkseg>
      <trkpt lat="49.1951" lon="16.6068"><ele>230</ele></trkpt>
      <trkpt lat="49.0500" lon="16.3500"/>
    </trkseg>
    <trkseg>
      <trkpt lat="48.8555" lon="16.0488"/>
    </trkseg>
  </trk>
</gpx>)";

    auto track = parse_track(gpx);
    REQUIRE(track.line.size() == 3);
    CHECK(track.point_count == 3);
    CHECK(track.name == "Brno - Znojmo");
    CHECK(track.start == Coordinate{49.1951, 16.6068});
    CHECK(track.end == Coordinate{48.8555, 16.0488});
    CHECK(track.line[1] == Coordinate{49.05, 16.35});
}

TEST_CASE("Fallback to route points, then waypoints") {
    SUBCASE("Route") {
        const std::string gpx = R"(<gpx version="1.1">
  <trk><trkseg><trkpt lat="49.0" lon="16.0"/></trkseg></trk>
  <rte><name>planned</name>
    <rtept lat="49.0" lon="16.0"/><rtept lat="49.1" lon="16.1"/>
  </rte>
</gpx>)";
        auto track = parse_track(gpx);
        CHECK(track.point_count == 2);
        CHECK(track.name == "planned");
        CHECK(track.end == Coordinate{49.1, 16.1});
    }

    SUBCASE("Waypoints") {
        const std::string gpx = R"(<gpx version="1.0">
  <wpt lat="49.0" lon="16.0"/>
  <wpt lat="49.2" lon="16.2"/>
  <wpt lat="49.4" lon="16.4"/>
</gpx>)";
        auto track = parse_track(gpx);
        CHECK(track.point_count == 3);
        CHECK(track.name.empty());
        CHECK(track.line[2] == Coordinate{49.4, 16.4});
    }
}

TEST_CASE("Unusable points are skipped") {
    const std::string gpx = R"(<gpx>
  <trk><trkseg>
    <trkpt lat="49.0" lon="16.0"/>
    <trkpt lat="abc" lon="16.0"/>
    <trkpt lon="16.0"/>
    <trkpt lat="95.0" lon="16.0"/>
    <trkpt lat="49.1" lon="16.1"/>
  </trkseg></trk>
</gpx>)";
    auto track = parse_track(gpx);
    REQUIRE(track.point_count == 2);
    CHECK(track.start == Coordinate{49.0, 16.0});
    CHECK(track.end == Coordinate{49.1, 16.1});
}

TEST_CASE("Track errors") {
    SUBCASE("One point") {
        CHECK_THROWS_AS(parse_track(R"(<gpx><trk><trkseg><trkpt lat="49" lon="16"/></trkseg></trk></gpx>)"),
                        EmptyTrackError);
    }

    SUBCASE("No points") { CHECK_THROWS_AS(parse_track("<gpx version=\"1.1\"></gpx>"), EmptyTrackError); }

    SUBCASE("Not XML") {
        CHECK_THROWS_AS(parse_track("this is not a track"), TrackFormatError);
        CHECK_THROWS_AS(parse_track("<gpx><trk>"), TrackFormatError);
        CHECK_THROWS_AS(parse_track(""), TrackFormatError);
    }

    SUBCASE("Not GPX") {
        CHECK_THROWS_AS(parse_track(R"(<kml><Placemark/></kml>)"), TrackFormatError);
    }

    SUBCASE("Both are validation errors") {
        CHECK_THROWS_AS(parse_track("nope"), ValidationError);
        CHECK_THROWS_AS(parse_track("<gpx/>"), ValidationError);
    }

    SUBCASE("Missing file") { CHECK_THROWS_AS(parse_track_file("/nonexistent/track.gpx"), TrackFormatError); }
}
