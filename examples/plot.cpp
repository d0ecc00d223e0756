#include <iostream>
#include <memory>
#include <random>

#include "rerun.hpp"
#include "rerun/recording_stream.hpp"

#include "geotrax/geotrax.hpp"
#include "geotrax/utils/visualize.hpp"

// Scatter listings around the Brno - Znojmo road and show which fall inside a
// 5 km corridor. Straight-line corridor from coordinates, so no network needed.
int main() {
    auto rec = std::make_shared<rerun::RecordingStream>("geotrax", "space");
    if (rec->connect_grpc("rerun+http://0.0.0.0:9876/proxy").is_err()) {
        std::cerr << "Failed to connect to rerun\n";
        return 1;
    }

    geotrax::Config config;
    config.store.path = ":memory:";
    geotrax::PointStore store(config.store);

    const geotrax::Coordinate brno{49.1951, 16.6068};
    const geotrax::Coordinate znojmo{48.8555, 16.0488};

    std::mt19937 gen(42);
    std::uniform_real_distribution<double> lat(48.75, 49.30);
    std::uniform_real_distribution<double> lon(15.90, 16.75);
    for (int i = 0; i < 400; ++i) {
        geotrax::ListingRecord rec_in;
        rec_in.external_id = "demo-" + std::to_string(i);
        rec_in.title = "Listing " + std::to_string(i);
        rec_in.property_type = (i % 3 == 0) ? "house" : "flat";
        rec_in.offer_type = "sale";
        rec_in.coordinate = geotrax::Coordinate{lat(gen), lon(gen)};
        store.insert_listing(rec_in);
    }

    geotrax::ProximityIndex index(store, config.search);
    geotrax::CorridorBuilder builder(config.corridor, index);

    geotrax::CorridorOptions options;
    options.list_matches = true;
    auto corridor = builder.build_corridor_from_line(geotrax::straight_line(brno, znojmo), 5000, options);

    std::cout << "Corridor area: " << builder.metric_area(corridor.polygon) / 1e6 << " km2, "
              << corridor.match_count << " of 400 listings inside\n";

    geotrax::visualize::show_corridor(corridor, rec);
    geotrax::visualize::show_points(index.all_points({}), rec, "/listings/all");

    return 0;
}
