#pragma once

#include <chrono>
#include <string>

#include <datapod/datapod.hpp>
#include <nlohmann/json_fwd.hpp>

namespace geotrax {

    /**
     * @brief Geocoding provider settings (Nominatim-compatible API)
     */
    struct GeocoderConfig {
        std::string base_url = "https://nominatim.openstreetmap.org";
        std::string country_codes = "cz";
        std::string language = "cs";
        std::string user_agent = "geotrax/0.1 (corridor search)";
        std::chrono::milliseconds timeout{10000};
    };

    /**
     * @brief Routing provider settings (OSRM-compatible API)
     */
    struct RouterConfig {
        std::string base_url = "http://router.project-osrm.org";
        std::string profile = "driving";
        std::string user_agent = "geotrax/0.1 (corridor search)";
        std::chrono::milliseconds timeout{10000};
    };

    /**
     * @brief Corridor construction settings
     *
     * The datum anchors the metric frame every buffer is computed in. The default
     * is the centre of the Czech Republic.
     */
    struct CorridorConfig {
        int min_buffer_meters = 100;
        int max_buffer_meters = 50000;
        int points_per_circle = 36;
        datapod::Geo datum{49.8175, 15.4730, 0.0};
    };

    struct SearchConfig {
        int max_page_size = 500;
        int map_points_limit = 2000;
    };

    struct EnrichConfig {
        int min_batch_size = 1;
        int max_batch_size = 200;
        std::chrono::milliseconds min_request_interval{1100};
    };

    struct StoreConfig {
        std::string path = "geotrax.db";
        std::chrono::milliseconds busy_timeout{5000};
    };

    /**
     * @brief Everything the components need, passed into their constructors
     */
    struct Config {
        GeocoderConfig geocoder;
        RouterConfig router;
        CorridorConfig corridor;
        SearchConfig search;
        EnrichConfig enrich;
        StoreConfig store;
    };

    /**
     * @brief Overlay a JSON document on the defaults
     *
     * Missing keys keep their default, unknown keys are ignored.
     *
     * @throws ValidationError if a known key has the wrong type
     */
    Config config_from_json(const nlohmann::json &doc);

    /**
     * @brief Read a JSON config file
     *
     * @throws ValidationError if the file cannot be read or parsed
     */
    Config load_config(const std::string &path);

} // namespace geotrax
