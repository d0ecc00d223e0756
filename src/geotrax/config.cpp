#include "geotrax/config.hpp"
#include "geotrax/errors.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

namespace geotrax {

    namespace {

        template <typename T> void read(const nlohmann::json &obj, const char *key, T &out) {
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null())
                return;
            try {
                out = it->get<T>();
            } catch (const nlohmann::json::exception &e) {
                throw ValidationError(std::string("config key '") + key + "': " + e.what());
            }
        }

        void read_ms(const nlohmann::json &obj, const char *key, std::chrono::milliseconds &out) {
            long long ms = out.count();
            read(obj, key, ms);
            if (ms < 0)
                throw ValidationError(std::string("config key '") + key + "' must not be negative");
            out = std::chrono::milliseconds(ms);
        }

        /// Provider timeouts; libcurl treats 0 as "wait forever"
        void read_timeout(const nlohmann::json &obj, const char *key, std::chrono::milliseconds &out) {
            read_ms(obj, key, out);
            if (out.count() == 0)
                throw ValidationError(std::string("config key '") + key + "' must be positive");
        }

        const nlohmann::json *section(const nlohmann::json &doc, const char *name) {
            auto it = doc.find(name);
            if (it == doc.end() || it->is_null())
                return nullptr;
            if (!it->is_object())
                throw ValidationError(std::string("config section '") + name + "' must be an object");
            return &*it;
        }

    } // namespace

    Config config_from_json(const nlohmann::json &doc) {
        if (!doc.is_object())
            throw ValidationError("config document must be a JSON object");

        Config cfg;

        if (auto s = section(doc, "geocoder")) {
            read(*s, "base_url", cfg.geocoder.base_url);
            read(*s, "country_codes", cfg.geocoder.country_codes);
            read(*s, "language", cfg.geocoder.language);
            read(*s, "user_agent", cfg.geocoder.user_agent);
            read_timeout(*s, "timeout_ms", cfg.geocoder.timeout);
        }

        if (auto s = section(doc, "router")) {
            read(*s, "base_url", cfg.router.base_url);
            read(*s, "profile", cfg.router.profile);
            read(*s, "user_agent", cfg.router.user_agent);
            read_timeout(*s, "timeout_ms", cfg.router.timeout);
        }

        if (auto s = section(doc, "corridor")) {
            read(*s, "min_buffer_meters", cfg.corridor.min_buffer_meters);
            read(*s, "max_buffer_meters", cfg.corridor.max_buffer_meters);
            read(*s, "points_per_circle", cfg.corridor.points_per_circle);
            read(*s, "datum_latitude", cfg.corridor.datum.latitude);
            read(*s, "datum_longitude", cfg.corridor.datum.longitude);
            if (cfg.corridor.min_buffer_meters <= 0 || cfg.corridor.max_buffer_meters < cfg.corridor.min_buffer_meters)
                throw ValidationError("corridor buffer bounds are inconsistent");
            if (cfg.corridor.points_per_circle < 4)
                throw ValidationError("corridor.points_per_circle must be at least 4");
        }

        if (auto s = section(doc, "search")) {
            read(*s, "max_page_size", cfg.search.max_page_size);
            read(*s, "map_points_limit", cfg.search.map_points_limit);
            if (cfg.search.max_page_size < 1 || cfg.search.map_points_limit < 1)
                throw ValidationError("search limits must be positive");
        }

        if (auto s = section(doc, "enrich")) {
            read(*s, "min_batch_size", cfg.enrich.min_batch_size);
            read(*s, "max_batch_size", cfg.enrich.max_batch_size);
            read_ms(*s, "min_request_interval_ms", cfg.enrich.min_request_interval);
            if (cfg.enrich.min_batch_size < 1 || cfg.enrich.max_batch_size < cfg.enrich.min_batch_size)
                throw ValidationError("enrich batch bounds are inconsistent");
        }

        if (auto s = section(doc, "store")) {
            read(*s, "path", cfg.store.path);
            read_ms(*s, "busy_timeout_ms", cfg.store.busy_timeout);
        }

        return cfg;
    }

    Config load_config(const std::string &path) {
        std::ifstream in(path);
        if (!in)
            throw ValidationError("cannot open config file '" + path + "'");

        nlohmann::json doc;
        try {
            in >> doc;
        } catch (const nlohmann::json::parse_error &e) {
            throw ValidationError("config file '" + path + "' is not valid JSON: " + e.what());
        }
        return config_from_json(doc);
    }

} // namespace geotrax
