#include "geotrax/geocoder.hpp"
#include "geotrax/errors.hpp"
#include "geotrax/utils/utils.hpp"
#include "geotrax/wkt.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

namespace geotrax {

    namespace {

        // Nominatim sends lat/lon as strings; some compatible servers send numbers
        std::optional<double> number_field(const nlohmann::json &obj, const char *key) {
            auto it = obj.find(key);
            if (it == obj.end())
                return std::nullopt;
            if (it->is_number())
                return it->get<double>();
            if (it->is_string())
                return utils::parse_double(it->get<std::string>());
            return std::nullopt;
        }

    } // namespace

    NominatimProvider::NominatimProvider(GeocoderConfig config, std::shared_ptr<HttpClient> http)
        : config_(std::move(config)), http_(std::move(http)) {
        if (!http_)
            throw std::invalid_argument("NominatimProvider needs an HttpClient");
    }

    std::string NominatimProvider::search_url(const std::string &query) const {
        std::string url = config_.base_url + "/search?q=" + url_escape(query);
        if (!config_.country_codes.empty())
            url += "&countrycodes=" + url_escape(config_.country_codes);
        url += "&format=json&limit=1";
        if (!config_.language.empty())
            url += "&accept-language=" + url_escape(config_.language);
        return url;
    }

    std::optional<GeocodeHit> NominatimProvider::search(const std::string &query) {
        auto response = http_->get(search_url(query), {{"User-Agent", config_.user_agent}}, config_.timeout);
        if (response.status < 200 || response.status >= 300)
            throw UpstreamUnavailable("geocoder answered HTTP " + std::to_string(response.status));

        auto doc = nlohmann::json::parse(response.body);
        if (!doc.is_array() || doc.empty() || !doc.front().is_object())
            return std::nullopt;

        const auto &first = doc.front();
        auto lat = number_field(first, "lat");
        auto lon = number_field(first, "lon");
        if (!lat || !lon)
            return std::nullopt;

        GeocodeHit hit;
        hit.coordinate = Coordinate{*lat, *lon};
        if (!utils::in_range(hit.coordinate))
            return std::nullopt;
        hit.display_name = first.value("display_name", std::string{});
        return hit;
    }

    Geocoder::Geocoder(std::shared_ptr<GeocodingProvider> provider) : provider_(std::move(provider)) {
        if (!provider_)
            throw std::invalid_argument("Geocoder needs a GeocodingProvider");
    }

    std::optional<Coordinate> Geocoder::resolve(const std::string &text) const {
        auto hit = lookup(text);
        if (!hit)
            return std::nullopt;
        return hit->coordinate;
    }

    std::optional<GeocodeHit> Geocoder::lookup(const std::string &text) const {
        const std::string query = utils::trim(text);
        if (query.empty())
            return std::nullopt;

        if (auto pair = wkt::parse_pair(query))
            return GeocodeHit{*pair, query};

        try {
            return provider_->search(query);
        } catch (const std::exception &e) {
            std::cerr << "Warning: geocoding '" << query << "' failed: " << e.what() << std::endl;
        }
        return std::nullopt;
    }

} // namespace geotrax
