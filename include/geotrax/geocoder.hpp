#pragma once

#include <memory>
#include <optional>
#include <string>

#include "geotrax/config.hpp"
#include "geotrax/http.hpp"
#include "geotrax/types.hpp"

namespace geotrax {

    /**
     * @brief One best match from a geocoding provider
     */
    struct GeocodeHit {
        Coordinate coordinate;
        std::string display_name;
    };

    /**
     * @brief External place-name search
     *
     * Implementations may throw on any failure; Geocoder absorbs it.
     */
    class GeocodingProvider {
      public:
        virtual ~GeocodingProvider() = default;

        /// Best match for the query, nullopt if the provider has none
        virtual std::optional<GeocodeHit> search(const std::string &query) = 0;
    };

    /**
     * @brief Nominatim-compatible search API
     */
    class NominatimProvider : public GeocodingProvider {
        GeocoderConfig config_;
        std::shared_ptr<HttpClient> http_;

      public:
        NominatimProvider(GeocoderConfig config, std::shared_ptr<HttpClient> http);

        /// Request URL for a query, restricted to the configured countries and one result
        std::string search_url(const std::string &query) const;

        /**
         * @throws UpstreamUnavailable on transport failure or non-2xx status
         * @throws nlohmann::json::exception on a malformed body
         */
        std::optional<GeocodeHit> search(const std::string &query) override;
    };

    /**
     * @brief Free text -> coordinate
     *
     * Never throws for provider conditions: every provider error, timeout or
     * empty result is reported as nullopt (not found). Does no rate limiting of
     * its own; loops over it must throttle.
     */
    class Geocoder {
        std::shared_ptr<GeocodingProvider> provider_;

      public:
        explicit Geocoder(std::shared_ptr<GeocodingProvider> provider);

        /**
         * @brief Resolve text to a coordinate
         *
         * A strict "lat,lon" pair is returned as is without calling the
         * provider. Blank text is not found.
         */
        std::optional<Coordinate> resolve(const std::string &text) const;

        /// As resolve(), with the provider's display name. A pair echoes its own text.
        std::optional<GeocodeHit> lookup(const std::string &text) const;
    };

} // namespace geotrax
