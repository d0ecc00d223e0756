#pragma once

#include <memory>
#include <optional>
#include <string>

#include "geotrax/config.hpp"
#include "geotrax/http.hpp"
#include "geotrax/types.hpp"

namespace geotrax {

    /**
     * @brief External directions service
     *
     * Implementations may throw on any failure; RouteProvider absorbs it.
     */
    class RoutingProvider {
      public:
        virtual ~RoutingProvider() = default;

        /// Ordered route coordinates from start to end, empty if there is no route
        virtual GeoLine route(const Coordinate &start, const Coordinate &end) = 0;
    };

    /**
     * @brief OSRM-compatible route service
     *
     * OSRM speaks GeoJSON, so coordinates travel as [lon, lat] in both the URL
     * and the response.
     */
    class OsrmProvider : public RoutingProvider {
        RouterConfig config_;
        std::shared_ptr<HttpClient> http_;

      public:
        OsrmProvider(RouterConfig config, std::shared_ptr<HttpClient> http);

        std::string route_url(const Coordinate &start, const Coordinate &end) const;

        /**
         * @throws UpstreamUnavailable on transport failure, non-2xx status or a non-Ok code
         * @throws nlohmann::json::exception on a malformed body
         */
        GeoLine route(const Coordinate &start, const Coordinate &end) override;
    };

    /**
     * @brief Real route geometry between two points, or nothing
     *
     * get_route never throws. A missing route is a normal outcome: the caller
     * substitutes straight_line().
     */
    class RouteProvider {
        std::shared_ptr<RoutingProvider> provider_;

      public:
        explicit RouteProvider(std::shared_ptr<RoutingProvider> provider);

        /**
         * @brief Fetch the route
         *
         * @return nullopt on any provider failure, or if the geometry has fewer
         *         than two points or all its points coincide
         */
        std::optional<GeoLine> get_route(const Coordinate &start, const Coordinate &end) const;
    };

    /// Two-point fallback line
    GeoLine straight_line(const Coordinate &start, const Coordinate &end);

} // namespace geotrax
