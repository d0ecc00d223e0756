#include "geotrax/router.hpp"
#include "geotrax/errors.hpp"
#include "geotrax/utils/utils.hpp"

#include <iomanip>
#include <iostream>
#include <locale>
#include <sstream>

#include <nlohmann/json.hpp>

namespace geotrax {

    OsrmProvider::OsrmProvider(RouterConfig config, std::shared_ptr<HttpClient> http)
        : config_(std::move(config)), http_(std::move(http)) {
        if (!http_)
            throw std::invalid_argument("OsrmProvider needs an HttpClient");
    }

    std::string OsrmProvider::route_url(const Coordinate &start, const Coordinate &end) const {
        std::ostringstream os;
        os.imbue(std::locale::classic());
        os << std::setprecision(10);
        os << config_.base_url << "/route/v1/" << config_.profile << '/';
        os << start.longitude << ',' << start.latitude << ';' << end.longitude << ',' << end.latitude;
        os << "?geometries=geojson&overview=full";
        return os.str();
    }

    GeoLine OsrmProvider::route(const Coordinate &start, const Coordinate &end) {
        auto response = http_->get(route_url(start, end), {{"User-Agent", config_.user_agent}}, config_.timeout);
        if (response.status < 200 || response.status >= 300)
            throw UpstreamUnavailable("router answered HTTP " + std::to_string(response.status));

        auto doc = nlohmann::json::parse(response.body);
        const std::string code = doc.value("code", std::string{"Ok"});
        if (code != "Ok")
            throw UpstreamUnavailable("router answered code " + code);

        GeoLine line;
        auto routes = doc.find("routes");
        if (routes == doc.end() || !routes->is_array() || routes->empty())
            return line;

        const auto &coords = routes->front().at("geometry").at("coordinates");
        line.reserve(coords.size());
        for (const auto &pair : coords) {
            // GeoJSON position: [lon, lat]
            Coordinate c{pair.at(1).get<double>(), pair.at(0).get<double>()};
            if (utils::in_range(c))
                line.push_back(c);
        }
        return line;
    }

    RouteProvider::RouteProvider(std::shared_ptr<RoutingProvider> provider) : provider_(std::move(provider)) {
        if (!provider_)
            throw std::invalid_argument("RouteProvider needs a RoutingProvider");
    }

    std::optional<GeoLine> RouteProvider::get_route(const Coordinate &start, const Coordinate &end) const {
        try {
            GeoLine line = provider_->route(start, end);
            if (utils::is_degenerate(line)) {
                std::cerr << "Warning: router returned no usable geometry, using straight line" << std::endl;
                return std::nullopt;
            }
            return line;
        } catch (const std::exception &e) {
            std::cerr << "Warning: routing failed, using straight line: " << e.what() << std::endl;
        }
        return std::nullopt;
    }

    GeoLine straight_line(const Coordinate &start, const Coordinate &end) { return GeoLine{start, end}; }

} // namespace geotrax
