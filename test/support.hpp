#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "geotrax/errors.hpp"
#include "geotrax/geocoder.hpp"
#include "geotrax/http.hpp"
#include "geotrax/router.hpp"
#include "geotrax/store.hpp"

namespace geotrax {
    namespace testing {

        /// Canned HTTP transport; records every request
        class FakeHttpClient : public HttpClient {
          public:
            HttpResponse response{200, "[]"};
            bool fail = false;
            std::vector<std::string> urls;
            std::vector<std::map<std::string, std::string>> headers;

            HttpResponse get(const std::string &url, const std::map<std::string, std::string> &h,
                             std::chrono::milliseconds) override {
                urls.push_back(url);
                headers.push_back(h);
                if (fail)
                    throw UpstreamUnavailable("connection refused");
                return response;
            }
        };

        /// Place name -> coordinate table; names in `failing` throw
        class FakeGeocodingProvider : public GeocodingProvider {
          public:
            std::map<std::string, Coordinate> places;
            std::set<std::string> failing;
            std::vector<std::string> queries;
            std::function<void(const std::string &)> on_search;

            std::optional<GeocodeHit> search(const std::string &query) override {
                queries.push_back(query);
                if (on_search)
                    on_search(query);
                if (failing.count(query))
                    throw UpstreamUnavailable("geocoder timed out");
                auto it = places.find(query);
                if (it == places.end())
                    return std::nullopt;
                return GeocodeHit{it->second, query + ", Czechia"};
            }
        };

        class FakeRoutingProvider : public RoutingProvider {
          public:
            GeoLine line;
            bool fail = false;
            int calls = 0;

            GeoLine route(const Coordinate &, const Coordinate &) override {
                ++calls;
                if (fail)
                    throw UpstreamUnavailable("router timed out");
                return line;
            }
        };

        inline StoreConfig memory_store() {
            StoreConfig cfg;
            cfg.path = ":memory:";
            return cfg;
        }

        inline ListingRecord listing(const std::string &external_id, std::optional<Coordinate> c = std::nullopt,
                                     const std::string &location = "") {
            ListingRecord r;
            r.external_id = external_id;
            r.title = "Listing " + external_id;
            r.location_text = location;
            r.property_type = "house";
            r.offer_type = "sale";
            r.source_code = "test";
            r.price = 1000000.0;
            r.coordinate = c;
            return r;
        }

    } // namespace testing
} // namespace geotrax
