#include "geotrax/enricher.hpp"
#include "geotrax/errors.hpp"
#include "geotrax/utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <regex>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

namespace geotrax {

    // ------------------------------------------------------------- RateLimiter

    void interruptible_sleep(std::chrono::milliseconds duration, std::stop_token stop) {
        std::mutex m;
        std::condition_variable_any cv;
        std::unique_lock<std::mutex> lock(m);
        cv.wait_for(lock, stop, duration, [] { return false; });
    }

    RateLimiter::RateLimiter(std::chrono::milliseconds interval, Sleeper sleeper, Now now)
        : interval_(interval), sleeper_(std::move(sleeper)), now_(std::move(now)) {
        if (interval_.count() < 0)
            throw std::invalid_argument("rate limiter interval must not be negative");
        if (!sleeper_)
            sleeper_ = interruptible_sleep;
        if (!now_)
            now_ = [] { return Clock::now(); };
    }

    bool RateLimiter::acquire(std::stop_token stop) {
        if (last_) {
            auto elapsed = now_() - *last_;
            if (elapsed < interval_) {
                auto wait = std::chrono::ceil<std::chrono::milliseconds>(interval_ - elapsed);
                sleeper_(wait, stop);
                if (stop.stop_requested())
                    return false;
            }
        }
        last_ = now_();
        return true;
    }

    // ------------------------------------------------------- query heuristic

    namespace {

        std::string ascii_lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
            return s;
        }

        std::vector<std::string> split(const std::string &text, char sep) {
            std::vector<std::string> parts;
            std::string part;
            std::istringstream is(text);
            while (std::getline(is, part, sep))
                parts.push_back(part);
            return parts;
        }

        /// "Znojmo - okres Znojmo" / "Znojmo (okres Znojmo)" -> "Znojmo"
        std::string strip_district_suffix(const std::string &segment) {
            const std::string lower = ascii_lower(segment);
            std::size_t cut = std::string::npos;
            for (const char *marker : {" - okres", " – okres", "(okres", " - district", "(district"}) {
                auto pos = lower.find(marker);
                if (pos != std::string::npos && pos > 0)
                    cut = std::min(cut, pos);
            }
            return utils::trim(cut == std::string::npos ? segment : segment.substr(0, cut));
        }

        /// Lower-cases ASCII plus the Czech capitals, which are two bytes in UTF-8
        std::string fold_case(const std::string &s) {
            static const std::pair<const char *, const char *> kCzech[] = {
                {"Á", "á"}, {"Č", "č"}, {"Ď", "ď"}, {"É", "é"}, {"Ě", "ě"}, {"Í", "í"}, {"Ň", "ň"},
                {"Ó", "ó"}, {"Ř", "ř"}, {"Š", "š"}, {"Ť", "ť"}, {"Ú", "ú"}, {"Ů", "ů"}, {"Ý", "ý"}, {"Ž", "ž"}};
            std::string out = ascii_lower(s);
            for (const auto &[upper, lower] : kCzech) {
                const std::string from(upper);
                for (auto pos = out.find(from); pos != std::string::npos; pos = out.find(from, pos + 2))
                    out.replace(pos, from.size(), lower);
            }
            return out;
        }

        bool is_qualifier(const std::string &segment) {
            const std::string lower = fold_case(segment);
            for (const char *country : {"česká republika", "czech republic", "czechia"}) {
                if (lower == country)
                    return true;
            }
            std::istringstream words(lower);
            std::string word;
            while (words >> word) {
                if (word == "kraj" || word == "okres" || word == "district" || word == "region")
                    return true;
            }
            return false;
        }

        bool looks_like_street_number(const std::string &segment) {
            static const std::regex street(R"(.*\S\s+\d+[A-Za-z]?(/\d+[A-Za-z]?)?)");
            return std::regex_match(segment, street);
        }

    } // namespace

    std::string extract_geocode_query(const std::string &location_text) {
        if (utils::is_blank(location_text))
            return {};

        std::vector<std::string> raw;
        std::vector<std::string> kept;
        for (const auto &part : split(location_text, ',')) {
            std::string segment = utils::trim(part);
            if (segment.empty())
                continue;
            raw.push_back(segment);

            segment = strip_district_suffix(segment);
            if (segment.empty() || is_qualifier(segment))
                continue;
            kept.push_back(segment);
        }

        // Nothing but qualifiers ("Jihomoravský kraj"): still better than no query
        if (kept.empty())
            return raw.empty() ? std::string{} : raw.front();

        if (kept.size() > 1 && looks_like_street_number(kept.front()))
            return kept[1];
        return kept.front();
    }

    // ------------------------------------------------------------ BulkEnricher

    BulkEnricher::BulkEnricher(PointStore &store, const Geocoder &geocoder, EnrichConfig config)
        : BulkEnricher(store, geocoder, config, RateLimiter(config.min_request_interval)) {}

    BulkEnricher::BulkEnricher(PointStore &store, const Geocoder &geocoder, EnrichConfig config, RateLimiter limiter)
        : store_(store), geocoder_(geocoder), config_(config), limiter_(std::move(limiter)) {}

    int BulkEnricher::clamp_batch_size(int batch_size) const {
        return std::clamp(batch_size, config_.min_batch_size, config_.max_batch_size);
    }

    EnrichReport BulkEnricher::enrich_batch(int batch_size, std::stop_token stop) {
        std::lock_guard<std::mutex> lock(mutex_);
        EnrichReport report;
        const auto pending = store_.pending_geocode(clamp_batch_size(batch_size));
        const auto started = std::chrono::steady_clock::now();

        for (const auto &item : pending) {
            if (stop.stop_requested() || !limiter_.acquire(stop)) {
                report.cancelled = true;
                break;
            }
            ++report.attempted;

            const std::string query = extract_geocode_query(item.location_text);
            if (query.empty()) {
                ++report.failed;
                continue;
            }

            auto hit = geocoder_.resolve(query);
            if (!hit) {
                ++report.failed;
                std::cerr << "Warning: no coordinate for listing " << item.id << " ('" << query << "')" << std::endl;
                continue;
            }

            store_.fill_coordinate(item.id, *hit, GeocodeSource::ExternalGeocoder);
            ++report.succeeded;
        }

        auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started);
        if (report.attempted > 0)
            report.avg_latency_ms = elapsed.count() / report.attempted;
        report.remaining = store_.count_without_coordinates();

        std::clog << "Bulk geocoding " << (report.cancelled ? "cancelled" : "finished") << ": attempted "
                  << report.attempted << ", succeeded " << report.succeeded << ", failed " << report.failed
                  << ", remaining " << report.remaining << std::endl;
        return report;
    }

    bool BulkEnricher::regeocode(std::int64_t listing_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto text = store_.location_text(listing_id);
        if (!text)
            throw NotFound("no listing with id " + std::to_string(listing_id), std::to_string(listing_id));

        const std::string query = extract_geocode_query(*text);
        if (query.empty())
            return false;

        if (!limiter_.acquire())
            return false;
        auto hit = geocoder_.resolve(query);
        if (!hit)
            return false;
        store_.set_coordinate(listing_id, *hit, GeocodeSource::ExternalGeocoder);
        return true;
    }

} // namespace geotrax
