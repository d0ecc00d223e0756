#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

#include "geotrax/config.hpp"
#include "geotrax/geocoder.hpp"
#include "geotrax/store.hpp"

namespace geotrax {

    /**
     * @brief Enforces a minimum interval between consecutive calls
     *
     * The clock and the sleep are injectable so tests run without waiting.
     */
    class RateLimiter {
      public:
        using Clock = std::chrono::steady_clock;
        using Now = std::function<Clock::time_point()>;
        using Sleeper = std::function<void(std::chrono::milliseconds, std::stop_token)>;

        explicit RateLimiter(std::chrono::milliseconds interval, Sleeper sleeper = {}, Now now = {});

        /**
         * @brief Block until the interval since the previous acquire has passed
         *
         * Returns early, without recording a call, if stop is requested while waiting.
         *
         * @return false if interrupted by stop
         */
        bool acquire(std::stop_token stop = {});

        std::chrono::milliseconds interval() const { return interval_; }

      private:
        std::chrono::milliseconds interval_;
        Sleeper sleeper_;
        Now now_;
        std::optional<Clock::time_point> last_;
    };

    /// Stop-aware sleep used by RateLimiter unless a test substitutes one
    void interruptible_sleep(std::chrono::milliseconds duration, std::stop_token stop);

    /**
     * @brief Outcome of one bulk-geocoding batch
     */
    struct EnrichReport {
        int attempted = 0;
        int succeeded = 0;
        int failed = 0;
        std::int64_t remaining = 0; ///< Active listings still without a coordinate
        double avg_latency_ms = 0.0;
        bool cancelled = false;
    };

    /**
     * @brief Turn free-text listing location into a geocoding query
     *
     * Best effort, not an address parser: drops region/district/country
     * qualifiers and picks the first comma segment, or the next one when the
     * first looks like "street + house number". Usually yields a town name.
     *
     * @return Query text, empty if nothing usable remains
     */
    std::string extract_geocode_query(const std::string &location_text);

    /**
     * @brief Geocodes listings that still lack a coordinate
     *
     * Strictly sequential and rate limited; one listing failing never aborts
     * the batch. Only store failures are fatal. Batches and re-geocodes started
     * from several threads run one after another.
     */
    class BulkEnricher {
        PointStore &store_;
        const Geocoder &geocoder_;
        EnrichConfig config_;
        RateLimiter limiter_;
        std::mutex mutex_;

      public:
        BulkEnricher(PointStore &store, const Geocoder &geocoder, EnrichConfig config);
        BulkEnricher(PointStore &store, const Geocoder &geocoder, EnrichConfig config, RateLimiter limiter);

        /// batch_size clamped to the configured bounds
        int clamp_batch_size(int batch_size) const;

        /**
         * @brief Geocode up to batch_size listings
         *
         * Stop is checked before each listing; a stopped batch returns what it
         * did so far with cancelled set. Stored coordinates stay stored.
         *
         * @throws PersistenceError if a coordinate cannot be written
         */
        EnrichReport enrich_batch(int batch_size, std::stop_token stop = {});

        /**
         * @brief Explicitly re-geocode one listing, overwriting its coordinate on a hit
         *
         * @return true if a coordinate was found
         * @throws NotFound if the listing does not exist
         */
        bool regeocode(std::int64_t listing_id);
    };

} // namespace geotrax
