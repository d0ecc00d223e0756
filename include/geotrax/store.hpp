#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <sqlite3.h>

#include "geotrax/config.hpp"
#include "geotrax/geometry/types.hpp"
#include "geotrax/types.hpp"

namespace geotrax {

    /**
     * @brief In-memory area handed to the geo_within() SQL function
     *
     * Bound with sqlite3_bind_pointer, so the polygon is used as is without
     * being formatted to text and parsed back inside the statement.
     */
    struct AreaRef {
        const BMultiPolygon *area = nullptr;
    };

    using SqlValue = std::variant<std::nullptr_t, std::int64_t, double, std::string, AreaRef>;
    using SqlRow = std::vector<SqlValue>;

    namespace sql {

        inline bool is_null(const SqlValue &v) { return std::holds_alternative<std::nullptr_t>(v); }

        inline std::int64_t as_int(const SqlValue &v) {
            if (auto i = std::get_if<std::int64_t>(&v))
                return *i;
            if (auto d = std::get_if<double>(&v))
                return static_cast<std::int64_t>(*d);
            return 0;
        }

        inline double as_double(const SqlValue &v) {
            if (auto d = std::get_if<double>(&v))
                return *d;
            if (auto i = std::get_if<std::int64_t>(&v))
                return static_cast<double>(*i);
            return 0.0;
        }

        inline std::string as_text(const SqlValue &v) {
            if (auto s = std::get_if<std::string>(&v))
                return *s;
            return {};
        }

        inline std::optional<std::string> as_optional_text(const SqlValue &v) {
            if (is_null(v))
                return std::nullopt;
            return as_text(v);
        }

        inline std::optional<double> as_optional_double(const SqlValue &v) {
            if (is_null(v))
                return std::nullopt;
            return as_double(v);
        }

        template <typename T> SqlValue optional_value(const std::optional<T> &v) {
            if (!v)
                return nullptr;
            return SqlValue(*v);
        }

    } // namespace sql

    /**
     * @brief RAII SQLite connection
     *
     * Serialized threading mode, WAL journal, busy timeout. Every failure is a
     * PersistenceError. A statement and its change count run under one lock,
     * and a Transaction holds that lock until it ends, so a connection can be
     * shared between threads. The geo_within(area, lon, lat) function is registered
     * on open; area is either an AreaRef parameter or POLYGON/MULTIPOLYGON
     * text, and points on the boundary count as inside.
     */
    class Database {
        sqlite3 *db_ = nullptr;
        std::string path_;
        mutable std::recursive_mutex mutex_;

      public:
        explicit Database(const std::string &path,
                          std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));
        ~Database();

        Database(const Database &) = delete;
        Database &operator=(const Database &) = delete;

        /**
         * @brief Run a statement that returns no rows (or whose rows are ignored)
         *
         * @return Rows changed by this statement
         */
        int execute(const std::string &sql, const std::vector<SqlValue> &params = {});

        /// Run a statement and collect its rows, columns in select order
        std::vector<SqlRow> query(const std::string &sql, const std::vector<SqlValue> &params = {});

        const std::string &path() const { return path_; }

        sqlite3 *handle() const { return db_; }

        /// Held by Transaction for its whole lifetime
        std::recursive_mutex &mutex() const { return mutex_; }

        void begin_transaction();
        void commit();
        void rollback();

      private:
        void bind_value(sqlite3_stmt *stmt, int index, const SqlValue &value);
        SqlValue extract_column(sqlite3_stmt *stmt, int index);
        sqlite3_stmt *prepare(const std::string &sql, const std::vector<SqlValue> &params);
        void register_functions();
    };

    /**
     * @brief RAII transaction guard, rolls back unless committed
     */
    class Transaction {
        Database &db_;
        std::unique_lock<std::recursive_mutex> lock_;
        bool completed_ = false;

      public:
        explicit Transaction(Database &db);
        ~Transaction();

        Transaction(const Transaction &) = delete;
        Transaction &operator=(const Transaction &) = delete;

        void commit();
        void rollback();
    };

    /// Listing still waiting for a coordinate
    struct PendingListing {
        std::int64_t id = 0;
        std::string location_text;
    };

    /**
     * @brief Persisted listing coordinate pool and saved areas
     *
     * Owns the schema. Listing rows themselves belong to the listing subsystem;
     * this class only ingests the fields the spatial engine reads and manages
     * their geocode state.
     */
    class PointStore {
        Database db_;

      public:
        explicit PointStore(const StoreConfig &config);

        Database &db() { return db_; }

        /**
         * @brief Insert (or refresh, keyed by external id) a listing
         *
         * A supplied coordinate is stored with source provider-supplied. A
         * refresh never touches an existing coordinate.
         *
         * @return Stable row id, assigned in increasing order
         */
        std::int64_t insert_listing(const ListingRecord &record);

        /// @throws NotFound if there is no such listing
        GeocodeState geocode_state(std::int64_t id);

        std::optional<std::string> location_text(std::int64_t id);

        /**
         * @brief Overwrite a coordinate (explicit re-geocode or manual override)
         *
         * Set-if-different: writes, and stamps geocoded_at, only when the
         * coordinate or source changes.
         *
         * @return true if the row changed
         */
        bool set_coordinate(std::int64_t id, const Coordinate &c, GeocodeSource source);

        /**
         * @brief Store a coordinate only if the listing still has none
         *
         * @return true if the row changed
         */
        bool fill_coordinate(std::int64_t id, const Coordinate &c, GeocodeSource source);

        /// Active listings without a coordinate and with location text, newest first-seen first
        std::vector<PendingListing> pending_geocode(int limit);

        /// Active listings without a coordinate
        std::int64_t count_without_coordinates();

        GeocodeStats stats();

        bool set_active(std::int64_t id, bool active);
    };

} // namespace geotrax
