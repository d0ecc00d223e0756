#include "geotrax/store.hpp"
#include "geotrax/errors.hpp"
#include "geotrax/utils/utils.hpp"
#include "geotrax/wkt.hpp"

#include <iostream>
#include <memory>

namespace geotrax {

    namespace {

        const char kAreaPointerType[] = "geotrax_area";

        struct StmtDeleter {
            void operator()(sqlite3_stmt *stmt) const { sqlite3_finalize(stmt); }
        };
        using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

        void delete_area(void *p) { delete static_cast<BMultiPolygon *>(p); }

        /// geo_within(area, lon, lat): 1 if the point is inside or on the area, NULL for a NULL point
        void geo_within(sqlite3_context *ctx, int argc, sqlite3_value **argv) {
            if (argc != 3) {
                sqlite3_result_error(ctx, "geo_within expects (area, lon, lat)", -1);
                return;
            }
            if (sqlite3_value_type(argv[1]) == SQLITE_NULL || sqlite3_value_type(argv[2]) == SQLITE_NULL) {
                sqlite3_result_null(ctx);
                return;
            }
            const BPoint pt(sqlite3_value_double(argv[1]), sqlite3_value_double(argv[2]));

            try {
                if (auto bound = static_cast<const BMultiPolygon *>(sqlite3_value_pointer(argv[0], kAreaPointerType))) {
                    sqlite3_result_int(ctx, boost::geometry::covered_by(pt, *bound) ? 1 : 0);
                    return;
                }
                // Text areas are parsed once per statement and kept as auxdata while the argument is constant
                if (auto cached = static_cast<const BMultiPolygon *>(sqlite3_get_auxdata(ctx, 0))) {
                    sqlite3_result_int(ctx, boost::geometry::covered_by(pt, *cached) ? 1 : 0);
                    return;
                }
                if (sqlite3_value_type(argv[0]) != SQLITE_TEXT) {
                    sqlite3_result_error(ctx, "geo_within: area must be geometry text or a bound area", -1);
                    return;
                }
                const char *text = reinterpret_cast<const char *>(sqlite3_value_text(argv[0]));
                BMultiPolygon parsed = wkt::parse_area(text ? text : "");
                const bool inside = boost::geometry::covered_by(pt, parsed);
                // SQLite may run the destructor right away, so the result is computed first
                sqlite3_set_auxdata(ctx, 0, std::make_unique<BMultiPolygon>(std::move(parsed)).release(), delete_area);
                sqlite3_result_int(ctx, inside ? 1 : 0);
            } catch (const std::exception &e) {
                sqlite3_result_error(ctx, e.what(), -1);
            }
        }

        const char *kSchema[] = {
            R"(CREATE TABLE IF NOT EXISTS listings (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                external_id TEXT NOT NULL UNIQUE,
                title TEXT NOT NULL,
                price REAL,
                location_text TEXT NOT NULL DEFAULT '',
                property_type TEXT NOT NULL DEFAULT '',
                offer_type TEXT NOT NULL DEFAULT '',
                thumbnail_url TEXT,
                source_code TEXT NOT NULL DEFAULT '',
                is_active INTEGER NOT NULL DEFAULT 1,
                latitude REAL,
                longitude REAL,
                geocode_source TEXT NOT NULL DEFAULT 'none',
                geocoded_at TEXT,
                first_seen_at TEXT NOT NULL
            ))",
            "CREATE INDEX IF NOT EXISTS idx_listings_coords ON listings(latitude, longitude) "
            "WHERE latitude IS NOT NULL",
            "CREATE INDEX IF NOT EXISTS idx_listings_pending ON listings(first_seen_at) WHERE latitude IS NULL",
            R"(CREATE TABLE IF NOT EXISTS spatial_areas (
                id TEXT PRIMARY KEY,
                name TEXT NOT NULL,
                description TEXT,
                area_type TEXT NOT NULL,
                geometry_wkt TEXT NOT NULL,
                start_label TEXT,
                end_label TEXT,
                buffer_m INTEGER,
                is_active INTEGER NOT NULL DEFAULT 1,
                created_at TEXT NOT NULL,
                updated_at TEXT NOT NULL
            ))",
            "CREATE INDEX IF NOT EXISTS idx_spatial_areas_created ON spatial_areas(created_at)",
            R"(CREATE TRIGGER IF NOT EXISTS spatial_areas_geometry_immutable
                BEFORE UPDATE OF geometry_wkt ON spatial_areas
                BEGIN SELECT RAISE(ABORT, 'area geometry is immutable'); END)",
        };

    } // namespace

    // ---------------------------------------------------------------- Database

    Database::Database(const std::string &path, std::chrono::milliseconds busy_timeout) : path_(path) {
        int flags = SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
        int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
        if (rc != SQLITE_OK) {
            std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
            sqlite3_close(db_);
            db_ = nullptr;
            throw PersistenceError("failed to open database '" + path + "': " + error);
        }

        sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count()));
        try {
            execute("PRAGMA journal_mode = WAL");
            execute("PRAGMA foreign_keys = ON");
            register_functions();
        } catch (...) {
            sqlite3_close(db_);
            db_ = nullptr;
            throw;
        }
    }

    Database::~Database() {
        if (db_)
            sqlite3_close(db_);
    }

    void Database::register_functions() {
        int rc = sqlite3_create_function_v2(db_, "geo_within", 3, SQLITE_UTF8 | SQLITE_DETERMINISTIC, nullptr,
                                            geo_within, nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK)
            throw PersistenceError("failed to register geo_within: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_stmt *Database::prepare(const std::string &sql, const std::vector<SqlValue> &params) {
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
            throw PersistenceError("failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));

        StmtPtr guard(stmt);
        int index = 1;
        for (const auto &param : params)
            bind_value(guard.get(), index++, param);
        return guard.release();
    }

    int Database::execute(const std::string &sql, const std::vector<SqlValue> &params) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        StmtPtr stmt(prepare(sql, params));
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        }
        if (rc != SQLITE_DONE)
            throw PersistenceError("execution failed: " + std::string(sqlite3_errmsg(db_)));
        return sqlite3_changes(db_);
    }

    std::vector<SqlRow> Database::query(const std::string &sql, const std::vector<SqlValue> &params) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        StmtPtr stmt(prepare(sql, params));
        std::vector<SqlRow> rows;
        const int columns = sqlite3_column_count(stmt.get());

        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            SqlRow row;
            row.reserve(static_cast<std::size_t>(columns));
            for (int i = 0; i < columns; ++i)
                row.push_back(extract_column(stmt.get(), i));
            rows.push_back(std::move(row));
        }
        if (rc != SQLITE_DONE)
            throw PersistenceError("query failed: " + std::string(sqlite3_errmsg(db_)));
        return rows;
    }

    void Database::begin_transaction() { execute("BEGIN IMMEDIATE"); }

    void Database::commit() { execute("COMMIT"); }

    void Database::rollback() { execute("ROLLBACK"); }

    void Database::bind_value(sqlite3_stmt *stmt, int index, const SqlValue &value) {
        int rc = std::visit(
            [&](auto &&v) -> int {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::nullptr_t>) {
                    return sqlite3_bind_null(stmt, index);
                } else if constexpr (std::is_same_v<T, std::int64_t>) {
                    return sqlite3_bind_int64(stmt, index, v);
                } else if constexpr (std::is_same_v<T, double>) {
                    return sqlite3_bind_double(stmt, index, v);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return sqlite3_bind_text(stmt, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
                } else {
                    return sqlite3_bind_pointer(stmt, index, const_cast<BMultiPolygon *>(v.area), kAreaPointerType,
                                                nullptr);
                }
            },
            value);
        if (rc != SQLITE_OK)
            throw PersistenceError("failed to bind parameter " + std::to_string(index) + ": " +
                                   std::string(sqlite3_errmsg(db_)));
    }

    SqlValue Database::extract_column(sqlite3_stmt *stmt, int index) {
        switch (sqlite3_column_type(stmt, index)) {
        case SQLITE_INTEGER:
            return static_cast<std::int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, index));
            return std::string(text ? text : "");
        }
        case SQLITE_NULL:
        default:
            return nullptr;
        }
    }

    // ------------------------------------------------------------- Transaction

    Transaction::Transaction(Database &db) : db_(db), lock_(db.mutex()) { db_.begin_transaction(); }

    Transaction::~Transaction() {
        if (!completed_) {
            try {
                db_.rollback();
            } catch (const PersistenceError &e) {
                std::cerr << "Error: transaction rollback failed: " << e.what() << std::endl;
            }
        }
    }

    void Transaction::commit() {
        db_.commit();
        completed_ = true;
    }

    void Transaction::rollback() {
        db_.rollback();
        completed_ = true;
    }

    // -------------------------------------------------------------- PointStore

    PointStore::PointStore(const StoreConfig &config) : db_(config.path, config.busy_timeout) {
        for (const char *stmt : kSchema)
            db_.execute(stmt);
    }

    std::int64_t PointStore::insert_listing(const ListingRecord &record) {
        if (utils::is_blank(record.external_id))
            throw ValidationError("listing external id must not be empty");

        Transaction tx(db_);
        db_.execute(R"(INSERT INTO listings (external_id, title, price, location_text, property_type, offer_type,
                                             thumbnail_url, source_code, is_active, first_seen_at)
                       VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
                       ON CONFLICT(external_id) DO UPDATE SET
                           title = excluded.title,
                           price = excluded.price,
                           location_text = excluded.location_text,
                           property_type = excluded.property_type,
                           offer_type = excluded.offer_type,
                           thumbnail_url = excluded.thumbnail_url,
                           source_code = excluded.source_code,
                           is_active = excluded.is_active)",
                    {record.external_id, record.title, sql::optional_value(record.price), record.location_text,
                     record.property_type, record.offer_type, sql::optional_value(record.thumbnail_url),
                     record.source_code, std::int64_t{record.active ? 1 : 0},
                     record.first_seen_at.empty() ? utils::now_iso8601() : record.first_seen_at});

        auto rows = db_.query("SELECT id FROM listings WHERE external_id = ?", {record.external_id});
        if (rows.empty())
            throw PersistenceError("listing '" + record.external_id + "' vanished after insert");
        const std::int64_t id = sql::as_int(rows.front()[0]);

        if (record.coordinate) {
            if (!utils::in_range(*record.coordinate))
                throw ValidationError("listing '" + record.external_id + "' has an out-of-range coordinate");
            fill_coordinate(id, *record.coordinate, GeocodeSource::ProviderSupplied);
        }

        tx.commit();
        return id;
    }

    GeocodeState PointStore::geocode_state(std::int64_t id) {
        auto rows =
            db_.query("SELECT latitude, longitude, geocode_source, geocoded_at FROM listings WHERE id = ?", {id});
        if (rows.empty())
            throw NotFound("no listing with id " + std::to_string(id), std::to_string(id));

        const auto &row = rows.front();
        GeocodeState state;
        if (!sql::is_null(row[0]) && !sql::is_null(row[1]))
            state.coordinate = Coordinate{sql::as_double(row[0]), sql::as_double(row[1])};
        state.source = geocode_source_from_string(sql::as_text(row[2]));
        state.geocoded_at = sql::as_optional_text(row[3]);
        return state;
    }

    std::optional<std::string> PointStore::location_text(std::int64_t id) {
        auto rows = db_.query("SELECT location_text FROM listings WHERE id = ?", {id});
        if (rows.empty())
            return std::nullopt;
        return sql::as_text(rows.front()[0]);
    }

    bool PointStore::set_coordinate(std::int64_t id, const Coordinate &c, GeocodeSource source) {
        const std::string src = to_string(source);
        return db_.execute(R"(UPDATE listings
                       SET latitude = ?, longitude = ?, geocode_source = ?, geocoded_at = ?
                       WHERE id = ?
                         AND (latitude IS NULL OR longitude IS NULL
                              OR latitude <> ? OR longitude <> ? OR geocode_source <> ?))",
                    {c.latitude, c.longitude, src, utils::now_iso8601(), id, c.latitude, c.longitude, src}) > 0;
    }

    bool PointStore::fill_coordinate(std::int64_t id, const Coordinate &c, GeocodeSource source) {
        return db_.execute(R"(UPDATE listings
                       SET latitude = ?, longitude = ?, geocode_source = ?, geocoded_at = ?
                       WHERE id = ? AND latitude IS NULL)",
                    {c.latitude, c.longitude, to_string(source), utils::now_iso8601(), id}) > 0;
    }

    std::vector<PendingListing> PointStore::pending_geocode(int limit) {
        auto rows = db_.query(R"(SELECT id, location_text FROM listings
                                 WHERE is_active = 1 AND latitude IS NULL AND TRIM(location_text) <> ''
                                 ORDER BY first_seen_at DESC, id ASC
                                 LIMIT ?)",
                              {std::int64_t{limit}});
        std::vector<PendingListing> out;
        out.reserve(rows.size());
        for (const auto &row : rows)
            out.push_back(PendingListing{sql::as_int(row[0]), sql::as_text(row[1])});
        return out;
    }

    std::int64_t PointStore::count_without_coordinates() {
        auto rows = db_.query("SELECT COUNT(*) FROM listings WHERE is_active = 1 AND latitude IS NULL");
        return rows.empty() ? 0 : sql::as_int(rows.front()[0]);
    }

    GeocodeStats PointStore::stats() {
        auto rows = db_.query(R"(SELECT COUNT(*),
                                        COUNT(latitude),
                                        COALESCE(SUM(CASE WHEN is_active = 1 AND latitude IS NULL THEN 1 ELSE 0 END), 0),
                                        COALESCE(SUM(CASE WHEN geocode_source = ? THEN 1 ELSE 0 END), 0),
                                        COALESCE(SUM(CASE WHEN geocode_source = ? THEN 1 ELSE 0 END), 0),
                                        COALESCE(SUM(CASE WHEN geocode_source = ? THEN 1 ELSE 0 END), 0)
                                 FROM listings)",
                              {to_string(GeocodeSource::ProviderSupplied), to_string(GeocodeSource::ExternalGeocoder),
                               to_string(GeocodeSource::Manual)});
        GeocodeStats stats;
        if (rows.empty())
            return stats;
        const auto &row = rows.front();
        stats.total = sql::as_int(row[0]);
        stats.with_coordinates = sql::as_int(row[1]);
        stats.active_without_coordinates = sql::as_int(row[2]);
        stats.from_provider = sql::as_int(row[3]);
        stats.from_geocoder = sql::as_int(row[4]);
        stats.manual = sql::as_int(row[5]);
        return stats;
    }

    bool PointStore::set_active(std::int64_t id, bool active) {
        return db_.execute("UPDATE listings SET is_active = ? WHERE id = ?", {std::int64_t{active ? 1 : 0}, id}) > 0;
    }

} // namespace geotrax
