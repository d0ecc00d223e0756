#include "geotrax/areas.hpp"
#include "geotrax/errors.hpp"
#include "geotrax/utils/utils.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace geotrax {

    namespace {

        const char *kAreaColumns = "id, name, description, area_type, geometry_wkt, start_label, end_label, buffer_m, "
                                   "is_active, created_at, updated_at";

        SavedArea to_area(const SqlRow &row) {
            SavedArea a;
            a.id = sql::as_text(row[0]);
            a.name = sql::as_text(row[1]);
            a.description = sql::as_optional_text(row[2]);
            a.type = area_type_from_string(sql::as_text(row[3]));
            a.geometry_wkt = sql::as_text(row[4]);
            a.start_label = sql::as_optional_text(row[5]);
            a.end_label = sql::as_optional_text(row[6]);
            if (!sql::is_null(row[7]))
                a.buffer_meters = static_cast<int>(sql::as_int(row[7]));
            a.active = sql::as_int(row[8]) != 0;
            a.created_at = sql::as_text(row[9]);
            a.updated_at = sql::as_text(row[10]);
            return a;
        }

    } // namespace

    AreaRegistry::AreaRegistry(PointStore &store) : store_(store) {}

    std::string AreaRegistry::save_area(const std::string &name, const std::string &geometry_wkt, AreaType type,
                                        const AreaMetadata &metadata) {
        if (utils::is_blank(name))
            throw ValidationError("area name must not be empty");
        if (utils::is_blank(geometry_wkt))
            throw ValidationError("area geometry must not be empty");

        const std::string id = boost::uuids::to_string(boost::uuids::random_generator()());
        const std::string now = utils::now_iso8601();

        SqlValue buffer = nullptr;
        if (metadata.buffer_meters)
            buffer = static_cast<std::int64_t>(*metadata.buffer_meters);

        store_.db().execute(R"(INSERT INTO spatial_areas (id, name, description, area_type, geometry_wkt,
                                                          start_label, end_label, buffer_m, is_active,
                                                          created_at, updated_at)
                               VALUES (?, ?, ?, ?, ?, ?, ?, ?, 1, ?, ?))",
                            {id, utils::trim(name), sql::optional_value(metadata.description), to_string(type),
                             geometry_wkt, sql::optional_value(metadata.start_label),
                             sql::optional_value(metadata.end_label), buffer, now, now});
        return id;
    }

    std::vector<SavedArea> AreaRegistry::list_areas(bool active_only) {
        std::string query = std::string("SELECT ") + kAreaColumns + " FROM spatial_areas";
        if (active_only)
            query += " WHERE is_active = 1";
        // created_at has millisecond resolution; rowid orders saves within the same millisecond
        query += " ORDER BY created_at DESC, rowid DESC";

        auto rows = store_.db().query(query);
        std::vector<SavedArea> out;
        out.reserve(rows.size());
        for (const auto &row : rows)
            out.push_back(to_area(row));
        return out;
    }

    std::optional<SavedArea> AreaRegistry::get_area(const std::string &id) {
        auto rows = store_.db().query(std::string("SELECT ") + kAreaColumns + " FROM spatial_areas WHERE id = ?", {id});
        if (rows.empty())
            return std::nullopt;
        return to_area(rows.front());
    }

    bool AreaRegistry::deactivate_area(const std::string &id) {
        return store_.db().execute(
                   "UPDATE spatial_areas SET is_active = 0, updated_at = ? WHERE id = ? AND is_active = 1",
                   {utils::now_iso8601(), id}) > 0;
    }

} // namespace geotrax
