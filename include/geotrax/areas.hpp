#pragma once

#include <optional>
#include <string>
#include <vector>

#include "geotrax/store.hpp"
#include "geotrax/types.hpp"

namespace geotrax {

    /**
     * @brief Optional descriptive fields of a saved area
     */
    struct AreaMetadata {
        std::optional<std::string> description;
        std::optional<std::string> start_label;
        std::optional<std::string> end_label;
        std::optional<int> buffer_meters;
    };

    /**
     * @brief Named areas kept for reuse
     *
     * Insert-only: there is no update. Saving the same geometry again, under
     * any name, creates a new row, so area history stays auditable.
     */
    class AreaRegistry {
        PointStore &store_;

      public:
        explicit AreaRegistry(PointStore &store);

        /**
         * @brief Insert a new area
         *
         * @return Generated area id (UUID)
         * @throws ValidationError if name or geometry is empty
         * @throws PersistenceError if the insert fails
         */
        std::string save_area(const std::string &name, const std::string &geometry_wkt, AreaType type,
                              const AreaMetadata &metadata = {});

        /// Most recent first
        std::vector<SavedArea> list_areas(bool active_only = true);

        std::optional<SavedArea> get_area(const std::string &id);

        /**
         * @brief Soft delete: clear the active flag
         *
         * @return false if there is no such active area
         */
        bool deactivate_area(const std::string &id);
    };

} // namespace geotrax
