#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <locale>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "geotrax/geometry/types.hpp"
#include "geotrax/types.hpp"

namespace geotrax {

    namespace utils {

        /**
         * @brief Trim ASCII whitespace from both ends
         */
        inline std::string trim(const std::string &s) {
            auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
            auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); });
            if (begin >= end.base())
                return {};
            return std::string(begin, end.base());
        }

        inline bool is_blank(const std::string &s) {
            return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
        }

        /**
         * @brief Parse a complete decimal number in the C locale
         *
         * @return nullopt unless the whole text (surrounding whitespace aside) is one finite number
         */
        inline std::optional<double> parse_double(const std::string &text) {
            std::string t = trim(text);
            if (t.empty())
                return std::nullopt;
            std::istringstream is(t);
            is.imbue(std::locale::classic());
            double v = 0.0;
            is >> v;
            if (is.fail() || !std::isfinite(v))
                return std::nullopt;
            is >> std::ws;
            if (!is.eof())
                return std::nullopt;
            return v;
        }

        /**
         * @brief Current UTC time as ISO-8601 with milliseconds, e.g. 2024-05-01T12:00:00.123Z
         *
         * Fixed width, so string order is time order.
         */
        inline std::string now_iso8601() {
            auto now = std::chrono::system_clock::now();
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
            std::time_t t = std::chrono::system_clock::to_time_t(now);
            std::tm tm{};
            gmtime_r(&t, &tm);

            std::ostringstream os;
            os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms.count()
               << 'Z';
            return os.str();
        }

        /**
         * @brief Check if two coordinates are approximately equal
         *
         * @param a First coordinate
         * @param b Second coordinate
         * @param epsilon Tolerance in degrees
         * @return true if coordinates are approximately equal
         */
        inline bool points_equal(const Coordinate &a, const Coordinate &b, double epsilon = 1e-9) {
            return std::abs(a.latitude - b.latitude) < epsilon && std::abs(a.longitude - b.longitude) < epsilon;
        }

        /// A line is degenerate if it has fewer than two distinct points
        inline bool is_degenerate(const GeoLine &line) {
            if (line.size() < 2)
                return true;
            return std::all_of(line.begin() + 1, line.end(),
                               [&](const Coordinate &c) { return points_equal(c, line.front()); });
        }

        inline bool in_range(const Coordinate &c) {
            return std::isfinite(c.latitude) && std::isfinite(c.longitude) && c.latitude >= -90.0 &&
                   c.latitude <= 90.0 && c.longitude >= -180.0 && c.longitude <= 180.0;
        }

        /**
         * @brief Geographic bounding box of an area (x = lon, y = lat)
         */
        inline BoundingBox envelope(const BMultiPolygon &area) {
            BBox box;
            boost::geometry::envelope(area, box);
            return BoundingBox{box.min_corner().y(), box.min_corner().x(), box.max_corner().y(),
                               box.max_corner().x()};
        }

    } // namespace utils

} // namespace geotrax
