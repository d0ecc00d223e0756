#pragma once

#include <cmath>
#include <iostream>

#include <boost/geometry.hpp>
#include <boost/geometry/algorithms/buffer.hpp>
#include <boost/geometry/strategies/buffer.hpp>

#include "geotrax/geometry/types.hpp"

namespace geotrax {
    namespace geometry {

        /**
         * @brief Buffer a metric line into its corridor
         *
         * Round joins and round ends, so every point of the result is within
         * distance of the line and every point within distance is covered (up to
         * the circle discretisation). A degenerate line (all vertices equal)
         * buffers to a circle.
         *
         * @param line Line in metres
         * @param distance Buffer distance in metres, must be positive
         * @param points_per_circle Vertices used to approximate a full circle
         * @return Buffered area, empty if Boost.Geometry fails
         */
        inline BMultiPolygon buffer_line(const BLineString &line, double distance, int points_per_circle = 36) {
            BMultiPolygon buffered;
            if (line.empty() || distance <= 0.0)
                return buffered;

            boost::geometry::strategy::buffer::distance_symmetric<double> dist_strategy(distance);
            boost::geometry::strategy::buffer::side_straight side_strategy;
            boost::geometry::strategy::buffer::join_round join_strategy(points_per_circle);
            boost::geometry::strategy::buffer::end_round end_strategy(points_per_circle);
            boost::geometry::strategy::buffer::point_circle point_strategy(points_per_circle);

            try {
                boost::geometry::buffer(line, buffered, dist_strategy, side_strategy, join_strategy, end_strategy,
                                        point_strategy);
            } catch (const std::exception &e) {
                std::cerr << "Error: buffer operation failed: " << e.what() << std::endl;
                buffered.clear();
            }
            return buffered;
        }

        /// Area of a metric polygon set, square metres
        inline double area(const BMultiPolygon &area) { return std::abs(boost::geometry::area(area)); }

    } // namespace geometry
} // namespace geotrax
