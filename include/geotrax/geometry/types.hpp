#pragma once

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>

namespace geotrax {

    // Boost.Geometry models shared by both coordinate spaces:
    //   geographic: x = longitude, y = latitude (degrees)
    //   metric:     x = east, y = north (metres in the regional frame)
    using BPoint = boost::geometry::model::d2::point_xy<double>;
    using BLineString = boost::geometry::model::linestring<BPoint>;
    using BPolygon = boost::geometry::model::polygon<BPoint>;
    using BMultiPolygon = boost::geometry::model::multi_polygon<BPolygon>;
    using BBox = boost::geometry::model::box<BPoint>;

} // namespace geotrax
