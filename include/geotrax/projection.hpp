#pragma once

#include <vector>

#include <concord/concord.hpp>
#include <concord/frame/convert.hpp>
#include <datapod/datapod.hpp>

#include "geotrax/geometry/types.hpp"
#include "geotrax/types.hpp"

namespace geotrax {

    /**
     * @brief Fixed regional metric frame
     *
     * East-north-up tangent plane anchored at one datum. Distances inside the
     * target country are metric to well under a percent, which is all the
     * corridor buffer needs. Every projection in geotrax goes through here.
     */
    class MetricProjection {
        datapod::Geo datum_;

      public:
        explicit MetricProjection(const datapod::Geo &datum) : datum_(datum) {}

        const datapod::Geo &datum() const { return datum_; }

        /**
         * @brief WGS84 degrees -> metres east/north/up of the datum
         *
         * The point is taken on the ellipsoid surface, so z is the (negative)
         * drop of the surface below the tangent plane.
         */
        inline datapod::Point forward(const Coordinate &c) const {
            concord::earth::WGS wgs{c.latitude, c.longitude, 0.0};
            auto enu = concord::frame::to_enu(datum_, wgs);
            return datapod::Point{enu.east(), enu.north(), enu.up()};
        }

        /// Exact inverse of forward(), z included
        inline Coordinate inverse(const datapod::Point &p) const {
            concord::frame::ENU enu{p.x, p.y, p.z, datum_};
            auto wgs = concord::frame::to_wgs(enu);
            return Coordinate{wgs.latitude, wgs.longitude};
        }

        /**
         * @brief Surface point whose east/north equal (x, y)
         *
         * Planar geometry (buffers) carries no z. The surface drop is solved for
         * by fixed-point iteration; it converges by a factor of distance/radius
         * per step, so a few steps reach well below a millimetre.
         */
        inline Coordinate inverse_planar(double x, double y) const {
            double z = 0.0;
            Coordinate c = inverse(datapod::Point{x, y, z});
            for (int i = 0; i < 4; ++i) {
                z = forward(c).z;
                c = inverse(datapod::Point{x, y, z});
            }
            return c;
        }

        inline BLineString forward(const GeoLine &line) const {
            BLineString out;
            out.reserve(line.size());
            for (const auto &c : line) {
                auto p = forward(c);
                out.emplace_back(p.x, p.y);
            }
            return out;
        }

        /**
         * @brief Project a metric polygon back to geographic degrees
         *
         * Output polygons use the geographic convention of geometry/types.hpp
         * (x = longitude, y = latitude).
         */
        inline BPolygon inverse(const BPolygon &poly) const {
            BPolygon out;
            auto ring_back = [this](const auto &in, auto &ring) {
                ring.reserve(in.size());
                for (const auto &p : in) {
                    auto c = inverse_planar(p.x(), p.y());
                    ring.emplace_back(c.longitude, c.latitude);
                }
            };
            ring_back(poly.outer(), out.outer());
            out.inners().resize(poly.inners().size());
            for (std::size_t i = 0; i < poly.inners().size(); ++i)
                ring_back(poly.inners()[i], out.inners()[i]);
            boost::geometry::correct(out);
            return out;
        }

        inline BMultiPolygon inverse(const BMultiPolygon &area) const {
            BMultiPolygon out;
            out.reserve(area.size());
            for (const auto &poly : area)
                out.push_back(inverse(poly));
            return out;
        }

        /// Geographic polygon -> metric polygon
        inline BPolygon forward(const BPolygon &poly) const {
            BPolygon out;
            auto ring_fwd = [this](const auto &in, auto &ring) {
                ring.reserve(in.size());
                for (const auto &p : in) {
                    auto m = forward(Coordinate{p.y(), p.x()});
                    ring.emplace_back(m.x, m.y);
                }
            };
            ring_fwd(poly.outer(), out.outer());
            out.inners().resize(poly.inners().size());
            for (std::size_t i = 0; i < poly.inners().size(); ++i)
                ring_fwd(poly.inners()[i], out.inners()[i]);
            boost::geometry::correct(out);
            return out;
        }
    };

} // namespace geotrax
