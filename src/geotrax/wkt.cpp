#include "geotrax/wkt.hpp"
#include "geotrax/errors.hpp"
#include "geotrax/utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <locale>
#include <sstream>

namespace geotrax {
    namespace wkt {

        namespace {

            std::ostringstream number_stream() {
                std::ostringstream os;
                os.imbue(std::locale::classic());
                os << std::setprecision(12);
                return os;
            }

            template <typename Ring> void write_ring(std::ostringstream &os, const Ring &ring) {
                os << '(';
                bool first = true;
                for (const auto &p : ring) {
                    if (!first)
                        os << ", ";
                    os << p.x() << ' ' << p.y();
                    first = false;
                }
                os << ')';
            }

            void write_polygon_body(std::ostringstream &os, const BPolygon &poly) {
                os << '(';
                write_ring(os, poly.outer());
                for (const auto &inner : poly.inners()) {
                    os << ", ";
                    write_ring(os, inner);
                }
                os << ')';
            }

            std::string upper_prefix(const std::string &text) {
                std::string t = utils::trim(text);
                std::string out;
                for (char c : t) {
                    if (!std::isalpha(static_cast<unsigned char>(c)))
                        break;
                    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
                }
                return out;
            }

        } // namespace

        std::string format_pair(const Coordinate &c) {
            auto os = number_stream();
            os << c.latitude << ',' << c.longitude;
            return os.str();
        }

        std::optional<Coordinate> parse_pair(const std::string &text) {
            auto comma = text.find(',');
            if (comma == std::string::npos || text.find(',', comma + 1) != std::string::npos)
                return std::nullopt;

            auto lat = utils::parse_double(text.substr(0, comma));
            auto lon = utils::parse_double(text.substr(comma + 1));
            if (!lat || !lon)
                return std::nullopt;
            if (*lat < -90.0 || *lat > 90.0 || *lon < -180.0 || *lon > 180.0)
                return std::nullopt;
            return Coordinate{*lat, *lon};
        }

        std::string point(const Coordinate &c) {
            auto os = number_stream();
            os << "POINT(" << c.longitude << ' ' << c.latitude << ')';
            return os.str();
        }

        std::string line(const GeoLine &line) {
            auto os = number_stream();
            os << "LINESTRING(";
            bool first = true;
            for (const auto &c : line) {
                if (!first)
                    os << ", ";
                os << c.longitude << ' ' << c.latitude;
                first = false;
            }
            os << ')';
            return os.str();
        }

        std::string polygon(const BPolygon &poly) {
            auto os = number_stream();
            os << "POLYGON";
            write_polygon_body(os, poly);
            return os.str();
        }

        std::string area(const BMultiPolygon &area) {
            if (area.size() == 1)
                return polygon(area.front());

            auto os = number_stream();
            if (area.empty()) {
                os << "POLYGON EMPTY";
                return os.str();
            }
            os << "MULTIPOLYGON(";
            for (std::size_t i = 0; i < area.size(); ++i) {
                if (i > 0)
                    os << ", ";
                write_polygon_body(os, area[i]);
            }
            os << ')';
            return os.str();
        }

        std::string bbox(const BoundingBox &box) {
            BPolygon poly;
            poly.outer().emplace_back(box.min_lon, box.min_lat);
            poly.outer().emplace_back(box.min_lon, box.max_lat);
            poly.outer().emplace_back(box.max_lon, box.max_lat);
            poly.outer().emplace_back(box.max_lon, box.min_lat);
            poly.outer().emplace_back(box.min_lon, box.min_lat);
            return polygon(poly);
        }

        GeoLine parse_line(const std::string &text) {
            if (upper_prefix(text) != "LINESTRING")
                throw ValidationError("expected LINESTRING geometry text");

            BLineString ls;
            try {
                boost::geometry::read_wkt(utils::trim(text), ls);
            } catch (const boost::geometry::read_wkt_exception &e) {
                throw ValidationError(std::string("malformed LINESTRING: ") + e.what());
            }
            if (ls.size() < 2)
                throw ValidationError("LINESTRING needs at least two points");
            return from_boost(ls);
        }

        BMultiPolygon parse_area(const std::string &text) {
            const std::string kind = upper_prefix(text);
            BMultiPolygon out;
            try {
                if (kind == "POLYGON") {
                    BPolygon poly;
                    boost::geometry::read_wkt(utils::trim(text), poly);
                    out.push_back(std::move(poly));
                } else if (kind == "MULTIPOLYGON") {
                    boost::geometry::read_wkt(utils::trim(text), out);
                } else {
                    throw ValidationError("expected POLYGON or MULTIPOLYGON geometry text");
                }
            } catch (const boost::geometry::read_wkt_exception &e) {
                throw ValidationError(std::string("malformed polygon text: ") + e.what());
            }

            out.erase(std::remove_if(out.begin(), out.end(), [](const BPolygon &p) { return p.outer().size() < 3; }),
                      out.end());
            if (out.empty())
                throw ValidationError("polygon text has no usable ring");

            // read_wkt keeps whatever closure/orientation the text had
            boost::geometry::correct(out);
            return out;
        }

        BLineString to_boost(const GeoLine &line) {
            BLineString ls;
            ls.reserve(line.size());
            for (const auto &c : line)
                ls.emplace_back(c.longitude, c.latitude);
            return ls;
        }

        GeoLine from_boost(const BLineString &line) {
            GeoLine out;
            out.reserve(line.size());
            for (const auto &p : line)
                out.push_back(Coordinate{p.y(), p.x()});
            return out;
        }

    } // namespace wkt
} // namespace geotrax
