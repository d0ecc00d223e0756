#include "geotrax/track.hpp"
#include "geotrax/errors.hpp"
#include "geotrax/utils/utils.hpp"

#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>

#include <libxml/parser.h>
#include <libxml/tree.h>

namespace geotrax {

    namespace {

        struct DocDeleter {
            void operator()(xmlDoc *doc) const { xmlFreeDoc(doc); }
        };

        bool named(const xmlNode *node, const char *name) {
            return node->type == XML_ELEMENT_NODE && std::strcmp(reinterpret_cast<const char *>(node->name), name) == 0;
        }

        std::optional<double> attribute(const xmlNode *node, const char *name) {
            xmlChar *value = xmlGetProp(node, reinterpret_cast<const xmlChar *>(name));
            if (!value)
                return std::nullopt;
            std::string text(reinterpret_cast<const char *>(value));
            xmlFree(value);
            return utils::parse_double(text);
        }

        std::string child_text(const xmlNode *node, const char *name) {
            for (const xmlNode *child = node->children; child; child = child->next) {
                if (!named(child, name))
                    continue;
                xmlChar *content = xmlNodeGetContent(child);
                if (!content)
                    return {};
                std::string text(reinterpret_cast<const char *>(content));
                xmlFree(content);
                return utils::trim(text);
            }
            return {};
        }

        void append_point(const xmlNode *node, GeoLine &line) {
            auto lat = attribute(node, "lat");
            auto lon = attribute(node, "lon");
            if (!lat || !lon)
                return;
            Coordinate c{*lat, *lon};
            if (utils::in_range(c))
                line.push_back(c);
        }

        /// trkpt lives in trk/trkseg, rtept in rte, wpt directly under gpx
        void collect(const xmlNode *root, const char *kind, GeoLine &line, std::string &name) {
            for (const xmlNode *child = root->children; child; child = child->next) {
                if (child->type != XML_ELEMENT_NODE)
                    continue;

                if (std::strcmp(kind, "trkpt") == 0 && named(child, "trk")) {
                    if (name.empty())
                        name = child_text(child, "name");
                    for (const xmlNode *seg = child->children; seg; seg = seg->next) {
                        if (!named(seg, "trkseg"))
                            continue;
                        for (const xmlNode *pt = seg->children; pt; pt = pt->next) {
                            if (named(pt, "trkpt"))
                                append_point(pt, line);
                        }
                    }
                } else if (std::strcmp(kind, "rtept") == 0 && named(child, "rte")) {
                    if (name.empty())
                        name = child_text(child, "name");
                    for (const xmlNode *pt = child->children; pt; pt = pt->next) {
                        if (named(pt, "rtept"))
                            append_point(pt, line);
                    }
                } else if (std::strcmp(kind, "wpt") == 0 && named(child, "wpt")) {
                    append_point(child, line);
                }
            }
        }

    } // namespace

    TrackParseResult parse_track(const std::string &bytes) {
        if (utils::is_blank(bytes))
            throw TrackFormatError("track file is empty");

        // No network, no entity expansion, no noise on stderr
        const int options = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;
        std::unique_ptr<xmlDoc, DocDeleter> doc(
            xmlReadMemory(bytes.data(), static_cast<int>(bytes.size()), "track.gpx", nullptr, options));
        if (!doc)
            throw TrackFormatError("track file is not valid XML");

        const xmlNode *root = xmlDocGetRootElement(doc.get());
        if (!root || !named(root, "gpx"))
            throw TrackFormatError("track file is not GPX (root element is not <gpx>)");

        TrackParseResult result;
        for (const char *kind : {"trkpt", "rtept", "wpt"}) {
            GeoLine line;
            std::string name;
            collect(root, kind, line, name);
            if (line.size() >= 2) {
                result.line = std::move(line);
                result.name = std::move(name);
                break;
            }
        }

        if (result.line.size() < 2)
            throw EmptyTrackError("track has fewer than two usable points");

        result.start = result.line.front();
        result.end = result.line.back();
        result.point_count = result.line.size();
        return result;
    }

    TrackParseResult parse_track_file(const std::string &path) {
        std::ifstream in(path, std::ios::binary);
        if (!in)
            throw TrackFormatError("cannot read track file '" + path + "'");
        std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        return parse_track(bytes);
    }

} // namespace geotrax
