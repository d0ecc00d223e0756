#include "geotrax/types.hpp"
#include "geotrax/errors.hpp"

namespace geotrax {

    std::string to_string(GeocodeSource source) {
        switch (source) {
        case GeocodeSource::None:
            return "none";
        case GeocodeSource::ExternalGeocoder:
            return "external-geocoder";
        case GeocodeSource::Manual:
            return "manual";
        case GeocodeSource::ProviderSupplied:
            return "provider-supplied";
        }
        return "none";
    }

    GeocodeSource geocode_source_from_string(const std::string &text) {
        if (text == "none")
            return GeocodeSource::None;
        if (text == "external-geocoder")
            return GeocodeSource::ExternalGeocoder;
        if (text == "manual")
            return GeocodeSource::Manual;
        if (text == "provider-supplied")
            return GeocodeSource::ProviderSupplied;
        throw ValidationError("unknown geocode source '" + text + "'");
    }

    std::string to_string(AreaType type) {
        switch (type) {
        case AreaType::Corridor:
            return "corridor";
        case AreaType::BBox:
            return "bbox";
        case AreaType::Polygon:
            return "polygon";
        case AreaType::TrackCorridor:
            return "track-corridor";
        }
        return "corridor";
    }

    AreaType area_type_from_string(const std::string &text) {
        if (text == "corridor")
            return AreaType::Corridor;
        if (text == "bbox")
            return AreaType::BBox;
        if (text == "polygon")
            return AreaType::Polygon;
        if (text == "track-corridor")
            return AreaType::TrackCorridor;
        throw ValidationError("unknown area type '" + text + "'");
    }

} // namespace geotrax
