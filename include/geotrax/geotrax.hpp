#pragma once

#include "geotrax/areas.hpp"
#include "geotrax/config.hpp"
#include "geotrax/corridor.hpp"
#include "geotrax/enricher.hpp"
#include "geotrax/errors.hpp"
#include "geotrax/geocoder.hpp"
#include "geotrax/http.hpp"
#include "geotrax/projection.hpp"
#include "geotrax/proximity.hpp"
#include "geotrax/router.hpp"
#include "geotrax/service.hpp"
#include "geotrax/store.hpp"
#include "geotrax/track.hpp"
#include "geotrax/types.hpp"
#include "geotrax/wkt.hpp"
