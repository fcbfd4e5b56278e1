// Copyright 2026 Maree Carroll
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "areas.hpp"
#include <cctype>                 // for tolower
#include <cmath>                  // for fabs
#include <nlohmann/json.hpp>      // for basic_json
#include <regex>                  // for regex, sregex_iterator
#include <string>                 // for string, stod

using json = nlohmann::json;

namespace areas {

static string lower(const string& text) {
    string out = text;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

const vector<CityCentre>& defaultCityCentres() {
    static const vector<CityCentre> centres{
        {"Delhi", 28.6139, 77.2090},
        {"Mumbai", 19.0760, 72.8777},
        {"Bangalore", 12.9716, 77.5946},
        {"Chennai", 13.0827, 80.2707},
        {"Kolkata", 22.5726, 88.3639},
        {"Hyderabad", 17.3850, 78.4867},
        {"Pune", 18.5204, 73.8567},
        {"Ahmedabad", 23.0225, 72.5714},
        {"Jaipur", 26.9124, 75.7873},
        {"Lucknow", 26.8467, 80.9462},
    };
    return centres;
}

geom::BoundingBox boxAround(double lat, double lon, double halfSpan) {
    return geom::BoundingBox{lon - halfSpan, lat - halfSpan, lon + halfSpan, lat + halfSpan};
}

// Finds the first "lat, lon" or "lat lon" pair in free text
//
// Args:
//    text: user query
// Returns:
//    a box of +/- COORDINATE_HALF_SPAN around the pair, or nothing when no
//    pair lies inside the projectable latitude and the longitude range
optional<LocatedArea> fromCoordinates(const string& text) {
    static const std::regex pair(R"((-?\d+\.?\d*)[,\s]+(-?\d+\.?\d*))");
    const double maxLat = geom::MERCATOR_MAX_LAT - COORDINATE_HALF_SPAN;

    for (std::sregex_iterator it(text.begin(), text.end(), pair), end; it != end; ++it) {
        const std::smatch& m = *it;
        const double lat = std::stod(m[1].str());
        const double lon = std::stod(m[2].str());
        if (std::fabs(lat) > maxLat || std::fabs(lon) > 180.0 - COORDINATE_HALF_SPAN) continue;

        LocatedArea area;
        area.label = "Coordinates " + m[1].str() + ", " + m[2].str();
        area.source = "coordinates";
        area.lat = lat;
        area.lon = lon;
        area.bbox = boxAround(lat, lon, COORDINATE_HALF_SPAN);
        return area;
    }
    return std::nullopt;
}

// First centre whose lower-cased name occurs in the text
optional<LocatedArea> fromCityName(const string& text, const vector<CityCentre>& centres) {
    const string lowered = lower(text);
    for (const auto& c : centres) {
        if (lowered.find(lower(c.name)) == string::npos) continue;
        LocatedArea area;
        area.label = c.name;
        area.source = "city";
        area.lat = c.lat;
        area.lon = c.lon;
        area.bbox = boxAround(c.lat, c.lon, CITY_HALF_SPAN);
        return area;
    }
    return std::nullopt;
}

// Picks the area to measure for a query
//
// Args:
//    query: user query
//    resolvedName: location the resolver matched, if any
//    centres: known city centres
// Returns:
//    coordinates in the query first, then the resolved location's centre,
//    then any city named in the query; nothing when none applies
optional<LocatedArea> locateArea(const string& query, const optional<string>& resolvedName,
                                 const vector<CityCentre>& centres) {
    if (auto area = fromCoordinates(query)) return area;
    if (resolvedName) {
        if (auto area = fromCityName(*resolvedName, centres)) return area;
    }
    return fromCityName(query, centres);
}

json toJson(const LocatedArea& area) {
    return {
        {"label", area.label},
        {"source", area.source},
        {"coordinates", {{"lat", area.lat}, {"lon", area.lon}}},
        {"bbox", {area.bbox.minLon, area.bbox.minLat, area.bbox.maxLon, area.bbox.maxLat}}
    };
}

}  // namespace areas
