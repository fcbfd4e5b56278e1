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
#ifndef INFRA_SCORE_AREAS_HPP_
#define INFRA_SCORE_AREAS_HPP_

#include <nlohmann/json_fwd.hpp>  // for json
#include <optional>               // for optional
#include <string>                 // for string
#include <vector>                 // for vector
#include "geom.hpp"

using std::optional;
using std::string;
using std::vector;
using json = nlohmann::json;

namespace areas {

// half-widths in degrees of the box drawn around a point
const double COORDINATE_HALF_SPAN = 0.05;
const double CITY_HALF_SPAN = 0.1;

// city centre in degrees
struct CityCentre {
    string name;
    double lat{};
    double lon{};
};

// box chosen for a query and where it came from ("coordinates" or "city")
struct LocatedArea {
    string label;
    string source;
    double lat{};
    double lon{};
    geom::BoundingBox bbox;
};

const vector<CityCentre>& defaultCityCentres();
geom::BoundingBox boxAround(double lat, double lon, double halfSpan);
optional<LocatedArea> fromCoordinates(const string& text);
optional<LocatedArea> fromCityName(const string& text,
                                   const vector<CityCentre>& centres = defaultCityCentres());
optional<LocatedArea> locateArea(const string& query, const optional<string>& resolvedName,
                                 const vector<CityCentre>& centres = defaultCityCentres());
json toJson(const LocatedArea& area);

}  // namespace areas

#endif  // INFRA_SCORE_AREAS_HPP_
