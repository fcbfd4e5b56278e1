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

#include "metrics.hpp"
#include <cmath>                  // for fabs, llround, pow, round
#include <cstdint>                // for int64_t
#include <map>                    // for map
#include <nlohmann/json.hpp>      // for basic_json
#include <string>                 // for string
#include <utility>                // for pair

using std::llround;
using std::map;
using std::pair;
using std::pow;
using std::string;
using json = nlohmann::json;

using geom::Feature;
using geom::FeatureCollection;
using geom::FeatureKind;
using geom::normClip;
using geom::project;

namespace metrics {

bool tagEquals(const Feature& feature, const string& key, const string& value) {
    auto it = feature.tags.find(key);
    return it != feature.tags.end() && it->second == value;
}

FeatureCollection filterByTag(const FeatureCollection& features,
                              const string& key, const string& value) {
    FeatureCollection out;
    for (const auto& feature : features) {
        if (tagEquals(feature, key, value)) out.push_back(feature);
    }
    return out;
}

// amount / area, or 0 for an empty area
double perKm2(double amount, double areaKm2) {
    return areaKm2 == 0.0 ? 0.0 : amount / areaKm2;
}

double pointDensityPerKm2(const FeatureCollection& features, double areaKm2) {
    return features.empty() ? 0.0 : perKm2(static_cast<double>(features.size()), areaKm2);
}

// Counts crude junctions: projected road vertices, snapped to a 1 cm grid,
// shared by three or more segment ends
//
// Args:
//    roads: clipped road features
// Returns:
//    number of grid cells holding at least three vertices
size_t countIntersections(const FeatureCollection& roads) {
    map<pair<int64_t, int64_t>, int> multiplicity;
    for (const auto& road : roads) {
        if (road.kind != FeatureKind::Line) continue;
        for (const auto& part : road.lines) {
            for (const auto& vertex : part) {
                const auto xy = project(vertex);
                const pair<int64_t, int64_t> key(llround(xy.x() * 100.0), llround(xy.y() * 100.0));
                ++multiplicity[key];
            }
        }
    }

    size_t count = 0;
    for (const auto& kv : multiplicity) {
        if (kv.second >= 3) ++count;
    }
    return count;
}

double intersectionDensityPerKm2(const FeatureCollection& roads, double areaKm2) {
    if (roads.empty() || areaKm2 == 0.0) return 0.0;
    return static_cast<double>(countIntersections(roads)) / areaKm2;
}

// Computes sub-indices and the composite score from the four densities
Scores scoreFromDensities(double roadKmPerKm2, double intersectionsPerKm2,
                          double hospitalsPerKm2, double schoolsPerKm2) {
    Scores s;
    s.infraIndex = 0.5 * normClip(roadKmPerKm2, 0.0, ROAD_KM_PER_KM2_MAX) +
                   0.5 * normClip(intersectionsPerKm2, 0.0, INTERSECTIONS_PER_KM2_MAX);
    s.accessIndex = 0.5 * normClip(hospitalsPerKm2, 0.0, HOSPITALS_PER_KM2_MAX) +
                    0.5 * normClip(schoolsPerKm2, 0.0, SCHOOLS_PER_KM2_MAX);
    s.activityIndex = 0.0;
    s.greenIndex = 0.0;
    s.socioEconScore = 100.0 * (INFRA_WEIGHT * s.infraIndex +
                                ACCESS_WEIGHT * s.accessIndex +
                                ACTIVITY_WEIGHT * s.activityIndex +
                                GREEN_WEIGHT * s.greenIndex);
    return s;
}

// Computes all metrics for clipped feature collections
//
// Args:
//    roads: clipped road lines
//    buildings: clipped building outlines
//    amenities: clipped amenity points
//    areaKm2: area of interest in square kilometres
// Returns:
//    the metrics record
InfrastructureMetrics computeMetrics(const FeatureCollection& roads,
                                     const FeatureCollection& buildings,
                                     const FeatureCollection& amenities,
                                     double areaKm2) {
    InfrastructureMetrics m;
    m.areaKm2 = areaKm2;
    m.roadKm = geom::totalLengthKm(roads);
    m.roadKmPerKm2 = perKm2(m.roadKm, areaKm2);
    m.buildingCount = buildings.size();
    m.buildingsPerKm2 = perKm2(static_cast<double>(m.buildingCount), areaKm2);
    m.intersectionsPerKm2 = intersectionDensityPerKm2(roads, areaKm2);
    m.hospitalsPerKm2 = pointDensityPerKm2(filterByTag(amenities, "amenity", "hospital"), areaKm2);
    m.schoolsPerKm2 = pointDensityPerKm2(filterByTag(amenities, "amenity", "school"), areaKm2);
    m.scores = scoreFromDensities(m.roadKmPerKm2, m.intersectionsPerKm2,
                                  m.hospitalsPerKm2, m.schoolsPerKm2);
    m.roadFeatures = roads.size();
    m.buildingFeatures = buildings.size();
    m.amenityFeatures = amenities.size();
    return m;
}

double roundTo(double value, int decimals) {
    const double scale = pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

// per-km2 rates keep a fourth decimal below 1
static double roundRate(double value) {
    return roundTo(value, std::fabs(value) < 1.0 ? 4 : 3);
}

// Presentation record
json toJson(const InfrastructureMetrics& m) {
    json j;
    j["area_km2"] = roundTo(m.areaKm2, 3);
    j["road_km"] = roundTo(m.roadKm, 3);
    j["road_km_per_km2"] = roundRate(m.roadKmPerKm2);
    j["building_count"] = m.buildingCount;
    j["buildings_per_km2"] = roundRate(m.buildingsPerKm2);
    j["intersections_per_km2"] = roundRate(m.intersectionsPerKm2);
    j["hospitals_per_km2"] = roundRate(m.hospitalsPerKm2);
    j["schools_per_km2"] = roundRate(m.schoolsPerKm2);
    j["infra_index"] = roundTo(m.scores.infraIndex, 3);
    j["access_index"] = roundTo(m.scores.accessIndex, 3);
    j["socio_econ_score"] = roundTo(m.scores.socioEconScore, 1);
    j["raw_counts"] = {
        {"road_features", m.roadFeatures},
        {"building_features", m.buildingFeatures},
        {"amenity_features", m.amenityFeatures}
    };
    return j;
}

}  // namespace metrics
