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
#ifndef INFRA_SCORE_METRICS_HPP_
#define INFRA_SCORE_METRICS_HPP_

#include <nlohmann/json_fwd.hpp>  // for json
#include <cstddef>                // for size_t
#include <string>                 // for string
#include "geom.hpp"

using std::string;
using json = nlohmann::json;

namespace metrics {

// normalisation ranges for the sub-indices
const double ROAD_KM_PER_KM2_MAX = 10.0;
const double INTERSECTIONS_PER_KM2_MAX = 200.0;
const double HOSPITALS_PER_KM2_MAX = 5.0;
const double SCHOOLS_PER_KM2_MAX = 8.0;

// composite score weights
const double INFRA_WEIGHT = 0.35;
const double ACCESS_WEIGHT = 0.35;
const double ACTIVITY_WEIGHT = 0.20;
const double GREEN_WEIGHT = 0.10;

// sub-indices and the composite score
struct Scores {
    double infraIndex{};
    double accessIndex{};
    double activityIndex{};  // placeholder, no signal source yet
    double greenIndex{};     // placeholder, no signal source yet
    double socioEconScore{};
};

// infrastructure metrics for one area of interest
struct InfrastructureMetrics {
    double areaKm2{};
    double roadKm{};
    double roadKmPerKm2{};
    size_t buildingCount{};
    double buildingsPerKm2{};
    double intersectionsPerKm2{};
    double hospitalsPerKm2{};
    double schoolsPerKm2{};
    Scores scores;
    // feature counts after clipping
    size_t roadFeatures{};
    size_t buildingFeatures{};
    size_t amenityFeatures{};
};

bool tagEquals(const geom::Feature& feature, const string& key, const string& value);
geom::FeatureCollection filterByTag(const geom::FeatureCollection& features,
                                    const string& key, const string& value);
double perKm2(double amount, double areaKm2);
double pointDensityPerKm2(const geom::FeatureCollection& features, double areaKm2);
size_t countIntersections(const geom::FeatureCollection& roads);
double intersectionDensityPerKm2(const geom::FeatureCollection& roads, double areaKm2);
Scores scoreFromDensities(double roadKmPerKm2, double intersectionsPerKm2,
                          double hospitalsPerKm2, double schoolsPerKm2);
InfrastructureMetrics computeMetrics(const geom::FeatureCollection& roads,
                                     const geom::FeatureCollection& buildings,
                                     const geom::FeatureCollection& amenities,
                                     double areaKm2);
double roundTo(double value, int decimals);
json toJson(const InfrastructureMetrics& m);

}  // namespace metrics

#endif  // INFRA_SCORE_METRICS_HPP_
