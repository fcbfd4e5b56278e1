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
#ifndef INFRA_SCORE_PIPELINE_HPP_
#define INFRA_SCORE_PIPELINE_HPP_

#include <string>         // for string
#include "geom.hpp"
#include "metrics.hpp"
#include "overpass.hpp"

using std::string;

namespace pipeline {

// Overpass QL text for the three feature categories
struct Queries {
    string roads;
    string buildings;
    string amenities;
};

Queries buildQueries(const geom::BoundingBox& bbox);

// Bounding box -> infrastructure metrics. Holds no state between runs,
// so separate runs may proceed concurrently given a thread-safe service.
class AoiPipeline {
 public:
    explicit AoiPipeline(overpass::FeatureQueryService& service);

    metrics::InfrastructureMetrics run(const geom::BoundingBox& bbox) const;

 private:
    overpass::FeatureQueryService& service_;
};

}  // namespace pipeline

#endif  // INFRA_SCORE_PIPELINE_HPP_
