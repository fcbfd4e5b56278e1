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
#ifndef INFRA_SCORE_FEATURES_HPP_
#define INFRA_SCORE_FEATURES_HPP_

#include <nlohmann/json_fwd.hpp>  // for json
#include <optional>               // for optional
#include "geom.hpp"

using json = nlohmann::json;

namespace features {

// which element kinds a query result may contribute
struct KindFilter {
    bool nodes = true;
    bool ways = true;
};

const KindFilter ALL_KINDS{true, true};
const KindFilter NODES_ONLY{true, false};

std::optional<geom::Feature> parseElement(const json& element, const KindFilter& filter);
geom::FeatureCollection parseElements(const json& response, const KindFilter& filter = ALL_KINDS);
geom::FeatureCollection clipToAoi(const geom::FeatureCollection& collection,
                                  const geom::AreaOfInterest& aoi);

}  // namespace features

#endif  // INFRA_SCORE_FEATURES_HPP_
