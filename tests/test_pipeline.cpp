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
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "../infra_score/pipeline.hpp"

using std::string;
using std::vector;
using json = nlohmann::json;

using geom::BoundingBox;
using geom::InvalidGeometry;
using overpass::FeatureQueryService;
using overpass::ServiceUnavailable;
using pipeline::AoiPipeline;
using pipeline::buildQueries;

// Answers by query category and records every query
struct FakeQueryService : FeatureQueryService {
    json roads = json{{"elements", json::array()}};
    json buildings = json{{"elements", json::array()}};
    json amenities = json{{"elements", json::array()}};
    bool fail = false;
    vector<string> queries;

    json query(const string& ql) override {
        queries.push_back(ql);
        if (fail) throw ServiceUnavailable("Overpass unavailable after retry: HTTP 504");
        if (ql.find("[highway];") != string::npos) return roads;
        if (ql.find("[building];") != string::npos) return buildings;
        return amenities;
    }
};

static const BoundingBox DELHI_BOX{77.10, 28.55, 77.30, 28.75};

// -----------------------------------------------------------------------------
// Tests for buildQueries
// -----------------------------------------------------------------------------

TEST_CASE("buildQueries orders the box as south, west, north, east") {
    auto q = buildQueries(DELHI_BOX);
    const string box = "(28.550000,77.100000,28.750000,77.300000)";

    CHECK_NE(q.roads.find("way" + box + "[highway];"), string::npos);
    CHECK_NE(q.roads.find("out geom;"), string::npos);
    CHECK_NE(q.buildings.find("way" + box + "[building];"), string::npos);
    CHECK_NE(q.amenities.find("node" + box + "[amenity=hospital];"), string::npos);
    CHECK_NE(q.amenities.find("node" + box + "[amenity=school];"), string::npos);
    CHECK_NE(q.amenities.find("node" + box + "[highway=bus_stop];"), string::npos);
    CHECK_NE(q.amenities.find("out body;"), string::npos);
}

// -----------------------------------------------------------------------------
// Tests for AoiPipeline::run
// -----------------------------------------------------------------------------

TEST_CASE("run rejects a degenerate box before querying") {
    FakeQueryService service;
    AoiPipeline aoiPipeline(service);

    CHECK_THROWS_AS(aoiPipeline.run({77.10, 28.55, 77.10, 28.75}), InvalidGeometry);
    CHECK(service.queries.empty());
}

TEST_CASE("run with no features gives zero metrics and the box area") {
    FakeQueryService service;
    AoiPipeline aoiPipeline(service);

    auto m = aoiPipeline.run(DELHI_BOX);

    CHECK_EQ(service.queries.size(), 3);
    CHECK(m.areaKm2 > 560.0);
    CHECK(m.areaKm2 < 570.0);
    CHECK_EQ(m.roadKm, 0.0);
    CHECK_EQ(m.buildingCount, 0);
    CHECK_EQ(m.intersectionsPerKm2, 0.0);
    CHECK_EQ(m.hospitalsPerKm2, 0.0);
    CHECK_EQ(m.scores.socioEconScore, 0.0);
}

TEST_CASE("run clips features to the box") {
    FakeQueryService service;
    service.roads = R"({"elements": [
        {"type": "way", "id": 1, "tags": {"highway": "primary"},
         "geometry": [{"lat": 28.60, "lon": 77.00}, {"lat": 28.60, "lon": 77.20}]},
        {"type": "way", "id": 2, "tags": {"highway": "primary"},
         "geometry": [{"lat": 29.00, "lon": 77.00}, {"lat": 29.00, "lon": 77.20}]}]})"_json;
    service.amenities = R"({"elements": [
        {"type": "node", "id": 10, "lat": 28.60, "lon": 77.20, "tags": {"amenity": "hospital"}},
        {"type": "node", "id": 11, "lat": 30.00, "lon": 77.20, "tags": {"amenity": "hospital"}},
        {"type": "node", "id": 12, "lat": 28.70, "lon": 77.15, "tags": {"amenity": "school"}}]})"_json;
    AoiPipeline aoiPipeline(service);

    auto m = aoiPipeline.run(DELHI_BOX);

    CHECK_EQ(m.roadFeatures, 1);
    CHECK_EQ(m.amenityFeatures, 2);
    // 0.1 degree of longitude at 28.6N, projected
    CHECK(m.roadKm > 11.0);
    CHECK(m.roadKm < 13.5);
    CHECK(m.hospitalsPerKm2 > 0.0);
    CHECK(m.schoolsPerKm2 > 0.0);
    CHECK(m.scores.socioEconScore > 0.0);
}

TEST_CASE("run propagates ServiceUnavailable") {
    FakeQueryService service;
    service.fail = true;
    AoiPipeline aoiPipeline(service);

    CHECK_THROWS_AS(aoiPipeline.run(DELHI_BOX), ServiceUnavailable);
}
