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
#include "../infra_score/features.hpp"

using json = nlohmann::json;

using geom::Feature;
using geom::FeatureCollection;
using geom::FeatureKind;
using geom::LineString;
using geom::Point;

using features::NODES_ONLY;
using features::clipToAoi;
using features::parseElement;
using features::parseElements;

// AOI of one degree square at the origin
static const geom::AreaOfInterest UNIT_AOI = geom::makeAoi({0.0, 0.0, 1.0, 1.0});

static Feature pointAt(int64_t id, double lon, double lat) {
    Feature f;
    f.id = id;
    f.kind = FeatureKind::Point;
    f.point = Point(lon, lat);
    return f;
}

static Feature lineThrough(int64_t id, const LineString& line) {
    Feature f;
    f.id = id;
    f.kind = FeatureKind::Line;
    f.lines.push_back(line);
    return f;
}

// -----------------------------------------------------------------------------
// Tests for parseElement / parseElements
// -----------------------------------------------------------------------------

TEST_CASE("parseElement reads a node with tags") {
    json node = R"({"type": "node", "id": 42, "lat": 28.6, "lon": 77.2,
                    "tags": {"amenity": "hospital", "name": "AIIMS", "beds": 10}})"_json;

    auto feature = parseElement(node, features::ALL_KINDS);

    REQUIRE(feature.has_value());
    CHECK_EQ(feature->id, 42);
    CHECK(feature->kind == FeatureKind::Point);
    CHECK_EQ(feature->point.x(), doctest::Approx(77.2));
    CHECK_EQ(feature->point.y(), doctest::Approx(28.6));
    CHECK_EQ(feature->tags.at("amenity"), "hospital");
    // only string tags are kept
    CHECK_EQ(feature->tags.count("beds"), 0);
}

TEST_CASE("parseElement reads a way geometry in order") {
    json way = R"({"type": "way", "id": 7, "tags": {"highway": "primary"},
                   "geometry": [{"lat": 0.1, "lon": 0.2}, {"lat": 0.3, "lon": 0.4},
                                {"lat": 0.5, "lon": 0.6}]})"_json;

    auto feature = parseElement(way, features::ALL_KINDS);

    REQUIRE(feature.has_value());
    CHECK(feature->kind == FeatureKind::Line);
    REQUIRE_EQ(feature->lines.size(), 1);
    REQUIRE_EQ(feature->lines[0].size(), 3);
    CHECK_EQ(feature->lines[0][2].x(), doctest::Approx(0.6));
    CHECK_EQ(feature->lines[0][2].y(), doctest::Approx(0.5));
}

TEST_CASE("parseElement skips malformed elements") {
    CHECK_FALSE(parseElement(R"({"type": "node", "lat": 1.0, "lon": 2.0})"_json,
                             features::ALL_KINDS).has_value());
    CHECK_FALSE(parseElement(R"({"type": "node", "id": 1})"_json,
                             features::ALL_KINDS).has_value());
    CHECK_FALSE(parseElement(R"({"type": "way", "id": 2, "geometry": [{"lat": 1, "lon": 1}]})"_json,
                             features::ALL_KINDS).has_value());
    CHECK_FALSE(parseElement(R"({"type": "relation", "id": 3})"_json,
                             features::ALL_KINDS).has_value());
}

TEST_CASE("parseElement honours the kind filter") {
    json way = R"({"type": "way", "id": 7,
                   "geometry": [{"lat": 0.1, "lon": 0.2}, {"lat": 0.3, "lon": 0.4}]})"_json;
    CHECK_FALSE(parseElement(way, NODES_ONLY).has_value());
}

TEST_CASE("parseElements keeps response order and tolerates a missing array") {
    json response = R"({"elements": [
        {"type": "node", "id": 1, "lat": 0.5, "lon": 0.5},
        {"type": "node", "id": 2},
        {"type": "node", "id": 3, "lat": 0.6, "lon": 0.6}]})"_json;

    auto collection = parseElements(response);
    REQUIRE_EQ(collection.size(), 2);
    CHECK_EQ(collection[0].id, 1);
    CHECK_EQ(collection[1].id, 3);

    CHECK(parseElements(json::object()).empty());
    CHECK(parseElements(R"({"elements": null})"_json).empty());
}

// -----------------------------------------------------------------------------
// Tests for clipToAoi
// -----------------------------------------------------------------------------

TEST_CASE("clipToAoi returns an empty collection unchanged") {
    CHECK(clipToAoi(FeatureCollection{}, UNIT_AOI).empty());
}

TEST_CASE("clipToAoi keeps points inside or on the boundary") {
    FeatureCollection points{pointAt(1, 0.5, 0.5), pointAt(2, 1.0, 0.5), pointAt(3, 2.0, 2.0)};

    auto clipped = clipToAoi(points, UNIT_AOI);

    REQUIRE_EQ(clipped.size(), 2);
    CHECK_EQ(clipped[0].id, 1);
    CHECK_EQ(clipped[1].id, 2);
}

TEST_CASE("clipToAoi cuts a crossing line at the boundary") {
    FeatureCollection roads{lineThrough(5, LineString{Point(-1.0, 0.5), Point(2.0, 0.5)})};

    auto clipped = clipToAoi(roads, UNIT_AOI);

    REQUIRE_EQ(clipped.size(), 1);
    CHECK_EQ(clipped[0].id, 5);
    REQUIRE_EQ(clipped[0].lines.size(), 1);
    CHECK_EQ(geom::totalLengthKm(clipped), doctest::Approx(111.319).epsilon(1e-3));
}

TEST_CASE("clipToAoi drops lines entirely outside") {
    FeatureCollection roads{lineThrough(6, LineString{Point(2.0, 2.0), Point(3.0, 3.0)})};
    CHECK(clipToAoi(roads, UNIT_AOI).empty());
}

TEST_CASE("clipToAoi keeps a line that leaves and re-enters as one feature") {
    LineString zigzag{Point(0.2, 0.5), Point(1.5, 0.5), Point(1.5, 0.6), Point(0.2, 0.6)};
    FeatureCollection roads{lineThrough(8, zigzag)};

    auto clipped = clipToAoi(roads, UNIT_AOI);

    REQUIRE_EQ(clipped.size(), 1);
    CHECK_EQ(clipped[0].lines.size(), 2);
}
