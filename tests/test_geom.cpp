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
#include <cmath>
#include <limits>
#include "../infra_score/geom.hpp"

using geom::BoundingBox;
using geom::Feature;
using geom::FeatureCollection;
using geom::FeatureKind;
using geom::InvalidGeometry;
using geom::LineString;
using geom::Point;

using geom::makeAoi;
using geom::makeAoiPolygon;
using geom::normClip;
using geom::project;
using geom::totalLengthKm;
using geom::validateBoundingBox;

static const BoundingBox DELHI_BOX{77.10, 28.55, 77.30, 28.75};

// -----------------------------------------------------------------------------
// Tests for validateBoundingBox / makeAoiPolygon
// -----------------------------------------------------------------------------

TEST_CASE("validateBoundingBox accepts a proper box") {
    CHECK_NOTHROW(validateBoundingBox(DELHI_BOX));
}

TEST_CASE("validateBoundingBox rejects zero width and zero height") {
    CHECK_THROWS_AS(validateBoundingBox({77.10, 28.55, 77.10, 28.75}), InvalidGeometry);
    CHECK_THROWS_AS(validateBoundingBox({77.10, 28.55, 77.30, 28.55}), InvalidGeometry);
}

TEST_CASE("validateBoundingBox rejects inverted corners") {
    CHECK_THROWS_AS(validateBoundingBox({77.30, 28.55, 77.10, 28.75}), InvalidGeometry);
    CHECK_THROWS_AS(validateBoundingBox({77.10, 28.75, 77.30, 28.55}), InvalidGeometry);
}

TEST_CASE("validateBoundingBox rejects non-finite and out-of-range values") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    CHECK_THROWS_AS(validateBoundingBox({nan, 28.55, 77.30, 28.75}), InvalidGeometry);
    CHECK_THROWS_AS(validateBoundingBox({-190.0, 0.0, 10.0, 10.0}), InvalidGeometry);
    CHECK_THROWS_AS(validateBoundingBox({0.0, 0.0, 10.0, 89.0}), InvalidGeometry);
}

TEST_CASE("makeAoiPolygon builds a closed rectangle through all four corners") {
    auto poly = makeAoiPolygon(DELHI_BOX);
    const auto& ring = poly.outer();

    REQUIRE_EQ(ring.size(), 5);
    CHECK_EQ(ring.front().x(), doctest::Approx(ring.back().x()));
    CHECK_EQ(ring.front().y(), doctest::Approx(ring.back().y()));

    // upper-right corner uses max latitude
    CHECK_EQ(ring[2].x(), doctest::Approx(77.30));
    CHECK_EQ(ring[2].y(), doctest::Approx(28.75));
    CHECK_EQ(ring[3].x(), doctest::Approx(77.10));
    CHECK_EQ(ring[3].y(), doctest::Approx(28.75));
}

// -----------------------------------------------------------------------------
// Tests for project / makeAoi
// -----------------------------------------------------------------------------

TEST_CASE("project maps the origin to the origin") {
    auto p = project(Point(0.0, 0.0));
    CHECK_EQ(p.x(), doctest::Approx(0.0));
    CHECK_EQ(p.y(), doctest::Approx(0.0));
}

TEST_CASE("project maps the antimeridian to half the Mercator width") {
    auto p = project(Point(180.0, 0.0));
    CHECK_EQ(p.x(), doctest::Approx(20037508.34).epsilon(1e-6));
}

TEST_CASE("project clamps latitude at the Mercator limit") {
    auto clamped = project(Point(0.0, 89.0));
    auto limit = project(Point(0.0, geom::MERCATOR_MAX_LAT));
    CHECK_EQ(clamped.y(), doctest::Approx(limit.y()));
    CHECK_EQ(limit.y(), doctest::Approx(20037508.34).epsilon(1e-6));
}

TEST_CASE("makeAoi computes the projected area of the box") {
    auto aoi = makeAoi(DELHI_BOX);
    CHECK(aoi.areaKm2 > 560.0);
    CHECK(aoi.areaKm2 < 570.0);
}

TEST_CASE("makeAoi area is deterministic") {
    CHECK_EQ(makeAoi(DELHI_BOX).areaKm2, makeAoi(DELHI_BOX).areaKm2);
}

TEST_CASE("makeAoi raises before computing anything for a degenerate box") {
    CHECK_THROWS_AS(makeAoi({77.10, 28.55, 77.10, 28.55}), InvalidGeometry);
}

// -----------------------------------------------------------------------------
// Tests for totalLengthKm
// -----------------------------------------------------------------------------

static Feature lineFeature(const LineString& line) {
    Feature f;
    f.kind = FeatureKind::Line;
    f.lines.push_back(line);
    return f;
}

TEST_CASE("totalLengthKm of an empty collection is zero") {
    CHECK_EQ(totalLengthKm(FeatureCollection{}), doctest::Approx(0.0));
}

TEST_CASE("totalLengthKm measures a line along the equator") {
    FeatureCollection roads{lineFeature(LineString{Point(0.0, 0.0), Point(0.01, 0.0)})};
    CHECK_EQ(totalLengthKm(roads), doctest::Approx(1.11319).epsilon(1e-4));
}

TEST_CASE("totalLengthKm sums every part and ignores points") {
    Feature twoParts = lineFeature(LineString{Point(0.0, 0.0), Point(0.01, 0.0)});
    twoParts.lines.push_back(LineString{Point(0.02, 0.0), Point(0.03, 0.0)});
    Feature point;
    point.kind = FeatureKind::Point;
    point.point = Point(0.5, 0.5);

    FeatureCollection features{twoParts, point};
    CHECK_EQ(totalLengthKm(features), doctest::Approx(2.22639).epsilon(1e-4));
}

// -----------------------------------------------------------------------------
// Tests for normClip
// -----------------------------------------------------------------------------

TEST_CASE("normClip maps the endpoints to 0 and 1") {
    CHECK_EQ(normClip(0.0, 0.0, 10.0), doctest::Approx(0.0));
    CHECK_EQ(normClip(10.0, 0.0, 10.0), doctest::Approx(1.0));
}

TEST_CASE("normClip saturates outside the range") {
    CHECK_EQ(normClip(-5.0, 0.0, 10.0), 0.0);
    CHECK_EQ(normClip(25.0, 0.0, 10.0), 1.0);
}

TEST_CASE("normClip stays in the unit interval") {
    for (double x = -20.0; x <= 20.0; x += 0.5) {
        const double v = normClip(x, 0.0, 10.0);
        CHECK(v >= 0.0);
        CHECK(v <= 1.0);
    }
}

TEST_CASE("normClip is finite for an empty range") {
    CHECK(std::isfinite(normClip(3.0, 3.0, 3.0)));
}
