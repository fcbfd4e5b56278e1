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

#include "geom.hpp"
#include <algorithm>  // for max, min
#include <cmath>      // for isfinite, log, tan, fabs
#include <sstream>    // for basic_ostringstream
#include <string>     // for string

using std::fabs;
using std::isfinite;
using std::log;
using std::max;
using std::min;
using std::ostringstream;
using std::tan;

namespace bg = ::boost::geometry;

static const double PI = 3.14159265358979323846;

namespace geom {
    // Throws InvalidGeometry unless the box is finite, non-degenerate and
    // inside the Web Mercator domain
    //
    // Args:
    //    bbox: the bounding box to check
    void validateBoundingBox(const BoundingBox& bbox) {
        if (!isfinite(bbox.minLon) || !isfinite(bbox.minLat) ||
            !isfinite(bbox.maxLon) || !isfinite(bbox.maxLat))
            throw InvalidGeometry("bounding box has non-finite coordinates");

        if (bbox.minLon >= bbox.maxLon || bbox.minLat >= bbox.maxLat) {
            ostringstream oss;
            oss << "degenerate bounding box [" << bbox.minLon << "," << bbox.minLat
                << "," << bbox.maxLon << "," << bbox.maxLat << "]: min must be below max";
            throw InvalidGeometry(oss.str());
        }

        if (bbox.minLon < -180.0 || bbox.maxLon > 180.0 ||
            fabs(bbox.minLat) > MERCATOR_MAX_LAT || fabs(bbox.maxLat) > MERCATOR_MAX_LAT)
            throw InvalidGeometry("bounding box outside the projectable range");
    }

    // Builds the axis-aligned rectangle for a bounding box
    //
    // Args:
    //    bbox: [min_lon, min_lat, max_lon, max_lat]
    // Returns:
    //    closed counter-clockwise polygon
    Polygon makeAoiPolygon(const BoundingBox& bbox) {
        validateBoundingBox(bbox);
        Polygon poly;
        auto& ring = poly.outer();
        ring.push_back(Point(bbox.minLon, bbox.minLat));
        ring.push_back(Point(bbox.maxLon, bbox.minLat));
        ring.push_back(Point(bbox.maxLon, bbox.maxLat));
        ring.push_back(Point(bbox.minLon, bbox.maxLat));
        // closing point
        ring.push_back(Point(bbox.minLon, bbox.minLat));
        return poly;
    }

    AreaOfInterest makeAoi(const BoundingBox& bbox) {
        AreaOfInterest aoi;
        aoi.bbox = bbox;
        aoi.polygon = makeAoiPolygon(bbox);
        aoi.areaKm2 = projectAreaKm2(aoi.polygon);
        return aoi;
    }

    // Spherical Web Mercator (EPSG:3857) forward projection
    //
    // Args:
    //    lonLat: point in degrees
    // Returns:
    //    point in metres
    Point project(const Point& lonLat) {
        const double DEG = PI / 180.0;
        const double lat = max(-MERCATOR_MAX_LAT, min(MERCATOR_MAX_LAT, lonLat.y()));
        const double x = EARTH_RADIUS_M * lonLat.x() * DEG;
        const double y = EARTH_RADIUS_M * log(tan(PI / 4.0 + lat * DEG / 2.0));
        return Point(x, y);
    }

    LineString projectLine(const LineString& line) {
        LineString out;
        out.reserve(line.size());
        for (const auto& p : line) out.push_back(project(p));
        return out;
    }

    // Planar area of a lon/lat polygon in square kilometres
    double projectAreaKm2(const Polygon& polygon) {
        Polygon projected;
        for (const auto& p : polygon.outer()) projected.outer().push_back(project(p));
        for (const auto& inner : polygon.inners()) {
            Polygon::ring_type ring;
            for (const auto& p : inner) ring.push_back(project(p));
            projected.inners().push_back(ring);
        }
        return max(0.0, bg::area(projected)) / 1e6;
    }

    // Sum of projected lengths of every line part in kilometres
    //
    // Args:
    //    features: collection to measure, point features add nothing
    // Returns:
    //    total length, 0 for an empty collection
    double totalLengthKm(const FeatureCollection& features) {
        double metres = 0.0;
        for (const auto& feature : features) {
            if (feature.kind != FeatureKind::Line) continue;
            for (const auto& part : feature.lines) {
                metres += bg::length(projectLine(part));
            }
        }
        return metres / 1000.0;
    }

    // Normalises x into [0, 1] over [lo, hi], saturating at both ends
    double normClip(double x, double lo, double hi) {
        return max(0.0, min(1.0, (x - lo) / (hi - lo + NORM_EPSILON)));
    }
}  // namespace geom
