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
#ifndef INFRA_SCORE_GEOM_HPP_
#define INFRA_SCORE_GEOM_HPP_

#include <boost/geometry.hpp>                               // for area, length
#include <boost/geometry/geometries/linestring.hpp>         // for linestring
#include <boost/geometry/geometries/multi_linestring.hpp>   // for multi_linestring
#include <boost/geometry/geometries/point_xy.hpp>           // for point_xy
#include <boost/geometry/geometries/polygon.hpp>            // for polygon
#include <cstdint>                                          // for int64_t
#include <map>                                              // for map
#include <stdexcept>                                        // for runtime_error
#include <string>                                           // for string
#include <vector>                                           // for vector

using std::map;
using std::runtime_error;
using std::string;
using std::vector;

namespace geom {
// -------------------------------------
// geometry types, x = lon and y = lat until projected to metres
// -------------------------------------
typedef ::boost::geometry::model::d2::point_xy<double> Point;
typedef ::boost::geometry::model::linestring<Point> LineString;
typedef ::boost::geometry::model::multi_linestring<LineString> MultiLineString;
// counter-clockwise, closed
typedef ::boost::geometry::model::polygon<Point, false, true> Polygon;

const double EARTH_RADIUS_M = 6378137.0;       // EPSG:3857 sphere
const double MERCATOR_MAX_LAT = 85.05112878;   // Web Mercator latitude limit
const double NORM_EPSILON = 1e-9;

// raised for a box that can't form an area of interest
class InvalidGeometry : public runtime_error {
 public:
    using runtime_error::runtime_error;
};

// bounding box in degrees as [min_lon, min_lat, max_lon, max_lat]
struct BoundingBox { double minLon{}, minLat{}, maxLon{}, maxLat{}; };

// area of interest: box polygon plus its planar area
struct AreaOfInterest {
    BoundingBox bbox;
    Polygon polygon;
    double areaKm2{};
};

enum class FeatureKind { Point, Line };

// map feature with tags; a line keeps all of its parts in `lines`
// so one source way stays one feature after clipping
struct Feature {
    int64_t id{};
    map<string, string> tags;
    FeatureKind kind = FeatureKind::Point;
    Point point = Point(0.0, 0.0);
    MultiLineString lines;
};

typedef vector<Feature> FeatureCollection;

void validateBoundingBox(const BoundingBox& bbox);
Polygon makeAoiPolygon(const BoundingBox& bbox);
AreaOfInterest makeAoi(const BoundingBox& bbox);
Point project(const Point& lonLat);
LineString projectLine(const LineString& line);
double projectAreaKm2(const Polygon& polygon);
double totalLengthKm(const FeatureCollection& features);
double normClip(double x, double lo, double hi);

}  // namespace geom

#endif  // INFRA_SCORE_GEOM_HPP_
