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

#include "pipeline.hpp"
#include <iomanip>                // for setprecision
#include <iostream>               // for basic_ostream, operator<<, cerr
#include <nlohmann/json.hpp>      // for basic_json
#include <sstream>                // for basic_ostringstream
#include <string>                 // for string
#include "features.hpp"

using std::cerr;
using std::fixed;
using std::ostringstream;
using std::setprecision;
using std::string;

using features::ALL_KINDS;
using features::NODES_ONLY;
using features::clipToAoi;
using features::parseElements;
using geom::AreaOfInterest;
using geom::BoundingBox;
using geom::FeatureCollection;
using metrics::InfrastructureMetrics;

namespace pipeline {

// Builds the roads, buildings and amenities queries
//
// Args:
//    bbox: the area of interest
// Returns:
//    query texts; Overpass wants (south, west, north, east)
Queries buildQueries(const BoundingBox& bbox) {
    ostringstream area;
    area << fixed << setprecision(6)
         << "(" << bbox.minLat << "," << bbox.minLon << ","
         << bbox.maxLat << "," << bbox.maxLon << ")";
    const string b = area.str();

    Queries q;
    q.roads =
        "[out:json][timeout:60];\n"
        "way" + b + "[highway];\n"
        "out geom;\n";
    q.buildings =
        "[out:json][timeout:60];\n"
        "way" + b + "[building];\n"
        "out geom;\n";
    q.amenities =
        "[out:json][timeout:60];\n"
        "(\n"
        "  node" + b + "[amenity=hospital];\n"
        "  node" + b + "[amenity=clinic];\n"
        "  node" + b + "[amenity=school];\n"
        "  node" + b + "[amenity=university];\n"
        "  node" + b + "[public_transport=station];\n"
        "  node" + b + "[highway=bus_stop];\n"
        ");\n"
        "out body;\n";
    return q;
}

AoiPipeline::AoiPipeline(overpass::FeatureQueryService& service) : service_(service) {}

// Runs the full pipeline for one bounding box
//
// Args:
//    bbox: [min_lon, min_lat, max_lon, max_lat]
// Returns:
//    metrics for the box; all zero when nothing was found
// Throws:
//    geom::InvalidGeometry before any query for a bad box
//    overpass::ServiceUnavailable when a query fails its retry
InfrastructureMetrics AoiPipeline::run(const BoundingBox& bbox) const {
    const AreaOfInterest aoi = geom::makeAoi(bbox);
    const Queries q = buildQueries(bbox);

    cerr << "AOI area: " << aoi.areaKm2 << " km2; querying Overpass ...\n";

    FeatureCollection roads = parseElements(service_.query(q.roads), ALL_KINDS);
    FeatureCollection buildings = parseElements(service_.query(q.buildings), ALL_KINDS);
    FeatureCollection amenities = parseElements(service_.query(q.amenities), NODES_ONLY);

    cerr << "Features fetched: roads=" << roads.size() << " buildings=" << buildings.size()
         << " amenities=" << amenities.size() << "\n";

    roads = clipToAoi(roads, aoi);
    buildings = clipToAoi(buildings, aoi);
    amenities = clipToAoi(amenities, aoi);

    return metrics::computeMetrics(roads, buildings, amenities, aoi.areaKm2);
}

}  // namespace pipeline
