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

#include "features.hpp"
#include <exception>              // for exception
#include <iostream>               // for basic_ostream, operator<<, cerr
#include <nlohmann/json.hpp>      // for basic_json
#include <optional>               // for optional, nullopt
#include <string>                 // for string
#include <utility>                // for move

using std::cerr;
using std::exception;
using std::nullopt;
using std::optional;
using std::string;
using json = nlohmann::json;

using geom::AreaOfInterest;
using geom::Feature;
using geom::FeatureCollection;
using geom::FeatureKind;
using geom::LineString;
using geom::MultiLineString;
using geom::Point;

namespace bg = ::boost::geometry;

namespace features {

// Converts one Overpass element into a feature
//
// Args:
//    element: a member of the response's "elements" array
//    filter: element kinds accepted from this query
// Returns:
//    the feature, or nullopt for unsupported kinds (silently) and
//    malformed elements (with a warning)
optional<Feature> parseElement(const json& element, const KindFilter& filter) {
    if (!element.is_object()) return nullopt;
    const string type = element.value("type", "");
    const bool isNode = type == "node";
    const bool isWay = type == "way";
    // relations and anything else are not needed by any metric
    if ((!isNode || !filter.nodes) && (!isWay || !filter.ways)) return nullopt;

    if (!element.contains("id") || !element["id"].is_number_integer()) {
        cerr << "[warn] skipping " << type << " without an integer id\n";
        return nullopt;
    }

    Feature feature;
    feature.id = element["id"].get<int64_t>();

    if (element.contains("tags") && element["tags"].is_object()) {
        for (const auto& kv : element["tags"].items()) {
            if (kv.value().is_string()) feature.tags[kv.key()] = kv.value().get<string>();
        }
    }

    if (isNode) {
        if (!element.contains("lat") || !element.contains("lon") ||
            !element["lat"].is_number() || !element["lon"].is_number()) {
            cerr << "[warn] skipping node " << feature.id << " without coordinates\n";
            return nullopt;
        }
        feature.kind = FeatureKind::Point;
        feature.point = Point(element["lon"].get<double>(), element["lat"].get<double>());
        return feature;
    }

    // way: ordered vertex list from "out geom"
    LineString line;
    if (element.contains("geometry") && element["geometry"].is_array()) {
        for (const auto& vertex : element["geometry"]) {
            if (!vertex.is_object() || !vertex.contains("lat") || !vertex.contains("lon") ||
                !vertex["lat"].is_number() || !vertex["lon"].is_number())
                continue;
            line.push_back(Point(vertex["lon"].get<double>(), vertex["lat"].get<double>()));
        }
    }
    if (line.size() < 2) {
        cerr << "[warn] skipping way " << feature.id << " with fewer than 2 vertices\n";
        return nullopt;
    }
    feature.kind = FeatureKind::Line;
    feature.lines.push_back(std::move(line));
    return feature;
}

// Turns an Overpass JSON response into a feature collection
//
// Args:
//    response: parsed Overpass JSON
//    filter: element kinds accepted from this query
// Returns:
//    features in response order
FeatureCollection parseElements(const json& response, const KindFilter& filter) {
    FeatureCollection out;
    if (!response.is_object() || !response.contains("elements") ||
        !response["elements"].is_array())
        return out;

    for (const auto& element : response["elements"]) {
        auto feature = parseElement(element, filter);
        if (feature) out.push_back(std::move(*feature));
    }
    return out;
}

// Clips each feature to the area of interest, dropping anything left empty
//
// Args:
//    collection: features in lon/lat
//    aoi: the area of interest
// Returns:
//    features lying within the AOI polygon
FeatureCollection clipToAoi(const FeatureCollection& collection, const AreaOfInterest& aoi) {
    if (collection.empty()) return collection;

    FeatureCollection clipped;
    clipped.reserve(collection.size());
    for (const auto& feature : collection) {
        try {
            if (feature.kind == FeatureKind::Point) {
                // boundary counts as inside
                if (bg::covered_by(feature.point, aoi.polygon)) clipped.push_back(feature);
                continue;
            }

            MultiLineString parts;
            for (const auto& line : feature.lines) {
                MultiLineString pieces;
                bg::intersection(line, aoi.polygon, pieces);
                for (auto& piece : pieces) {
                    if (piece.size() >= 2) parts.push_back(std::move(piece));
                }
            }
            if (parts.empty()) continue;

            Feature out;
            out.id = feature.id;
            out.tags = feature.tags;
            out.kind = FeatureKind::Line;
            out.lines = std::move(parts);
            clipped.push_back(std::move(out));
        } catch (const exception& e) {
            cerr << "[warn] skipping feature " << feature.id << " during clipping: "
                 << e.what() << "\n";
        }
    }
    return clipped;
}

}  // namespace features
