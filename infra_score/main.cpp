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

// main.cpp

// 1. Project headers
#include "main.h"
#include "areas.hpp"
#include "candidates.hpp"
#include "classifier.hpp"
#include "geom.hpp"
#include "insights.hpp"
#include "metrics.hpp"
#include "overpass.hpp"
#include "pipeline.hpp"
#include "registry.hpp"
#include "resolver.hpp"
#include "utils.hpp"

// 2. C++ system headers
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// 3. Other library headers
#include <nlohmann/json.hpp>

using std::string;
using std::vector;
using std::cout;
using std::cerr;
using std::exception;
using std::optional;
using std::istringstream;
using std::make_shared;
using std::make_unique;
using std::unique_ptr;
using std::chrono::milliseconds;
using json = nlohmann::json;

// input args for main entry point
struct Args {
    optional<geom::BoundingBox> bbox;
    optional<string> query;
    string storageRoot = DEFAULT_STORAGE_ROOT;
    optional<string> nerUrl;
    optional<string> insightsUrl;
    string overpassUrl = OVERPASS_URL;
    int pauseMs = OVERPASS_RETRY_PAUSE_MS;
};

// Parses "minLon,minLat,maxLon,maxLat"
//
// Args:
//    text: comma separated box
//    out: pointer to the box to fill
// Returns:
//    false unless exactly four numbers were read
bool parseBoundingBox(const string& text, geom::BoundingBox* out) {
    istringstream in(text);
    vector<double> values;
    string item;
    while (std::getline(in, item, ',')) {
        try {
            size_t used = 0;
            values.push_back(std::stod(item, &used));
            if (used != item.size()) return false;
        } catch (const std::logic_error&) {
            return false;
        }
    }
    if (values.size() != 4) return false;
    *out = geom::BoundingBox{values[0], values[1], values[2], values[3]};
    return true;
}

// Parses arguments from main entry point
//
// Args:
//    argc: number of arguments given
//    argv: provided arguments
//    out: pointer to the Args structure to set state on
bool parseArgs(int argc, char** argv, Args* out) {
    for (int i = 1; i < argc; ++i) {
        string a(argv[i]);
        if (a == "--bbox" && i + 1 < argc) {
            geom::BoundingBox box;
            if (!parseBoundingBox(argv[++i], &box)) return false;
            (*out).bbox = box;
        } else if (a == "--query" && i + 1 < argc) {
            (*out).query = argv[++i];
        } else if (a == "--storage" && i + 1 < argc) {
            (*out).storageRoot = argv[++i];
        } else if (a == "--ner-url" && i + 1 < argc) {
            (*out).nerUrl = argv[++i];
        } else if (a == "--insights-url" && i + 1 < argc) {
            (*out).insightsUrl = argv[++i];
        } else if (a == "--overpass-url" && i + 1 < argc) {
            (*out).overpassUrl = argv[++i];
        } else if (a == "--pause-ms" && i + 1 < argc) {
            try {
                (*out).pauseMs = std::stoi(argv[++i]);
            } catch (const std::logic_error&) {
                return false;
            }
            if ((*out).pauseMs < 0) return false;
        } else {
            return false;
        }
    }
    return (*out).bbox.has_value() || (*out).query.has_value();
}

// CLI usage message output as console error message
//
// Args:
//     exe: executable's name
void usage(const char* exe) {
    cerr << "Usage:\n"
    << "  " << exe << " --bbox minLon,minLat,maxLon,maxLat [--query TEXT]\n"
    << "  " << exe << " --query TEXT [--storage DIR]\n"
    << "A query without --bbox is measured over the coordinates or city it names.\n"
    << "Options:\n"
    << "  --storage DIR        location directories root (default " << DEFAULT_STORAGE_ROOT << ")\n"
    << "  --ner-url URL        named-entity service, offline recognizer when absent\n"
    << "  --insights-url URL   insights service, fallback insights when absent\n"
    << "  --overpass-url URL   Overpass interpreter endpoint\n"
    << "  --pause-ms N         pause before the Overpass retry\n";
}

// Entry point
int main(int argc, char** argv) {
    Args args;
    if (!parseArgs(argc, argv, &args)) {
        usage(argv[0]);
        return 1;
    }

    try {
        utils::CurlHttpClient http(USER_AGENT);
        json out = json::object();

        // 1) Classify the query and resolve its location
        optional<classifier::QueryClassification> classification;
        if (args.query) {
            classification = classifier::classifyQuery(*args.query);

            unique_ptr<candidates::EntityRecognizer> recognizer;
            if (args.nerUrl) {
                recognizer = make_unique<candidates::HttpEntityRecognizer>(http, *args.nerUrl);
            } else {
                recognizer = make_unique<candidates::CapitalizedSpanRecognizer>();
            }
            registry::LocationRegistry known(
                make_shared<registry::DirectoryStorageLister>(args.storageRoot));
            resolver::LocationResolver locator(known, *recognizer);

            const auto location = locator.resolve(*args.query);
            out["query"] = *args.query;
            out["location"] = resolver::toJson(location);
            out["classification"] = classifier::toJson(*classification);
            out["recommendations"] = classifier::recommendationsFor(classification->category);

            // 2) Without --bbox, measure the area the query points at
            if (!args.bbox) {
                const auto area = areas::locateArea(*args.query, location.matchedName);
                if (area) {
                    out["area"] = areas::toJson(*area);
                    args.bbox = area->bbox;
                } else {
                    cerr << "[warn] No area found in the query; metrics skipped\n";
                }
            }
        }

        // 3) Compute metrics for the bounding box
        if (args.bbox) {
            overpass::OverpassClient::Options options;
            options.url = args.overpassUrl;
            options.retryPause = milliseconds(args.pauseMs);
            overpass::OverpassClient client(http, options);
            pipeline::AoiPipeline aoiPipeline(client);

            const auto m = aoiPipeline.run(*args.bbox);
            out["metrics"] = metrics::toJson(m);

            // 4) Interpret the metrics
            const string category = classification ? classification->category : "general";
            const auto fallback = insights::fallbackInsights(m, classifier::recommendationsFor(category));
            if (args.insightsUrl) {
                json request = {{"query", args.query.value_or("")}, {"metrics", out["metrics"]}};
                string status;
                insights::InsightsClient service(http, *args.insightsUrl);
                const auto result = service.generate(request, fallback, &status);
                cerr << "Insights: " << status << "\n";
                out["insights"] = insights::toJson(result);
            } else {
                out["insights"] = insights::toJson(fallback);
            }
        }

        cout << out.dump(2) << "\n";
    } catch (const exception& e) {
        cerr << "Fatal: " << e.what() << "\n";
        return 2;
    }

    return 0;
}
