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

#include "classifier.hpp"
#include <algorithm>              // for any_of
#include <cctype>                 // for tolower
#include <map>                    // for map
#include <nlohmann/json.hpp>      // for basic_json
#include <string>                 // for string

using std::map;
using json = nlohmann::json;

namespace classifier {

static string lower(const string& text) {
    string out = text;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

// Substring test against each word
bool containsAny(const string& lowered, const vector<string>& words) {
    return std::any_of(words.begin(), words.end(), [&](const string& w) {
        return lowered.find(w) != string::npos;
    });
}

// Classifies a query by keyword
//
// Args:
//    query: free-form user text
// Returns:
//    category, intent, analysis type, priority and requested metrics
QueryClassification classifyQuery(const string& query) {
    const string q = lower(query);
    QueryClassification c;

    // first matching rule wins
    if (containsAny(q, {"road", "building", "intersection", "infrastructure", "development"})) {
        c.category = "infrastructure";
    } else if (containsAny(q, {"healthcare", "hospital", "school", "education", "quality",
                               "life", "amenity"})) {
        c.category = "quality_of_life";
    } else if (containsAny(q, {"traffic", "transportation", "connectivity", "road condition"})) {
        c.category = "road_conditions";
    } else if (containsAny(q, {"commercial", "residential", "business", "industrial", "store"})) {
        c.category = "industry";
    } else if (containsAny(q, {"compare", "versus", "vs", "difference", "between"})) {
        c.category = "comparison";
    }

    if (containsAny(q, {"compare", "versus", "vs", "difference"})) {
        c.intent = "comparison";
    } else if (containsAny(q, {"predict", "future", "will", "going to"})) {
        c.intent = "prediction";
    } else if (containsAny(q, {"analyze", "analysis", "detailed"})) {
        c.intent = "analysis";
    } else if (containsAny(q, {"assess", "status", "current", "how"})) {
        c.intent = "assessment";
    }

    if (containsAny(q, {"road", "highway", "street"})) c.metrics.push_back("roads");
    if (containsAny(q, {"building", "structure"})) c.metrics.push_back("buildings");
    if (containsAny(q, {"hospital", "medical", "clinic"})) c.metrics.push_back("hospitals");
    if (containsAny(q, {"school", "education", "university"})) c.metrics.push_back("schools");
    if (containsAny(q, {"intersection", "crossing", "junction"})) c.metrics.push_back("intersections");

    c.analysisType = containsAny(q, {"area", "location"}) ? "spatial" : "statistical";
    c.priority = containsAny(q, {"urgent", "important", "critical"}) ? "high" : "medium";
    c.requiresComparison = c.intent == "comparison";
    c.confidence = c.category != "general" ? 0.8 : 0.6;
    return c;
}

// Fixed follow-up suggestions per category
vector<string> recommendationsFor(const string& category) {
    static const map<string, vector<string>> RECOMMENDATIONS = {
        {"infrastructure", {"Analyze road network density",
                            "Assess building infrastructure",
                            "Evaluate intersection quality"}},
        {"quality_of_life", {"Check healthcare accessibility",
                             "Evaluate educational facilities",
                             "Assess amenity coverage"}},
        {"road_conditions", {"Analyze traffic patterns",
                             "Assess road connectivity",
                             "Evaluate transportation infrastructure"}},
        {"industry", {"Analyze commercial development",
                      "Assess residential infrastructure",
                      "Evaluate industrial potential"}},
        {"comparison", {"Generate comparative reports",
                        "Create visualization charts",
                        "Provide ranking analysis"}},
        {"general", {"Conduct comprehensive analysis",
                     "Generate overview report",
                     "Create development roadmap"}},
    };
    auto it = RECOMMENDATIONS.find(category);
    if (it != RECOMMENDATIONS.end()) return it->second;
    return {"Analyze the area", "Generate report", "Provide insights"};
}

json toJson(const QueryClassification& c) {
    return json{
        {"category", c.category},
        {"intent", c.intent},
        {"analysis_type", c.analysisType},
        {"priority", c.priority},
        {"metrics", c.metrics},
        {"requires_comparison", c.requiresComparison},
        {"confidence", c.confidence}
    };
}

}  // namespace classifier
