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

#include "insights.hpp"
#include <exception>              // for exception
#include <iomanip>                // for setprecision
#include <iostream>               // for basic_ostream, operator<<, cerr
#include <nlohmann/json.hpp>      // for basic_json
#include <sstream>                // for basic_ostringstream
#include <string>                 // for string
#include <utility>                // for move

using std::cerr;
using std::exception;
using std::fixed;
using std::ostringstream;
using std::setprecision;
using json = nlohmann::json;

using utils::HttpResponse;
using utils::isSuccess;

namespace insights {

// Reads an array made only of strings
static optional<vector<string>> stringArray(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_array()) return std::nullopt;
    vector<string> out;
    for (const auto& item : j[key]) {
        if (!item.is_string()) return std::nullopt;
        out.push_back(item.get<string>());
    }
    return out;
}

static optional<double> number(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number()) return std::nullopt;
    return j[key].get<double>();
}

// Decodes a service reply against the insights schema
//
// Args:
//    body: reply text, which must be exactly one JSON object
//    defaults: values substituted for each missing or mistyped field
// Returns:
//    decoded insights and the list of defaulted fields
DecodeResult decodeInsights(const string& body, const Insights& defaults) {
    DecodeResult result;
    result.insights = defaults;

    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error&) {
        result.defaulted.push_back("*");
        return result;
    }
    if (!j.is_object()) {
        result.defaulted.push_back("*");
        return result;
    }
    result.parsed = true;
    Insights& out = result.insights;

    if (j.contains("summary_text") && j["summary_text"].is_string() &&
        !j["summary_text"].get<string>().empty()) {
        out.summaryText = j["summary_text"].get<string>();
    } else {
        result.defaulted.push_back("summary_text");
    }

    if (auto findings = stringArray(j, "key_findings")) {
        if (findings->size() > MAX_FINDINGS) findings->resize(MAX_FINDINGS);
        out.keyFindings = std::move(*findings);
    } else {
        result.defaulted.push_back("key_findings");
    }

    if (auto actions = stringArray(j, "priority_actions")) {
        out.priorityActions = std::move(*actions);
    } else {
        result.defaulted.push_back("priority_actions");
    }

    const json scores = j.contains("scores") && j["scores"].is_object() ? j["scores"] : json::object();
    if (auto v = number(scores, "infra_index")) out.scores.infraIndex = v;
    else result.defaulted.push_back("scores.infra_index");
    if (auto v = number(scores, "access_index")) out.scores.accessIndex = v;
    else result.defaulted.push_back("scores.access_index");
    if (auto v = number(scores, "socio_score")) out.scores.socioScore = v;
    else result.defaulted.push_back("scores.socio_score");

    auto confidence = number(j, "confidence");
    if (confidence && *confidence >= 0.0 && *confidence <= 1.0) {
        out.confidence = *confidence;
    } else {
        result.defaulted.push_back("confidence");
    }
    return result;
}

// Deterministic interpretation used when no text service answers
//
// Args:
//    m: the metrics record
//    recommendations: category recommendations, the first three become actions
// Returns:
//    fallback insights
Insights fallbackInsights(const metrics::InfrastructureMetrics& m,
                          const vector<string>& recommendations) {
    Insights out;
    ostringstream summary;
    summary << fixed << setprecision(2)
            << "Synthesizing OSM metrics: infrastructure index=" << m.scores.infraIndex
            << ", access index=" << m.scores.accessIndex
            << setprecision(1) << ", socio score=" << m.scores.socioEconScore
            << ". This suggests moderate infrastructure with room to improve healthcare access.";
    out.summaryText = summary.str();

    ostringstream road, buildings, score;
    road << fixed << setprecision(2) << "Road density ~ " << m.roadKmPerKm2 << " km/km2";
    buildings << fixed << setprecision(1) << "Buildings/km2 ~ " << m.buildingsPerKm2;
    score << fixed << setprecision(1) << "Socio score ~ " << m.scores.socioEconScore;
    out.keyFindings = {road.str(), buildings.str(), score.str()};

    for (size_t i = 0; i < recommendations.size() && i < 3; ++i) {
        out.priorityActions.push_back("Action: " + recommendations[i]);
    }
    if (out.priorityActions.empty()) out.priorityActions.push_back("Review infrastructure and access metrics");

    out.scores.infraIndex = m.scores.infraIndex;
    out.scores.accessIndex = m.scores.accessIndex;
    out.scores.socioScore = m.scores.socioEconScore;
    out.confidence = FALLBACK_CONFIDENCE;
    return out;
}

static json optionalNumber(const optional<double>& v) {
    return v ? json(*v) : json(nullptr);
}

json toJson(const Insights& insights) {
    return json{
        {"summary_text", insights.summaryText},
        {"key_findings", insights.keyFindings},
        {"priority_actions", insights.priorityActions},
        {"scores", {
            {"infra_index", optionalNumber(insights.scores.infraIndex)},
            {"access_index", optionalNumber(insights.scores.accessIndex)},
            {"socio_score", optionalNumber(insights.scores.socioScore)}
        }},
        {"confidence", insights.confidence}
    };
}

InsightsClient::InsightsClient(utils::IHttpClient& http, string url, long timeoutSeconds)
    : http_(http), url_(std::move(url)), timeoutSeconds_(timeoutSeconds) {}

// Requests insights for a metrics record
//
// Args:
//    request: JSON payload describing the query and its metrics
//    fallback: insights to use for anything the service can't provide
//    status: "ok", "partial" or "error: ..." on return
// Returns:
//    decoded insights
Insights InsightsClient::generate(const json& request, const Insights& fallback, string* status) const {
    HttpResponse resp;
    try {
        resp = http_.post(url_, request.dump(), "application/json", timeoutSeconds_);
    } catch (const exception& e) {
        cerr << "[warn] insights service failed: " << e.what() << "\n";
        *status = string("error: ") + e.what();
        return fallback;
    }
    if (!isSuccess(resp)) {
        ostringstream oss;
        oss << "error: HTTP " << resp.status;
        *status = oss.str();
        return fallback;
    }

    DecodeResult decoded = decodeInsights(resp.body, fallback);
    if (!decoded.parsed) {
        *status = "error: reply is not a JSON object";
    } else {
        *status = decoded.defaulted.empty() ? "ok" : "partial";
    }
    return decoded.insights;
}

}  // namespace insights
