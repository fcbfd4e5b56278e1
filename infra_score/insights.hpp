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
#ifndef INFRA_SCORE_INSIGHTS_HPP_
#define INFRA_SCORE_INSIGHTS_HPP_

#include <nlohmann/json_fwd.hpp>  // for json
#include <cstddef>                // for size_t
#include <optional>               // for optional
#include <string>                 // for string
#include <vector>                 // for vector
#include "main.h"
#include "metrics.hpp"
#include "utils.hpp"

using std::optional;
using std::string;
using std::vector;
using json = nlohmann::json;

namespace insights {

const size_t MAX_FINDINGS = 3;
const double FALLBACK_CONFIDENCE = 0.45;

struct ScoreSummary {
    optional<double> infraIndex;
    optional<double> accessIndex;
    optional<double> socioScore;
};

// interpretation of a metrics record from the text service
struct Insights {
    string summaryText;
    vector<string> keyFindings;
    vector<string> priorityActions;
    ScoreSummary scores;
    double confidence{};
};

// decoded insights plus the names of fields that fell back to defaults
struct DecodeResult {
    Insights insights;
    vector<string> defaulted;
    bool parsed = false;
};

DecodeResult decodeInsights(const string& body, const Insights& defaults);
Insights fallbackInsights(const metrics::InfrastructureMetrics& m,
                          const vector<string>& recommendations);
json toJson(const Insights& insights);

// Posts a metrics request to a text-understanding service. Any failure
// yields the caller's fallback; the status says which path was taken.
class InsightsClient {
 public:
    InsightsClient(utils::IHttpClient& http, string url,
                   long timeoutSeconds = TEXT_SERVICE_TIMEOUT_SECONDS);

    Insights generate(const json& request, const Insights& fallback, string* status) const;

 private:
    utils::IHttpClient& http_;
    string url_;
    long timeoutSeconds_;
};

}  // namespace insights

#endif  // INFRA_SCORE_INSIGHTS_HPP_
