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
#ifndef INFRA_SCORE_CLASSIFIER_HPP_
#define INFRA_SCORE_CLASSIFIER_HPP_

#include <nlohmann/json_fwd.hpp>  // for json
#include <string>                 // for string
#include <vector>                 // for vector

using std::string;
using std::vector;
using json = nlohmann::json;

namespace classifier {

// keyword classification of a user query
struct QueryClassification {
    string category = "general";
    string intent = "information";
    string analysisType = "statistical";
    string priority = "medium";
    vector<string> metrics;
    bool requiresComparison = false;
    double confidence = 0.6;
};

bool containsAny(const string& lowered, const vector<string>& words);
QueryClassification classifyQuery(const string& query);
vector<string> recommendationsFor(const string& category);
json toJson(const QueryClassification& c);

}  // namespace classifier

#endif  // INFRA_SCORE_CLASSIFIER_HPP_
