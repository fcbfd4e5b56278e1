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
#ifndef INFRA_SCORE_FUZZY_HPP_
#define INFRA_SCORE_FUZZY_HPP_

#include <cstddef>   // for size_t
#include <optional>  // for optional
#include <string>    // for string
#include <vector>    // for vector

using std::optional;
using std::string;
using std::vector;

namespace fuzzy {

// best choice for a query and its score in [0, 100]
struct Match {
    string choice;
    double score{};
};

string defaultProcess(const string& text);
size_t longestCommonSubsequence(const string& a, const string& b);
double ratio(const string& a, const string& b);
double tokenSortRatio(const string& a, const string& b);
optional<Match> extractOne(const string& query, const vector<string>& choices);

}  // namespace fuzzy

#endif  // INFRA_SCORE_FUZZY_HPP_
