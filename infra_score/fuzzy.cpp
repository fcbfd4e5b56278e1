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

#include "fuzzy.hpp"
#include <algorithm>  // for sort, max
#include <cctype>     // for isalnum, tolower
#include <sstream>    // for istringstream
#include <string>     // for string
#include <vector>     // for vector

using std::istringstream;
using std::max;
using std::sort;

namespace fuzzy {

// Lowercases, turns anything but letters and digits into spaces and trims
string defaultProcess(const string& text) {
    string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        out.push_back(std::isalnum(c) ? static_cast<char>(std::tolower(c)) : ' ');
    }
    const auto first = out.find_first_not_of(' ');
    if (first == string::npos) return {};
    const auto last = out.find_last_not_of(' ');
    return out.substr(first, last - first + 1);
}

// Length of the longest common subsequence, two-row dynamic programming
size_t longestCommonSubsequence(const string& a, const string& b) {
    vector<size_t> prev(b.size() + 1, 0);
    vector<size_t> curr(b.size() + 1, 0);
    for (size_t i = 1; i <= a.size(); ++i) {
        for (size_t j = 1; j <= b.size(); ++j) {
            curr[j] = a[i - 1] == b[j - 1] ? prev[j - 1] + 1 : max(prev[j], curr[j - 1]);
        }
        prev.swap(curr);
    }
    return prev[b.size()];
}

// Normalised Indel similarity: 100 * 2 * LCS / (|a| + |b|)
double ratio(const string& a, const string& b) {
    if (a.empty() || b.empty()) return 0.0;
    const double lcs = static_cast<double>(longestCommonSubsequence(a, b));
    return 100.0 * 2.0 * lcs / static_cast<double>(a.size() + b.size());
}

static string sortedTokens(const string& text) {
    istringstream in(defaultProcess(text));
    vector<string> tokens;
    string token;
    while (in >> token) tokens.push_back(token);
    sort(tokens.begin(), tokens.end());

    string joined;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i) joined.push_back(' ');
        joined += tokens[i];
    }
    return joined;
}

// Word-order-insensitive similarity in [0, 100]
double tokenSortRatio(const string& a, const string& b) {
    return ratio(sortedTokens(a), sortedTokens(b));
}

// Returns the best scoring choice; the earliest wins a tie
//
// Args:
//    query: text to match
//    choices: candidate names
// Returns:
//    best match, or nullopt when there are no choices
optional<Match> extractOne(const string& query, const vector<string>& choices) {
    optional<Match> best;
    for (const auto& choice : choices) {
        const double score = tokenSortRatio(query, choice);
        if (!best || score > best->score) best = Match{choice, score};
    }
    return best;
}

}  // namespace fuzzy
