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

#include "candidates.hpp"
#include <algorithm>              // for find, stable_sort
#include <cctype>                 // for ispunct, isspace, isupper, tolower
#include <exception>              // for exception
#include <iostream>               // for basic_ostream, operator<<, cerr
#include <map>                    // for map
#include <nlohmann/json.hpp>      // for basic_json
#include <set>                    // for set
#include <sstream>                // for istringstream
#include <string>                 // for string
#include <utility>                // for move

using std::cerr;
using std::exception;
using std::istringstream;
using std::map;
using std::set;
using json = nlohmann::json;

using utils::HttpResponse;
using utils::isSuccess;

namespace candidates {

string trim(const string& text) {
    size_t first = 0;
    while (first < text.size() && std::isspace(static_cast<unsigned char>(text[first]))) ++first;
    size_t last = text.size();
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) --last;
    return text.substr(first, last - first);
}

// Removes punctuation from both ends of a token
string stripPunctuation(const string& token) {
    size_t first = 0;
    while (first < token.size() && std::ispunct(static_cast<unsigned char>(token[first]))) ++first;
    size_t last = token.size();
    while (last > first && std::ispunct(static_cast<unsigned char>(token[last - 1]))) --last;
    return token.substr(first, last - first);
}

// Whitespace tokens with boundary punctuation stripped; single characters dropped
vector<string> tokenize(const string& text) {
    istringstream in(text);
    vector<string> tokens;
    string raw;
    while (in >> raw) {
        string token = stripPunctuation(raw);
        if (token.size() > 1) tokens.push_back(std::move(token));
    }
    return tokens;
}

vector<EntitySpan> CapitalizedSpanRecognizer::recognize(const string& text) const {
    vector<EntitySpan> spans;
    istringstream in(text);
    string raw;
    string current;

    auto flush = [&]() {
        if (!current.empty()) spans.push_back(EntitySpan{current, "GPE"});
        current.clear();
    };

    while (in >> raw) {
        const string token = stripPunctuation(raw);
        if (token.empty() || !std::isupper(static_cast<unsigned char>(token[0]))) {
            flush();
            continue;
        }
        if (!current.empty()) current.push_back(' ');
        current += token;
        // trailing punctuation ends the span, e.g. "Pune, India"
        if (token.size() != raw.size() && std::ispunct(static_cast<unsigned char>(raw.back())))
            flush();
    }
    flush();
    return spans;
}

HttpEntityRecognizer::HttpEntityRecognizer(utils::IHttpClient& http, string url, long timeoutSeconds)
    : http_(http), url_(std::move(url)), timeoutSeconds_(timeoutSeconds) {}

// Asks the NER service for entities; a failing service yields none
vector<EntitySpan> HttpEntityRecognizer::recognize(const string& text) const {
    vector<EntitySpan> spans;
    try {
        const json request = {{"text", text}};
        HttpResponse resp = http_.post(url_, request.dump(), "application/json", timeoutSeconds_);
        if (!isSuccess(resp)) {
            cerr << "[warn] NER service returned HTTP " << resp.status << "\n";
            return spans;
        }
        const auto j = json::parse(resp.body);
        if (!j.contains("entities") || !j["entities"].is_array()) return spans;
        for (const auto& e : j["entities"]) {
            if (!e.is_object()) continue;
            const string spanText = e.value("text", "");
            const string label = e.value("label", "");
            if (!spanText.empty()) spans.push_back(EntitySpan{spanText, label});
        }
    } catch (const exception& e) {
        cerr << "[warn] NER service failed: " << e.what() << "\n";
    }
    return spans;
}

// Place-like entity spans in recognizer order
//
// Args:
//    text: user text
//    recognizer: the entity recognizer to run
// Returns:
//    trimmed entity candidates
vector<LocationCandidate> entityCandidates(const string& text, const EntityRecognizer& recognizer) {
    vector<LocationCandidate> out;
    for (const auto& span : recognizer.recognize(text)) {
        if (std::find(PLACE_LABELS.begin(), PLACE_LABELS.end(), span.label) == PLACE_LABELS.end())
            continue;
        string trimmed = trim(span.text);
        if (trimmed.empty()) continue;
        const size_t length = trimmed.size();
        out.push_back(LocationCandidate{std::move(trimmed), Source::Entity, length});
    }
    return out;
}

// All distinct 1..3 token spans, longest first
//
// Args:
//    text: user text
// Returns:
//    n-gram candidates ordered by descending length
vector<LocationCandidate> ngramCandidates(const string& text) {
    const vector<string> tokens = tokenize(text);
    vector<LocationCandidate> out;
    set<string> seen;

    for (size_t n = MAX_NGRAM; n >= 1; --n) {
        for (size_t i = 0; i + n <= tokens.size(); ++i) {
            string span = tokens[i];
            for (size_t k = 1; k < n; ++k) span += " " + tokens[i + k];
            if (!seen.insert(span).second) continue;
            const size_t length = span.size();
            out.push_back(LocationCandidate{std::move(span), Source::NGram, length});
        }
    }

    std::stable_sort(out.begin(), out.end(),
        [](const LocationCandidate& a, const LocationCandidate& b) {
            return a.length > b.length;
        });
    return out;
}

// Finds the first compass direction word or letter
//
// Args:
//    text: user text
// Returns:
//    "North", "South", "East" or "West", or nullopt
optional<string> detectDirection(const string& text) {
    static const map<string, string> DIRECTIONS = {
        {"n", "North"}, {"north", "North"},
        {"s", "South"}, {"south", "South"},
        {"e", "East"}, {"east", "East"},
        {"w", "West"}, {"west", "West"},
    };

    istringstream in(text);
    string raw;
    while (in >> raw) {
        string token = stripPunctuation(raw);
        for (auto& c : token) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        auto it = DIRECTIONS.find(token);
        if (it != DIRECTIONS.end()) return it->second;
    }
    return std::nullopt;
}

}  // namespace candidates
