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
#ifndef INFRA_SCORE_CANDIDATES_HPP_
#define INFRA_SCORE_CANDIDATES_HPP_

#include <cstddef>    // for size_t
#include <optional>   // for optional
#include <string>     // for string
#include <vector>     // for vector
#include "main.h"
#include "utils.hpp"

using std::optional;
using std::string;
using std::vector;

namespace candidates {

// entity labels that can name a place
const vector<string> PLACE_LABELS = {"GPE", "LOC", "FAC", "ORG"};

const size_t MAX_NGRAM = 3;

enum class Source { Entity, NGram };

struct LocationCandidate {
    string text;
    Source source = Source::NGram;
    size_t length{};
};

// labelled span from a named-entity recognizer
struct EntitySpan {
    string text;
    string label;
};

struct EntityRecognizer {
    virtual ~EntityRecognizer() = default;
    virtual vector<EntitySpan> recognize(const string& text) const = 0;
};

// Offline recognizer: maximal runs of capitalised words, labelled GPE
class CapitalizedSpanRecognizer : public EntityRecognizer {
 public:
    vector<EntitySpan> recognize(const string& text) const override;
};

// Recognizer backed by an NER service that takes {"text": ...} and
// answers {"entities": [{"text": ..., "label": ...}]}
class HttpEntityRecognizer : public EntityRecognizer {
 public:
    HttpEntityRecognizer(utils::IHttpClient& http, string url,
                         long timeoutSeconds = TEXT_SERVICE_TIMEOUT_SECONDS);
    vector<EntitySpan> recognize(const string& text) const override;

 private:
    utils::IHttpClient& http_;
    string url_;
    long timeoutSeconds_;
};

string trim(const string& text);
string stripPunctuation(const string& token);
vector<string> tokenize(const string& text);
vector<LocationCandidate> entityCandidates(const string& text, const EntityRecognizer& recognizer);
vector<LocationCandidate> ngramCandidates(const string& text);
optional<string> detectDirection(const string& text);

}  // namespace candidates

#endif  // INFRA_SCORE_CANDIDATES_HPP_
