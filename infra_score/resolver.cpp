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

#include "resolver.hpp"
#include <iostream>               // for basic_ostream, operator<<, cerr
#include <memory>                 // for make_unique
#include <nlohmann/json.hpp>      // for basic_json
#include <string>                 // for string

using std::cerr;
using std::make_unique;
using std::nullopt;
using json = nlohmann::json;

using candidates::EntityRecognizer;
using fuzzy::Match;
using registry::Snapshot;

namespace resolver {

// Best registry match for a candidate if it clears the threshold
optional<Match> ResolutionStrategy::acceptBest(const string& candidate,
                                               const Snapshot& known) const {
    auto best = fuzzy::extractOne(candidate, known.names());
    if (best && best->score >= threshold_) return best;
    return nullopt;
}

EntityStrategy::EntityStrategy(const EntityRecognizer& recognizer, double threshold)
    : ResolutionStrategy(threshold), recognizer_(recognizer) {}

optional<Match> EntityStrategy::tryResolve(const string& text, const Snapshot& known) const {
    for (const auto& candidate : candidates::entityCandidates(text, recognizer_)) {
        const string normalized = known.resolveAlias(candidate.text).value_or(candidate.text);
        auto match = acceptBest(normalized, known);
        if (match) return match;
    }
    return nullopt;
}

optional<Match> NGramStrategy::tryResolve(const string& text, const Snapshot& known) const {
    for (const auto& candidate : candidates::ngramCandidates(text)) {
        auto match = acceptBest(candidate.text, known);
        if (match) return match;
    }
    return nullopt;
}

optional<Match> WholeTextStrategy::tryResolve(const string& text, const Snapshot& known) const {
    return acceptBest(text, known);
}

LocationResolver::LocationResolver(registry::LocationRegistry& registry,
                                   const EntityRecognizer& recognizer, double threshold)
    : registry_(registry) {
    strategies_.push_back(make_unique<EntityStrategy>(recognizer, threshold));
    strategies_.push_back(make_unique<NGramStrategy>(threshold));
    strategies_.push_back(make_unique<WholeTextStrategy>(threshold));
}

// Resolves against the registry's current snapshot
ResolvedLocation LocationResolver::resolve(const string& text) const {
    const auto known = registry_.snapshot();
    return resolveAgainst(text, *known);
}

// Runs the strategy chain against one snapshot
//
// Args:
//    text: free-form user text
//    known: the known-location snapshot
// Returns:
//    matched name, score and direction; unresolved when nothing clears the threshold
ResolvedLocation LocationResolver::resolveAgainst(const string& text, const Snapshot& known) const {
    ResolvedLocation out;
    for (const auto& strategy : strategies_) {
        auto match = strategy->tryResolve(text, known);
        if (!match) continue;
        cerr << "Location matched by " << strategy->name() << ": " << match->choice
             << " (" << match->score << ")\n";
        out.matchedName = match->choice;
        out.confidence = match->score;
        out.sublocation = candidates::detectDirection(text);
        return out;
    }
    return out;
}

json toJson(const ResolvedLocation& location) {
    json j;
    j["matched_name"] = location.matchedName ? json(*location.matchedName) : json(nullptr);
    j["confidence"] = location.confidence;
    j["sublocation"] = location.sublocation ? json(*location.sublocation) : json(nullptr);
    return j;
}

}  // namespace resolver
