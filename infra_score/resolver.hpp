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
#ifndef INFRA_SCORE_RESOLVER_HPP_
#define INFRA_SCORE_RESOLVER_HPP_

#include <nlohmann/json_fwd.hpp>  // for json
#include <memory>                 // for unique_ptr
#include <optional>               // for optional
#include <string>                 // for string
#include <vector>                 // for vector
#include "candidates.hpp"
#include "fuzzy.hpp"
#include "main.h"
#include "registry.hpp"

using std::optional;
using std::string;
using std::unique_ptr;
using std::vector;
using json = nlohmann::json;

namespace resolver {

// Result of one resolution; unresolved has no name and confidence 0
struct ResolvedLocation {
    optional<string> matchedName;
    double confidence{};
    optional<string> sublocation;

    bool resolved() const { return matchedName.has_value(); }
};

// One stage of the resolution chain
class ResolutionStrategy {
 public:
    virtual ~ResolutionStrategy() = default;
    virtual const char* name() const = 0;
    virtual optional<fuzzy::Match> tryResolve(const string& text,
                                              const registry::Snapshot& known) const = 0;

 protected:
    explicit ResolutionStrategy(double threshold) : threshold_(threshold) {}
    optional<fuzzy::Match> acceptBest(const string& candidate,
                                      const registry::Snapshot& known) const;

    double threshold_;
};

// entity spans, alias-resolved before fuzzy matching
class EntityStrategy : public ResolutionStrategy {
 public:
    EntityStrategy(const candidates::EntityRecognizer& recognizer, double threshold);
    const char* name() const override { return "entity"; }
    optional<fuzzy::Match> tryResolve(const string& text,
                                      const registry::Snapshot& known) const override;

 private:
    const candidates::EntityRecognizer& recognizer_;
};

// 1..3 token spans, longest first
class NGramStrategy : public ResolutionStrategy {
 public:
    explicit NGramStrategy(double threshold) : ResolutionStrategy(threshold) {}
    const char* name() const override { return "ngram"; }
    optional<fuzzy::Match> tryResolve(const string& text,
                                      const registry::Snapshot& known) const override;
};

// the whole text as a single candidate
class WholeTextStrategy : public ResolutionStrategy {
 public:
    explicit WholeTextStrategy(double threshold) : ResolutionStrategy(threshold) {}
    const char* name() const override { return "whole-text"; }
    optional<fuzzy::Match> tryResolve(const string& text,
                                      const registry::Snapshot& known) const override;
};

// Tries each strategy in order and stops at the first match.
// Never mutates the registry; resolve() is safe to call concurrently.
class LocationResolver {
 public:
    LocationResolver(registry::LocationRegistry& registry,
                     const candidates::EntityRecognizer& recognizer,
                     double threshold = MATCH_THRESHOLD);

    ResolvedLocation resolve(const string& text) const;
    ResolvedLocation resolveAgainst(const string& text, const registry::Snapshot& known) const;

 private:
    registry::LocationRegistry& registry_;
    vector<unique_ptr<ResolutionStrategy>> strategies_;
};

json toJson(const ResolvedLocation& location);

}  // namespace resolver

#endif  // INFRA_SCORE_RESOLVER_HPP_
