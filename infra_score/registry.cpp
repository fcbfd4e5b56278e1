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

#include "registry.hpp"
#include <algorithm>     // for sort
#include <cctype>        // for isspace, tolower, toupper
#include <filesystem>    // for directory_iterator
#include <iostream>      // for basic_ostream, operator<<, cerr
#include <mutex>         // for unique_lock
#include <set>           // for set
#include <shared_mutex>  // for shared_lock
#include <string>        // for string
#include <system_error>  // for error_code
#include <utility>       // for move

using std::cerr;
using std::error_code;
using std::make_shared;
using std::set;
using std::shared_lock;
using std::shared_mutex;
using std::unique_lock;

namespace fs = std::filesystem;

namespace registry {

// Lowercases and drops all whitespace, so "New  Delhi" and "newdelhi" agree
string normalizeAliasKey(const string& text) {
    string key;
    key.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isspace(c)) continue;
        key.push_back(static_cast<char>(std::tolower(c)));
    }
    return key;
}

// Converts a storage slug to a display name, e.g. "new-delhi" -> "New Delhi"
string slugToDisplayName(const string& slug) {
    string out;
    out.reserve(slug.size());
    bool startOfWord = true;
    for (unsigned char c : slug) {
        if (c == '-' || c == '_') c = ' ';
        if (!std::isalpha(c)) {
            out.push_back(static_cast<char>(c));
            startOfWord = true;
            continue;
        }
        out.push_back(static_cast<char>(startOfWord ? std::toupper(c) : std::tolower(c)));
        startOfWord = false;
    }
    return out;
}

// Informal and historical names of the cities we hold imagery for
AliasTable defaultAliases() {
    return AliasTable{
        {"delhi", "New Delhi"},
        {"newdelhi", "New Delhi"},
        {"bombay", "Mumbai"},
        {"bangalore", "Bengaluru"},
        {"madras", "Chennai"},
        {"calcutta", "Kolkata"},
        {"poona", "Pune"},
        {"gurgaon", "Gurugram"},
    };
}

DirectoryStorageLister::DirectoryStorageLister(string root) : root_(std::move(root)) {}

// Returns the names of the root's sub-directories, sorted
vector<string> DirectoryStorageLister::listLocations() const {
    vector<string> out;
    error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        cerr << "[warn] can't list storage root " << root_ << ": " << ec.message() << "\n";
        return out;
    }
    for (const auto& entry : it) {
        const string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.') continue;
        if (!entry.is_directory(ec) || ec) continue;
        out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

Snapshot::Snapshot(map<string, Entry> entries, AliasTable aliases)
    : entries_(std::move(entries)), aliases_(std::move(aliases)) {}

vector<string> Snapshot::names() const {
    vector<string> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) out.push_back(kv.first);
    return out;
}

bool Snapshot::contains(const string& name) const {
    return entries_.count(name) > 0;
}

// Exact alias lookup, case and whitespace insensitive
optional<string> Snapshot::resolveAlias(const string& text) const {
    auto it = aliases_.find(normalizeAliasKey(text));
    if (it == aliases_.end()) return std::nullopt;
    return it->second;
}

// Merges discovered locations with alias targets
//
// Args:
//    slugs: top-level storage identifiers
//    aliases: alias table whose targets join the set
// Returns:
//    snapshot holding each name once
Snapshot buildSnapshot(const vector<string>& slugs, const AliasTable& aliases) {
    map<string, Entry> entries;
    // normalised key -> name already present, for case-insensitive merging
    map<string, string> present;

    for (const auto& slug : slugs) {
        const string name = slugToDisplayName(slug);
        const string key = normalizeAliasKey(name);
        if (key.empty() || present.count(key)) continue;
        present[key] = name;
        entries[name] = Entry{};
    }

    set<string> targets;
    for (const auto& kv : aliases) targets.insert(kv.second);
    for (const auto& target : targets) {
        const string key = normalizeAliasKey(target);
        auto it = present.find(key);
        if (it != present.end()) {
            entries[it->second].isAliasTarget = true;
            continue;
        }
        present[key] = target;
        entries[target] = Entry{true};
    }
    return Snapshot(std::move(entries), aliases);
}

LocationRegistry::LocationRegistry(shared_ptr<const StorageLister> lister, AliasTable aliases)
    : lister_(std::move(lister)), aliases_(std::move(aliases)) {}

// Returns the cached snapshot, building it on first use
shared_ptr<const Snapshot> LocationRegistry::snapshot() {
    {
        shared_lock<shared_mutex> lock(mutex_);
        if (cached_) return cached_;
    }
    unique_lock<shared_mutex> lock(mutex_);
    if (!cached_) {
        cached_ = make_shared<const Snapshot>(buildSnapshot(lister_->listLocations(), aliases_));
        cerr << "Known locations loaded: " << cached_->entries().size() << "\n";
    }
    return cached_;
}

// Rebuilds from storage now
shared_ptr<const Snapshot> LocationRegistry::refresh() {
    auto fresh = make_shared<const Snapshot>(buildSnapshot(lister_->listLocations(), aliases_));
    unique_lock<shared_mutex> lock(mutex_);
    cached_ = fresh;
    return cached_;
}

// Drops the cache; the next snapshot() rebuilds
void LocationRegistry::invalidate() {
    unique_lock<shared_mutex> lock(mutex_);
    cached_.reset();
}

}  // namespace registry
