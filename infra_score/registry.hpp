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
#ifndef INFRA_SCORE_REGISTRY_HPP_
#define INFRA_SCORE_REGISTRY_HPP_

#include <map>           // for map
#include <memory>        // for shared_ptr
#include <optional>      // for optional
#include <shared_mutex>  // for shared_mutex
#include <string>        // for string
#include <vector>        // for vector

using std::map;
using std::shared_ptr;
using std::optional;
using std::string;
using std::vector;

namespace registry {

// normalised alias key -> canonical location name
typedef map<string, string> AliasTable;

string normalizeAliasKey(const string& text);
string slugToDisplayName(const string& slug);
AliasTable defaultAliases();

// Lists the top-level location identifiers of the image store
struct StorageLister {
    virtual ~StorageLister() = default;
    virtual vector<string> listLocations() const = 0;
};

// Lists sub-directories of a root directory, skipping hidden ones
class DirectoryStorageLister : public StorageLister {
 public:
    explicit DirectoryStorageLister(string root);
    vector<string> listLocations() const override;

 private:
    string root_;
};

struct Entry {
    bool isAliasTarget = false;
};

// Immutable set of known locations, ordered by name
class Snapshot {
 public:
    Snapshot(map<string, Entry> entries, AliasTable aliases);

    const map<string, Entry>& entries() const { return entries_; }
    vector<string> names() const;
    bool contains(const string& name) const;
    optional<string> resolveAlias(const string& text) const;

 private:
    map<string, Entry> entries_;
    AliasTable aliases_;
};

Snapshot buildSnapshot(const vector<string>& slugs, const AliasTable& aliases);

// Known-location cache. Built on first use and only rebuilt by refresh()
// or after invalidate(); readers never see a storage change otherwise.
// Snapshots handed out stay valid across a rebuild.
class LocationRegistry {
 public:
    explicit LocationRegistry(shared_ptr<const StorageLister> lister,
                              AliasTable aliases = defaultAliases());

    shared_ptr<const Snapshot> snapshot();
    shared_ptr<const Snapshot> refresh();
    void invalidate();

 private:
    shared_ptr<const StorageLister> lister_;
    AliasTable aliases_;
    std::shared_mutex mutex_;
    shared_ptr<const Snapshot> cached_;
};

}  // namespace registry

#endif  // INFRA_SCORE_REGISTRY_HPP_
