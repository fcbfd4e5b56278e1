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
#ifndef INFRA_SCORE_OVERPASS_HPP_
#define INFRA_SCORE_OVERPASS_HPP_

#include <nlohmann/json_fwd.hpp>  // for json
#include <chrono>                 // for milliseconds
#include <functional>             // for function
#include <stdexcept>              // for runtime_error
#include <string>                 // for string
#include "main.h"
#include "utils.hpp"

using std::string;
using std::runtime_error;
using json = nlohmann::json;

namespace overpass {

// raised once the feature-query service has failed its retry
class ServiceUnavailable : public runtime_error {
 public:
    using runtime_error::runtime_error;
};

// Source of raw map features for an Overpass QL query
struct FeatureQueryService {
    virtual ~FeatureQueryService() = default;
    virtual json query(const string& ql) = 0;
};

typedef std::function<void(std::chrono::milliseconds)> Sleeper;

void threadSleeper(std::chrono::milliseconds pause);

// Overpass interpreter client: one retry after a fixed pause
class OverpassClient : public FeatureQueryService {
 public:
    struct Options {
        string url;
        long timeoutSeconds;
        std::chrono::milliseconds retryPause;

        Options()
            : url(OVERPASS_URL),
              timeoutSeconds(OVERPASS_TIMEOUT_SECONDS),
              retryPause(OVERPASS_RETRY_PAUSE_MS) {}
    };

    explicit OverpassClient(utils::IHttpClient& http, Options options = Options(),
                            Sleeper sleeper = threadSleeper);

    json query(const string& ql) override;

 private:
    utils::IHttpClient& http_;
    Options options_;
    Sleeper sleeper_;

    bool attempt(const string& form, string* body, string* error);
};

}  // namespace overpass

#endif  // INFRA_SCORE_OVERPASS_HPP_
