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

#include "overpass.hpp"
#include <chrono>                 // for milliseconds
#include <exception>              // for exception
#include <iostream>               // for basic_ostream, operator<<, cerr
#include <nlohmann/json.hpp>      // for basic_json
#include <sstream>                // for basic_ostringstream
#include <string>                 // for string
#include <thread>                 // for sleep_for
#include <utility>                // for move

using std::cerr;
using std::exception;
using std::ostringstream;
using std::string;
using std::chrono::milliseconds;
using std::this_thread::sleep_for;
using json = nlohmann::json;

using utils::HttpResponse;
using utils::isSuccess;
using utils::urlEncode;

namespace overpass {

void threadSleeper(milliseconds pause) {
    sleep_for(pause);
}

OverpassClient::OverpassClient(utils::IHttpClient& http, Options options, Sleeper sleeper)
    : http_(http), options_(std::move(options)), sleeper_(std::move(sleeper)) {}

// Runs an Overpass QL query, retrying exactly once after the configured pause
//
// Args:
//    ql: the Overpass QL query text
// Returns:
//    parsed JSON response
// Throws:
//    ServiceUnavailable when both attempts fail or the reply isn't JSON
json OverpassClient::query(const string& ql) {
    const string form = "data=" + urlEncode(ql);
    string body;
    string error;

    bool ok = attempt(form, &body, &error);
    if (!ok) {
        cerr << "[warn] Overpass request failed (" << error << "); retrying in "
             << options_.retryPause.count() << " ms\n";
        sleeper_(options_.retryPause);
        ok = attempt(form, &body, &error);
    }
    if (!ok) throw ServiceUnavailable("Overpass unavailable after retry: " + error);

    try {
        return json::parse(body);
    } catch (const json::parse_error& e) {
        throw ServiceUnavailable(string("Overpass returned malformed JSON: ") + e.what());
    }
}

// Single POST to the interpreter
//
// Args:
//    form: url-encoded form body
//    body: response body on success
//    error: failure description otherwise
// Returns:
//    true on a 2xx response
bool OverpassClient::attempt(const string& form, string* body, string* error) {
    HttpResponse resp;
    try {
        resp = http_.post(options_.url, form, "application/x-www-form-urlencoded",
                          options_.timeoutSeconds);
    } catch (const exception& e) {
        *error = e.what();
        return false;
    }
    if (!isSuccess(resp)) {
        ostringstream oss;
        oss << "HTTP " << resp.status;
        *error = oss.str();
        return false;
    }
    *body = std::move(resp.body);
    return true;
}

}  // namespace overpass
