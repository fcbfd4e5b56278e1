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
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "../infra_score/overpass.hpp"
#include "fake_http_client.hpp"

using std::string;
using std::vector;
using std::chrono::milliseconds;
using json = nlohmann::json;

using utils::urlEncode;

using overpass::OverpassClient;
using overpass::ServiceUnavailable;

// Sleeper that records pauses instead of sleeping
struct RecordingSleeper {
    vector<milliseconds>* pauses;
    void operator()(milliseconds pause) const { pauses->push_back(pause); }
};

static OverpassClient makeClient(FakeHttpClient& http, vector<milliseconds>* pauses) {
    OverpassClient::Options options;
    options.url = "http://overpass.test/api/interpreter";
    return OverpassClient(http, options, RecordingSleeper{pauses});
}

// -----------------------------------------------------------------------------
// Tests for urlEncode
// -----------------------------------------------------------------------------

TEST_CASE("urlEncode encodes spaces and reserved characters") {
    CHECK_EQ(urlEncode("hello world"), "hello%20world");
    CHECK_EQ(urlEncode("a&b=c"), "a%26b%3Dc");
}

TEST_CASE("urlEncode leaves safe characters unchanged") {
    CHECK_EQ(urlEncode("abc123"), "abc123");
    CHECK_EQ(urlEncode(""), "");
}

// -----------------------------------------------------------------------------
// Tests for OverpassClient::query
// -----------------------------------------------------------------------------

TEST_CASE("query posts the encoded QL as a form and parses the reply") {
    FakeHttpClient http;
    http.next = {200, R"({"elements": [{"type": "node", "id": 1}]})"};
    vector<milliseconds> pauses;
    auto client = makeClient(http, &pauses);

    json reply = client.query("node(1,2,3,4)[amenity=school]; out body;");

    REQUIRE_EQ(http.requests.size(), 1);
    CHECK_EQ(http.requests[0].method, "POST");
    CHECK_EQ(http.requests[0].url, "http://overpass.test/api/interpreter");
    CHECK_EQ(http.requests[0].contentType, "application/x-www-form-urlencoded");
    CHECK_EQ(http.requests[0].body,
             "data=" + urlEncode("node(1,2,3,4)[amenity=school]; out body;"));
    CHECK_EQ(http.requests[0].timeoutSeconds, OVERPASS_TIMEOUT_SECONDS);
    CHECK_EQ(reply["elements"].size(), 1);
    CHECK(pauses.empty());
}

TEST_CASE("query retries once after a pause when the first attempt fails") {
    FakeHttpClient http;
    http.queued.push_back({504, "Gateway Timeout"});
    http.next = {200, R"({"elements": []})"};
    vector<milliseconds> pauses;
    auto client = makeClient(http, &pauses);

    json reply = client.query("way[highway]; out geom;");

    CHECK_EQ(http.requests.size(), 2);
    REQUIRE_EQ(pauses.size(), 1);
    CHECK_EQ(pauses[0], milliseconds(OVERPASS_RETRY_PAUSE_MS));
    CHECK(reply["elements"].empty());
}

TEST_CASE("query raises ServiceUnavailable after two failed attempts") {
    FakeHttpClient http;
    http.next = {429, "Too Many Requests"};
    vector<milliseconds> pauses;
    auto client = makeClient(http, &pauses);

    CHECK_THROWS_AS(client.query("way[building]; out geom;"), ServiceUnavailable);
    CHECK_EQ(http.requests.size(), 2);
    CHECK_EQ(pauses.size(), 1);
}

TEST_CASE("query treats transport errors as failed attempts") {
    FakeHttpClient http;
    http.failWith = "CURL error: Couldn't resolve host name";
    vector<milliseconds> pauses;
    auto client = makeClient(http, &pauses);

    CHECK_THROWS_AS(client.query("way[building]; out geom;"), ServiceUnavailable);
    CHECK_EQ(http.requests.size(), 2);
}

TEST_CASE("query raises ServiceUnavailable on a malformed body without retrying") {
    FakeHttpClient http;
    http.next = {200, "<html>rate limited</html>"};
    vector<milliseconds> pauses;
    auto client = makeClient(http, &pauses);

    CHECK_THROWS_AS(client.query("way[building]; out geom;"), ServiceUnavailable);
    CHECK_EQ(http.requests.size(), 1);
    CHECK(pauses.empty());
}
