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
#ifndef INFRA_SCORE_UTILS_HPP_
#define INFRA_SCORE_UTILS_HPP_

#include <curl/curl.h>  // for curl_easy_setopt, curl_easy_cleanup
#include <cstdint>      // for uint16_t
#include <stdexcept>    // for runtime_error
#include <string>       // for string
#include <utility>      // for move

using std::string;
using std::runtime_error;

namespace utils {

struct HttpResponse {
    uint16_t status = 0;
    string body;
};

struct IHttpClient {
    virtual ~IHttpClient() = default;
    virtual HttpResponse post(const string& url, const string& body,
                              const string& contentType, long timeoutSeconds) = 0;
};

// Returns true for a 2xx status
inline bool isSuccess(const HttpResponse& resp) {
    return resp.status >= 200 && resp.status < 300;
}

// Returns url-encoded form of the given string
//
// Args:
//     value: the string to encode
// Returns:
//    the encoded string, or the input unchanged if libcurl can't encode it
inline string urlEncode(const string& value) {
    char* out = curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size()));
    if (!out) return value;
    string encoded(out);
    curl_free(out);
    return encoded;
}

class CurlHttpClient : public IHttpClient {
 public:
    // Constructor initializes libcurl
    //
    // Args:
    //    userAgent: value sent in the User-Agent header
    explicit CurlHttpClient(string userAgent) : userAgent_(std::move(userAgent)) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    // Destructor cleans up libcurl resources
    ~CurlHttpClient() override {
        curl_global_cleanup();
    }

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    // Performs an HTTP POST request with the given body
    //
    // Args:
    //    url: the URL to post to
    //    body: request payload
    //    contentType: value of the Content-Type header
    //    timeoutSeconds: whole-transfer timeout, 0 for none
    // Returns:
    //    HttpResponse containing the status code and response body
    HttpResponse post(const string& url, const string& body,
                      const string& contentType, long timeoutSeconds) override {
        CURL* curl = curl_easy_init();
        if (!curl) throw runtime_error("curl_easy_init failed");

        const string header = "Content-Type: " + contentType;
        curl_slist* headers = curl_slist_append(nullptr, header.c_str());

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds);
        return perform(curl, headers);
    }

 private:
    string userAgent_;

    // Runs a prepared easy handle and releases it
    HttpResponse perform(CURL* curl, curl_slist* headers) {
        HttpResponse resp;
        string buffer;

        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent_.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);

        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            curl_easy_cleanup(curl);
            curl_slist_free_all(headers);
            throw runtime_error(string("CURL error: ") + curl_easy_strerror(res));
        }

        long code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_cleanup(curl);
        curl_slist_free_all(headers);

        resp.status = static_cast<uint16_t>(code);
        resp.body = std::move(buffer);
        return resp;
    }

    // Callback function for libcurl to write response data into a string
    //
    // Args:
    //    contents: pointer to the data received from the server
    //    size: size of each data element
    //    nmemb: number of data elements
    //    userData: pointer to user-defined data (in this case, a string to append to)
    // Returns:
    //    total size of the data (size of each data element * number of data elements)
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userData) {
        size_t total = size * nmemb;
        auto* out = static_cast<string*>(userData);
        out->append(static_cast<char*>(contents), total);
        return total;
    }
};

}  // namespace utils

#endif  // INFRA_SCORE_UTILS_HPP_
