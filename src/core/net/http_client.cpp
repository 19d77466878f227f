/**
 * @file http_client.cpp
 */

#include "core/net/http_client.h"
#include "core/errors.h"
#include <curl/curl.h>
#include <cstdlib>
#include <mutex>
#include <sstream>

namespace tradebot::nethttp {

namespace {

size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

void ensure_curl_global() {
    static std::once_flag once;
    std::call_once(once, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        std::atexit([]() { curl_global_cleanup(); });
    });
}

} // namespace

HttpClient::HttpClient(HttpClientOptions options) : options_(std::move(options)) {}

HttpResponse HttpClient::request(const std::string& method,
                                 const std::string& url,
                                 const std::vector<Header>& headers,
                                 const std::string& body) const {
    ensure_curl_global();
    CURL* curl = curl_easy_init();
    if (!curl) throw TransportError("curl_easy_init failed");

    HttpResponse response;
    struct curl_slist* hdrs = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name + ": " + h.value;
        hdrs = curl_slist_append(hdrs, line.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hdrs);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, ""); // allow compressed
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (options_.connect_timeout_ms > 0) {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, options_.connect_timeout_ms);
    }
    if (options_.timeout_ms > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, options_.timeout_ms);
    }

    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    } else if (method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    CURLcode rc = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    if (hdrs) curl_slist_free_all(hdrs);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK) {
        std::ostringstream oss; oss << "curl error on " << method << " " << url.substr(0, url.find('?')) << ": " << curl_easy_strerror(rc);
        throw TransportError(oss.str());
    }
    return response;
}

} // namespace tradebot::nethttp
