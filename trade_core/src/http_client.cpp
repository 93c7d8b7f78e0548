#include "http_client.hpp"
#include "trade_errors.hpp"

#include <curl/curl.h>

#include <cctype>
#include <cstdio>
#include <mutex>

static std::string to_lower_copy(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool HttpResponse::is_json() const {
    return to_lower_copy(content_type).find("application/json") != std::string::npos;
}

UrlParts split_url(const std::string& url) {
    UrlParts p;
    std::string rest = url;

    const auto scheme = url.find("://");
    if (scheme != std::string::npos) {
        const auto path_start = url.find('/', scheme + 3);
        if (path_start == std::string::npos) {
            p.origin = url;
            rest.clear();
        } else {
            p.origin = url.substr(0, path_start);
            rest = url.substr(path_start);
        }
    }

    const auto q = rest.find('?');
    if (q != std::string::npos) {
        p.query = rest.substr(q + 1);
        rest = rest.substr(0, q);
    }
    p.path = rest.empty() ? "/" : rest;
    return p;
}

std::string url_encode(const std::string& s) {
    std::string out;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* s = static_cast<std::string*>(userdata);
    s->append(ptr, size * nmemb);
    return size * nmemb;
}

static std::once_flag g_curl_init;

CurlHttpClient::CurlHttpClient() {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlHttpClient::send(const HttpRequest& req) {
    CURL* curl = curl_easy_init();
    if (!curl) throw TransportError("curl init failed");

    struct curl_slist* headers = nullptr;
    for (const auto& h : req.headers) {
        headers = curl_slist_append(headers, (h.first + ": " + h.second).c_str());
    }
    headers = curl_slist_append(headers, "Accept: application/json");
    if (!req.body.empty()) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
    }

    std::string resp;
    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    if (req.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, req.method.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, req.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body.size()));
    }

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, req.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // TLS verify ON
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    CURLcode rc = curl_easy_perform(curl);

    HttpResponse out;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);
    char* ct = nullptr;
    curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &ct);
    if (ct) out.content_type = ct;

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK) {
        throw TransportError(std::string("curl perform failed: ") + curl_easy_strerror(rc));
    }
    out.body = std::move(resp);
    return out;
}
