#pragma once
#include <string>
#include <utility>
#include <vector>

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    HeaderList headers;
    std::string body;
    long timeout_ms = 15000;
};

struct HttpResponse {
    long status = 0;
    std::string content_type;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
    bool is_json() const;
};

struct UrlParts {
    std::string origin;   // scheme://host[:port]
    std::string path;     // always starts with '/'
    std::string query;    // without '?'
};

UrlParts split_url(const std::string& url);

// Percent-encodes a query parameter value
std::string url_encode(const std::string& s);

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Throws TransportError when no HTTP response was received.
    // Any status code (including 4xx/5xx) is returned, not thrown.
    virtual HttpResponse send(const HttpRequest& req) = 0;
};

class CurlHttpClient : public IHttpClient {
public:
    CurlHttpClient();

    HttpResponse send(const HttpRequest& req) override;
};
