// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCVERIFY_HTTPCLIENT_H
#define SCVERIFY_HTTPCLIENT_H

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

typedef struct ssl_ctx_st SSL_CTX;

static const int DEFAULT_HTTP_CLIENT_TIMEOUT = 60;
static const int DEFAULT_HTTP_CLIENT_MAX_REDIRECTS = 5;

/** No HTTP response could be obtained (DNS, connect, TLS or timeout failure) */
class CConnectionFailed : public std::runtime_error
{
public:
    explicit inline CConnectionFailed(const std::string& msg) :
        std::runtime_error(msg)
    {}
};

struct HTTPClientRequest
{
    std::string method;
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    HTTPClientRequest() : method("GET") {}
    HTTPClientRequest(const std::string& methodIn, const std::string& urlIn)
        : method(methodIn), url(urlIn) {}
};

struct HTTPClientResponse
{
    int status;
    std::string body;
    //! header names are lower-cased
    std::map<std::string, std::string> headers;

    HTTPClientResponse() : status(0) {}

    bool IsSuccess() const { return status >= 200 && status < 300; }
};

/** Components of an absolute http(s) URL */
struct URLParts
{
    std::string scheme;
    std::string host;
    int port;
    //! path including query string, always starting with '/'
    std::string target;

    URLParts() : port(-1) {}

    /** host, with the port appended when it is not the scheme's default */
    std::string Authority() const;
};

/**
 * Split an absolute URL into its components.
 * @return false if the URL is not an absolute http or https URL
 */
bool ParseURL(const std::string& url, URLParts& parts);

/**
 * Resolve a possibly relative reference against a base URL: absolute URLs are
 * returned unchanged, "/x" replaces the path, anything else replaces the last
 * path segment of the base.
 */
std::string ResolveURL(const std::string& base, const std::string& ref);

/**
 * Blocking HTTP client capability. Implementations must be safe to call from
 * several threads at once.
 */
class HTTPClient
{
public:
    virtual ~HTTPClient() {}

    /**
     * Perform a request and return whatever status the server answered with.
     * @throws CConnectionFailed if no response was received at all
     */
    virtual HTTPClientResponse Perform(const HTTPClientRequest& request) = 0;
};

/**
 * HTTPClient over libevent's evhttp, one event base per request. https URLs
 * go through an OpenSSL bufferevent with peer and host name verification.
 * Redirects (301, 302, 303, 307, 308) are followed up to a limit.
 */
class EventHTTPClient : public HTTPClient
{
public:
    explicit EventHTTPClient(int timeoutSeconds = DEFAULT_HTTP_CLIENT_TIMEOUT,
                             int maxRedirects = DEFAULT_HTTP_CLIENT_MAX_REDIRECTS);
    ~EventHTTPClient();

    HTTPClientResponse Perform(const HTTPClientRequest& request) override;

private:
    HTTPClientResponse PerformOnce(const HTTPClientRequest& request);

    int timeout_;
    int maxRedirects_;
    SSL_CTX* sslCtx_;
};

#endif // SCVERIFY_HTTPCLIENT_H
