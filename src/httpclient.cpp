// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <httpclient.h>

#include <support/events.h>
#include <util.h>
#include <utilstrencodings.h>

#include <event2/buffer.h>
#include <event2/bufferevent.h>
#include <event2/bufferevent_ssl.h>
#include <event2/keyvalq_struct.h>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cassert>

namespace {

struct HTTPReply
{
    HTTPReply() : status(0), error(-1) {}

    int status;
    int error;
    std::string body;
    std::map<std::string, std::string> headers;
};

const char *http_errorstring(int code)
{
    switch(code) {
    case EVREQ_HTTP_TIMEOUT:
        return "timeout reached";
    case EVREQ_HTTP_EOF:
        return "EOF reached";
    case EVREQ_HTTP_INVALID_HEADER:
        return "error while reading header, or invalid header";
    case EVREQ_HTTP_BUFFER_ERROR:
        return "error encountered while reading or writing";
    case EVREQ_HTTP_REQUEST_CANCEL:
        return "request was canceled";
    case EVREQ_HTTP_DATA_TOO_LONG:
        return "response body is larger than allowed";
    default:
        return "unknown";
    }
}

void http_request_done(struct evhttp_request *req, void *ctx)
{
    HTTPReply *reply = static_cast<HTTPReply*>(ctx);

    if (req == nullptr) {
        /* If req is nullptr, it means an error occurred while connecting: the
         * error code will have been passed to http_error_cb.
         */
        reply->status = 0;
        return;
    }

    reply->status = evhttp_request_get_response_code(req);

    struct evkeyvalq* input_headers = evhttp_request_get_input_headers(req);
    if (input_headers) {
        for (struct evkeyval* header = input_headers->tqh_first; header != nullptr; header = header->next.tqe_next) {
            reply->headers[ToLower(header->key)] = header->value;
        }
    }

    struct evbuffer *buf = evhttp_request_get_input_buffer(req);
    if (buf)
    {
        size_t size = evbuffer_get_length(buf);
        const char *data = (const char*)evbuffer_pullup(buf, size);
        if (data)
            reply->body = std::string(data, size);
        evbuffer_drain(buf, size);
    }
}

void http_error_cb(enum evhttp_request_error err, void *ctx)
{
    HTTPReply *reply = static_cast<HTTPReply*>(ctx);
    reply->error = err;
}

bool IsRedirect(int status)
{
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

enum evhttp_cmd_type MethodToCommand(const std::string& method)
{
    if (method == "GET") return EVHTTP_REQ_GET;
    if (method == "POST") return EVHTTP_REQ_POST;
    if (method == "HEAD") return EVHTTP_REQ_HEAD;
    if (method == "PUT") return EVHTTP_REQ_PUT;
    if (method == "DELETE") return EVHTTP_REQ_DELETE;
    throw std::runtime_error("unsupported HTTP method " + method);
}

} // anonymous namespace

bool ParseURL(const std::string& url, URLParts& parts)
{
    raii_evhttp_uri uri(evhttp_uri_parse(url.c_str()));
    if (!uri) {
        return false;
    }
    const char* scheme = evhttp_uri_get_scheme(uri.get());
    const char* host = evhttp_uri_get_host(uri.get());
    if (!scheme || !host || *host == '\0') {
        return false;
    }
    parts.scheme = ToLower(scheme);
    if (parts.scheme != "http" && parts.scheme != "https") {
        return false;
    }
    parts.host = host;
    parts.port = evhttp_uri_get_port(uri.get());
    if (parts.port < 0) {
        parts.port = parts.scheme == "https" ? 443 : 80;
    }
    const char* path = evhttp_uri_get_path(uri.get());
    parts.target = (path && *path) ? path : "/";
    const char* query = evhttp_uri_get_query(uri.get());
    if (query && *query) {
        parts.target += "?";
        parts.target += query;
    }
    return true;
}

std::string URLParts::Authority() const
{
    bool defaultPort = (scheme == "https" && port == 443) || (scheme == "http" && port == 80);
    if (defaultPort || port < 0) {
        return host;
    }
    return strprintf("%s:%d", host, port);
}

std::string ResolveURL(const std::string& base, const std::string& ref)
{
    URLParts refParts;
    if (ParseURL(ref, refParts)) {
        return ref;
    }
    URLParts baseParts;
    if (!ParseURL(base, baseParts)) {
        return ref;
    }
    std::string origin = baseParts.scheme + "://" + baseParts.Authority();
    if (!ref.empty() && ref[0] == '/') {
        return origin + ref;
    }
    std::string dir = baseParts.target.substr(0, baseParts.target.find('?'));
    dir = dir.substr(0, dir.rfind('/') + 1);
    return origin + dir + ref;
}

EventHTTPClient::EventHTTPClient(int timeoutSeconds, int maxRedirects)
    : timeout_(timeoutSeconds)
    , maxRedirects_(maxRedirects)
    , sslCtx_(SSL_CTX_new(TLS_client_method()))
{
    if (!sslCtx_) {
        throw std::runtime_error("EventHTTPClient: cannot create TLS context");
    }
    SSL_CTX_set_verify(sslCtx_, SSL_VERIFY_PEER, nullptr);
    if (SSL_CTX_set_default_verify_paths(sslCtx_) != 1) {
        LogPrintf("EventHTTPClient: could not load default CA certificates\n");
    }
}

EventHTTPClient::~EventHTTPClient()
{
    SSL_CTX_free(sslCtx_);
}

HTTPClientResponse EventHTTPClient::Perform(const HTTPClientRequest& request)
{
    HTTPClientRequest current = request;
    for (int redirects = 0; ; ++redirects) {
        HTTPClientResponse response = PerformOnce(current);
        if (!IsRedirect(response.status)) {
            return response;
        }
        auto location = response.headers.find("location");
        if (location == response.headers.end() || redirects >= maxRedirects_) {
            return response;
        }
        std::string next = ResolveURL(current.url, location->second);
        LogPrint(BCLog::HTTP, "HTTP client: %s redirected to %s\n", current.url, next);
        if (response.status == 303) {
            current.method = "GET";
            current.body.clear();
        }
        current.url = next;
    }
}

HTTPClientResponse EventHTTPClient::PerformOnce(const HTTPClientRequest& request)
{
    URLParts url;
    if (!ParseURL(request.url, url)) {
        throw CConnectionFailed("invalid URL " + request.url);
    }

    // Obtain event base
    raii_event_base base = obtain_event_base();

    // Synchronously look up hostname
    raii_evhttp_connection evcon;
    if (url.scheme == "https") {
        SSL* ssl = SSL_new(sslCtx_);
        if (!ssl) {
            throw CConnectionFailed("cannot create TLS session for " + url.host);
        }
        SSL_set_tlsext_host_name(ssl, url.host.c_str());
        SSL_set1_host(ssl, url.host.c_str());
        struct bufferevent* bev = bufferevent_openssl_socket_new(base.get(), -1, ssl,
            BUFFEREVENT_SSL_CONNECTING, BEV_OPT_CLOSE_ON_FREE | BEV_OPT_DEFER_CALLBACKS);
        if (!bev) {
            SSL_free(ssl);
            throw CConnectionFailed("cannot create TLS buffer event for " + url.host);
        }
        bufferevent_openssl_set_allow_dirty_shutdown(bev, 1);
        evcon.reset(evhttp_connection_base_bufferevent_new(base.get(), nullptr, bev, url.host.c_str(), url.port));
        if (!evcon) {
            bufferevent_free(bev);
            throw CConnectionFailed("create connection failed for " + url.host);
        }
    } else {
        evcon = obtain_evhttp_connection_base(base.get(), url.host, url.port);
    }
    evhttp_connection_set_timeout(evcon.get(), timeout_);

    HTTPReply response;
    raii_evhttp_request req = obtain_evhttp_request(http_request_done, (void*)&response);
    if (req == nullptr)
        throw std::runtime_error("create http request failed");
    evhttp_request_set_error_cb(req.get(), http_error_cb);

    struct evkeyvalq* output_headers = evhttp_request_get_output_headers(req.get());
    assert(output_headers);
    evhttp_add_header(output_headers, "Host", url.Authority().c_str());
    evhttp_add_header(output_headers, "Connection", "close");
    evhttp_add_header(output_headers, "User-Agent", "scverify");
    for (const auto& header : request.headers) {
        evhttp_add_header(output_headers, header.first.c_str(), header.second.c_str());
    }

    if (!request.body.empty()) {
        struct evbuffer* output_buffer = evhttp_request_get_output_buffer(req.get());
        assert(output_buffer);
        evbuffer_add(output_buffer, request.body.data(), request.body.size());
    }

    int r = evhttp_make_request(evcon.get(), req.get(), MethodToCommand(request.method), url.target.c_str());
    req.release(); // ownership moved to evcon in above call
    if (r != 0) {
        throw CConnectionFailed("send http request failed");
    }

    event_base_dispatch(base.get());

    if (response.status == 0) {
        std::string tlsError;
        unsigned long sslErr = ERR_get_error();
        if (sslErr != 0) {
            char buf[256];
            ERR_error_string_n(sslErr, buf, sizeof(buf));
            tlsError = std::string(", ") + buf;
        }
        throw CConnectionFailed(strprintf("couldn't connect to %s:%d (code %d - \"%s\"%s)",
            url.host, url.port, response.error, http_errorstring(response.error), tlsError));
    }

    LogPrint(BCLog::HTTP, "HTTP client: %s %s -> %d (%u bytes)\n", request.method, request.url, response.status, response.body.size());

    HTTPClientResponse result;
    result.status = response.status;
    result.body = std::move(response.body);
    result.headers = std::move(response.headers);
    return result;
}
