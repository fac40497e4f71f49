#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "duckdb.hpp"
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <httplib.h>

namespace sfrest
{

using HeaderMap = duckdb::case_insensitive_map_t<std::string>;
class HttpClient; // forward declaration

// ----------------------------------------------------------------------

class HttpUrl {
public:
    // Fragments are not kept; a request never sends them.
    HttpUrl(const std::string& url);
    void ParseUrl(const std::string& url);
    std::string ToSchemeHostAndPort() const;
    std::string ToPathQuery() const;
    std::string ToString() const;
    operator std::string() const;

    std::string Scheme() const;
    std::string Host() const;
    std::string Port() const;
    std::string Path() const;
    std::string Query() const;

private:
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
};

// ----------------------------------------------------------------------

struct HttpParams {

	static constexpr uint64_t DEFAULT_TIMEOUT = 30000; // 30 sec
	static constexpr bool DEFAULT_KEEP_ALIVE = true;
	static constexpr bool DEFAULT_URL_ENCODE = false;

    HttpParams();

	uint64_t timeout;
	bool keep_alive;
	bool url_encode;
};

// ----------------------------------------------------------------------

enum class HttpAuthType {
    NONE,
    BEARER
};

class HttpAuthParams
{
public:
    HttpAuthParams() = default;

    std::optional<std::string> bearer_token = std::nullopt;

    HttpAuthType AuthType() const;
    std::string ToString() const;

private:
    std::string CredsToStars(const std::string &creds) const;
};

// ----------------------------------------------------------------------

class HttpMethod
{
public:
    enum Variants : uint8_t
    {
        UNDEFINED,
        GET,
        POST,
        PUT,
        _DELETE,
        PATCH,
        HEAD
    };

    HttpMethod() = default;
    constexpr HttpMethod(Variants ret_type) : variant(ret_type) { }
    constexpr bool operator==(HttpMethod a) const { return variant == a.variant; }
    constexpr bool operator!=(HttpMethod a) const { return variant != a.variant; }

    constexpr Variants Variant() const { return variant; }
    constexpr bool IsUndefined() const { return variant == UNDEFINED; }
    constexpr bool HasBody() const { return variant == POST || variant == PUT || variant == PATCH; }

    static HttpMethod FromString(const std::string &method);
    std::string ToString() const;

private:
    Variants variant = UNDEFINED;
};

// ----------------------------------------------------------------------

class HttpRequest
{
friend class HttpClient;

public:
    HttpRequest(HttpMethod method, const std::string &url, std::string content_type, std::string content);
    HttpRequest(HttpMethod method, const std::string &url);

    void AuthHeadersFromParams(const HttpAuthParams &auth_params);

public:
    HttpMethod method;
    HttpUrl url;

    HeaderMap headers;
    std::string content_type;
    std::string content;

private:
    httplib::Headers HttplibHeaders() const;
    httplib::Result Execute(httplib::Client &client) const;
};

// ----------------------------------------------------------------------

class HttpResponse
{
friend class HttpClient;

public:
    HttpResponse(HttpMethod method, HttpUrl url, int code, std::string content_type, std::string content);
    HttpResponse(HttpMethod method, HttpUrl url, int code);

    int Code() const;
    bool IsSuccess() const;
    std::string Content() const;

public:
    HttpMethod method;
    HttpUrl url;

    int code;
    std::string content_type;
    std::string content;

private:
    static std::unique_ptr<HttpResponse> FromHttpLibResponse(const HttpMethod &method,
                                                             const HttpUrl &url,
                                                             const httplib::Response &response);
};

// ----------------------------------------------------------------------

class HttpClient
{
public:
    HttpClient();
    HttpClient(const HttpParams &http_params);
    virtual ~HttpClient() = default;

public:
    // Executes the request once; every HTTP status is handed back to the caller.
    // Transport failures (connect, timeout, TLS) throw duckdb::IOException.
    virtual std::unique_ptr<HttpResponse> SendRequest(HttpRequest &request);

    const HttpParams &Params() const;

private:
    HttpParams http_params;

private:
    std::unique_ptr<httplib::Client> CreateHttplibClient(const HttpParams &http_params,
                                                         const std::string &scheme_host_and_port);
};

} // namespace sfrest
