#include <regex>
#include <sstream>

#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

#include "http_client.hpp"
#include "sfrest_tracing.hpp"

using namespace duckdb;

namespace sfrest
{

HttpUrl::HttpUrl(const std::string& url) {
    ParseUrl(url);
}

void HttpUrl::ParseUrl(const std::string& url) {
    const static std::regex re(R"(^(?:(https?):)?(?://(?:[^@/?#]*@)?([^:/?#]+)(?::(\d+))?)?([^?#]*)(\?[^#]*)?(#.*)?)");
    std::smatch m;
    if (!std::regex_match(url, m, re)) {
        throw InvalidInputException("Invalid URL, cannot be parsed: '%s'", url);
    }

    scheme = m[1].str();
    host = m[2].str();
    port = m[3].str();
    path = m[4].str();
    query = m[5].str();
}

std::string HttpUrl::ToSchemeHostAndPort() const {
    std::ostringstream ss;
    ss << scheme << "://" << host;
    if (!port.empty()) {
        ss << ":" << port;
    }
    return ss.str();
}

std::string HttpUrl::ToPathQuery() const {
    std::ostringstream ss;
    ss << (path.empty() ? "/" : path) << query;
    return ss.str();
}

std::string HttpUrl::ToString() const {
    std::ostringstream ss;
    ss << ToSchemeHostAndPort() << ToPathQuery();
    return ss.str();
}

HttpUrl::operator std::string() const {
    return ToString();
}

std::string HttpUrl::Scheme() const { return scheme; }
std::string HttpUrl::Host() const { return host; }
std::string HttpUrl::Port() const { return port; }
std::string HttpUrl::Path() const { return path; }
std::string HttpUrl::Query() const { return query; }

// ----------------------------------------------------------------------

HttpParams::HttpParams()
    : timeout(DEFAULT_TIMEOUT),
      keep_alive(DEFAULT_KEEP_ALIVE),
      url_encode(DEFAULT_URL_ENCODE)
{
}

// ----------------------------------------------------------------------

HttpAuthType HttpAuthParams::AuthType() const
{
    if (bearer_token.has_value()) {
        return HttpAuthType::BEARER;
    }
    return HttpAuthType::NONE;
}

std::string HttpAuthParams::CredsToStars(const std::string &creds) const
{
    return std::string(creds.size(), '*');
}

std::string HttpAuthParams::ToString() const
{
    if (bearer_token.has_value()) {
        return "Bearer:" + CredsToStars(bearer_token.value());
    }
    return "None";
}

// ----------------------------------------------------------------------

HttpMethod HttpMethod::FromString(const std::string &method)
{
    auto upper_method = duckdb::StringUtil::Upper(method);
    for (auto candidate : {GET, POST, PUT, _DELETE, PATCH, HEAD}) {
        if (HttpMethod(candidate).ToString() == upper_method) {
            return HttpMethod(candidate);
        }
    }

    // Callers decide whether an unknown verb is an error
    SFREST_TRACE_DEBUG("HTTP_METHOD", "Unknown HTTP method: '" + method + "'");
    return HttpMethod(UNDEFINED);
}

std::string HttpMethod::ToString() const
{
    switch (variant)
    {
    case GET:
        return "GET";
    case POST:
        return "POST";
    case PUT:
        return "PUT";
    case _DELETE:
        return "DELETE";
    case PATCH:
        return "PATCH";
    case HEAD:
        return "HEAD";
    default:
        return "UNDEFINED";
    }
}

// ----------------------------------------------------------------------

HttpRequest::HttpRequest(HttpMethod method, const std::string &url, std::string content_type, std::string content)
    : method(method), url(HttpUrl(url)), content_type(std::move(content_type)), content(std::move(content))
{ }

HttpRequest::HttpRequest(HttpMethod method, const std::string &url)
    : HttpRequest(method, url, std::string("application/json"), std::string())
{ }

void HttpRequest::AuthHeadersFromParams(const HttpAuthParams &auth_params)
{
    if (auth_params.AuthType() == HttpAuthType::BEARER) {
        headers["Authorization"] = "Bearer " + auth_params.bearer_token.value();
    }
}

httplib::Headers HttpRequest::HttplibHeaders() const
{
    httplib::Headers ret;
    for (const auto &header : headers)
    {
        ret.emplace(header.first, header.second);
    }
    return ret;
}

httplib::Result HttpRequest::Execute(httplib::Client &client) const
{
    auto path_str = url.ToPathQuery();
    auto headers = HttplibHeaders();

    SFREST_TRACE_INFO("HTTP_REQUEST", "Executing " + method.ToString() + " request to: " + path_str);
    if (!content.empty()) {
        SFREST_TRACE_DEBUG("HTTP_REQUEST", "Request content (" + std::to_string(content.length()) + " bytes), Content-Type: " + content_type);
    }

    httplib::Result result;
    switch (method.Variant()) {
    case HttpMethod::GET:
        result = client.Get(path_str, headers);
        break;
    case HttpMethod::POST:
        result = client.Post(path_str, headers, content, content_type);
        break;
    case HttpMethod::PATCH:
        result = client.Patch(path_str, headers, content, content_type);
        break;
    case HttpMethod::_DELETE:
        result = client.Delete(path_str, headers);
        break;
    default:
        throw InvalidInputException("HTTP method '%s' cannot be sent", method.ToString());
    }

    if (result) {
        SFREST_TRACE_INFO("HTTP_RESPONSE", "Response status: " + std::to_string(result->status));
        if (result->body.length() > 1000) {
            SFREST_TRACE_TRACE("HTTP_RESPONSE", "Response body (truncated): " + result->body.substr(0, 1000) + "...");
        } else if (!result->body.empty()) {
            SFREST_TRACE_TRACE("HTTP_RESPONSE", "Response body: " + result->body);
        }
    } else {
        SFREST_TRACE_ERROR("HTTP_RESPONSE", "Request failed: " + httplib::to_string(result.error()));
    }

    return result;
}

// ----------------------------------------------------------------------

HttpResponse::HttpResponse(HttpMethod method, HttpUrl url, int code, std::string content_type, std::string content)
    : method(method), url(std::move(url)), code(code), content_type(std::move(content_type)), content(std::move(content))
{ }

HttpResponse::HttpResponse(HttpMethod method, HttpUrl url, int code)
    : HttpResponse(method, std::move(url), code, std::string(), std::string())
{ }

std::unique_ptr<HttpResponse> HttpResponse::FromHttpLibResponse(const HttpMethod &method,
                                                                const HttpUrl &url,
                                                                const httplib::Response &response)
{
    return std::make_unique<HttpResponse>(method, url, response.status,
                                          response.get_header_value("Content-Type"), response.body);
}

int HttpResponse::Code() const {
    return code;
}

bool HttpResponse::IsSuccess() const {
    return code >= 200 && code < 300;
}

std::string HttpResponse::Content() const {
    return content;
}

// ----------------------------------------------------------------------

HttpClient::HttpClient(const HttpParams &http_params)
    : http_params(http_params)
{ }

HttpClient::HttpClient()
    : HttpClient(HttpParams())
{ }

const HttpParams &HttpClient::Params() const
{
    return http_params;
}

std::unique_ptr<HttpResponse> HttpClient::SendRequest(HttpRequest &request)
{
    auto client = CreateHttplibClient(http_params, request.url.ToSchemeHostAndPort());
    auto res = request.Execute(*client);

    if (!res) {
        throw IOException("%s error for HTTP %s to '%s'", httplib::to_string(res.error()),
                          request.method.ToString(), request.url.ToString());
    }

    return HttpResponse::FromHttpLibResponse(request.method, request.url, res.value());
}

std::unique_ptr<httplib::Client> HttpClient::CreateHttplibClient(const HttpParams &http_params,
                                                                 const std::string &scheme_host_and_port)
{
    auto timeout = std::chrono::milliseconds(http_params.timeout);

    auto c = std::make_unique<httplib::Client>(scheme_host_and_port);
    c->set_follow_location(true);
	c->set_keep_alive(http_params.keep_alive);
	c->set_url_encode(http_params.url_encode);
	c->set_write_timeout(timeout);
	c->set_read_timeout(timeout);
	c->set_connection_timeout(timeout);
	c->set_decompress(true);
	return c;
}

} // namespace sfrest
