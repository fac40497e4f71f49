#include "salesforce_authenticator.hpp"
#include "salesforce_exceptions.hpp"
#include "sfrest_tracing.hpp"

#include "duckdb/common/error_data.hpp"
#include "duckdb/common/string_util.hpp"
#include <yyjson.h>
#include <sstream>

namespace sfrest {

HttpParams SalesforceConnectionParams::ToHttpParams() const {
    HttpParams http_params;
    http_params.timeout = timeout_ms;
    return http_params;
}

std::string SalesforceConnectionParams::ToString() const {
    std::ostringstream ss;
    ss << "auth_url=" << auth_url
       << ", username=" << username
       << ", client_id=" << client_id
       << ", grant_type=" << grant_type
       << ", api_version=" << SalesforceUrlBuilder::FormatApiVersion(api_version)
       << ", timeout_ms=" << timeout_ms;
    return ss.str();
}

HttpAuthParams SalesforceSession::AuthParams() const {
    HttpAuthParams auth_params;
    if (authenticated) {
        auth_params.bearer_token = access_token;
    }
    return auth_params;
}

// ----------------------------------------------------------------------

SalesforceAuthenticator::SalesforceAuthenticator(std::shared_ptr<HttpClient> http_client, SalesforceConnectionParams params)
    : http_client(std::move(http_client)), params(std::move(params)) {
}

bool SalesforceAuthenticator::IsAuthenticated() const {
    return session.authenticated;
}

const SalesforceSession &SalesforceAuthenticator::Session() const {
    return session;
}

const SalesforceConnectionParams &SalesforceAuthenticator::Params() const {
    return params;
}

void SalesforceAuthenticator::EnsureAuthenticated() {
    if (session.authenticated) {
        return;
    }

    SFREST_TRACE_INFO("SF_AUTH", "Authenticating against: " + params.auth_url);
    SFREST_TRACE_DEBUG("SF_AUTH", "Connection parameters: " + params.ToString());

    HttpRequest request(HttpMethod::POST, params.auth_url, "application/x-www-form-urlencoded",
                        BuildPasswordGrantBody(params));
    request.headers["Accept"] = "application/json";

    std::unique_ptr<HttpResponse> response;
    try {
        response = http_client->SendRequest(request);
    } catch (const duckdb::IOException &e) {
        SFREST_TRACE_ERROR("SF_AUTH", "Token endpoint unreachable: " + duckdb::ErrorData(e).RawMessage());
        throw SalesforceAuthenticationException(duckdb::ErrorData(e).RawMessage());
    }

    if (!response) {
        throw SalesforceAuthenticationException("No response received from token endpoint");
    }

    if (!response->IsSuccess()) {
        SFREST_TRACE_ERROR("SF_AUTH", "Token endpoint returned HTTP " + std::to_string(response->Code()));
        throw SalesforceAuthenticationException("token endpoint returned HTTP " + std::to_string(response->Code()) +
                                                ": " + response->Content());
    }

    session = ParseTokenResponse(response->Content());

    SFREST_TRACE_INFO("SF_AUTH", "Authenticated, instance: " + session.instance_url +
                      ", token: " + session.AuthParams().ToString());
}

std::string SalesforceAuthenticator::BuildPasswordGrantBody(const SalesforceConnectionParams &params) {
    std::ostringstream post_data;

    post_data << "grant_type=" << duckdb::StringUtil::URLEncode(params.grant_type)
              << "&username=" << duckdb::StringUtil::URLEncode(params.username)
              << "&password=" << duckdb::StringUtil::URLEncode(params.password)
              << "&client_id=" << duckdb::StringUtil::URLEncode(params.client_id)
              << "&client_secret=" << duckdb::StringUtil::URLEncode(params.client_secret);

    return post_data.str();
}

SalesforceSession SalesforceAuthenticator::ParseTokenResponse(const std::string &content) {
    auto doc = std::shared_ptr<yyjson_doc>(yyjson_read(content.c_str(), content.size(), 0), yyjson_doc_free);
    if (!doc) {
        throw SalesforceAuthenticationException("token response is not valid JSON");
    }

    auto root = yyjson_doc_get_root(doc.get());
    if (!root || !yyjson_is_obj(root)) {
        throw SalesforceAuthenticationException("token response root is not a JSON object");
    }

    auto instance_url_val = yyjson_obj_get(root, "instance_url");
    if (!instance_url_val || !yyjson_is_str(instance_url_val)) {
        throw SalesforceAuthenticationException("missing or invalid instance_url in token response");
    }

    auto access_token_val = yyjson_obj_get(root, "access_token");
    if (!access_token_val || !yyjson_is_str(access_token_val)) {
        throw SalesforceAuthenticationException("missing or invalid access_token in token response");
    }

    SalesforceSession session;
    session.instance_url = yyjson_get_str(instance_url_val);
    session.access_token = yyjson_get_str(access_token_val);
    session.authenticated = true;

    if (!session.instance_url.empty() && session.instance_url.back() == '/') {
        session.instance_url.pop_back();
    }

    return session;
}

} // namespace sfrest
