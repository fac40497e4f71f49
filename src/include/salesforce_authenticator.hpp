#pragma once

#include "http_client.hpp"
#include "salesforce_url_builder.hpp"

#include <memory>
#include <string>

namespace sfrest {

// Connection configuration for the username/password OAuth flow
struct SalesforceConnectionParams {
    std::string auth_url = SalesforceUrlBuilder::DEFAULT_AUTH_URL;
    std::string username;
    std::string password;
    std::string client_id;
    std::string client_secret;
    std::string grant_type = "password";
    double api_version = SalesforceUrlBuilder::DEFAULT_API_VERSION;
    uint64_t timeout_ms = HttpParams::DEFAULT_TIMEOUT;

    HttpParams ToHttpParams() const;
    std::string ToString() const;
};

// Populated once by the authenticator, never refreshed.
struct SalesforceSession {
    std::string instance_url;
    std::string access_token;
    bool authenticated = false;

    HttpAuthParams AuthParams() const;
};

class SalesforceAuthenticator {
public:
    SalesforceAuthenticator(std::shared_ptr<HttpClient> http_client, SalesforceConnectionParams params);

    // Performs the password grant on first use; no-op once authenticated.
    void EnsureAuthenticated();

    bool IsAuthenticated() const;
    const SalesforceSession &Session() const;
    const SalesforceConnectionParams &Params() const;

    static std::string BuildPasswordGrantBody(const SalesforceConnectionParams &params);
    static SalesforceSession ParseTokenResponse(const std::string &content);

private:
    std::shared_ptr<HttpClient> http_client;
    SalesforceConnectionParams params;
    SalesforceSession session;
};

} // namespace sfrest
