#pragma once

#include "http_client.hpp"
#include "salesforce_authenticator.hpp"
#include "salesforce_payload_validator.hpp"
#include "salesforce_schema_cache.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sfrest {

struct SalesforceRequestSpec {
    HttpMethod method;
    std::string path;
    std::optional<SalesforcePayload> payload;
};

// Stateful REST client for one Salesforce org. Authenticates on the first
// dispatch, validates object names and payload fields against the cached org
// schema, then forwards the request to /services/data/v<version>/<path>.
class SalesforceConnection {
public:
    explicit SalesforceConnection(SalesforceConnectionParams params);
    SalesforceConnection(SalesforceConnectionParams params, std::shared_ptr<HttpClient> http_client);

    SalesforceConnection(const SalesforceConnection &) = delete;
    SalesforceConnection &operator=(const SalesforceConnection &) = delete;

    // Returns the raw body of a 2xx response.
    std::string Dispatch(const SalesforceRequestSpec &request_spec);
    std::string Dispatch(HttpMethod method, const std::string &path,
                         std::optional<SalesforcePayload> payload = std::nullopt);

    // Each record of the result serialized as JSON text.
    std::vector<std::string> QueryWithSoql(const std::string &soql);
    std::string QueryWithSoqlRaw(const std::string &soql);

    const SalesforceConnectionParams &Params() const;
    SalesforceAuthenticator &Authenticator();
    SalesforceSchemaCache &SchemaCache();
    bool IsValidationEnabled() const;

    static bool IsSupportedMethod(HttpMethod method);
    static std::string SerializePayload(const SalesforcePayload &payload);
    static std::vector<std::string> ParseQueryRecords(const std::string &content);

private:
    void ValidateRequest(const SalesforceRequestSpec &request_spec);
    std::string SendApiRequest(const SalesforceRequestSpec &request_spec);

    std::recursive_mutex dispatch_mutex;
    std::shared_ptr<HttpClient> http_client;
    SalesforceAuthenticator authenticator;
    bool validation_enabled = true;
    SalesforceSchemaCache schema_cache;
};

} // namespace sfrest
