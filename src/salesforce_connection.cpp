#include "salesforce_connection.hpp"
#include "salesforce_exceptions.hpp"
#include "salesforce_path_interpreter.hpp"
#include "salesforce_url_builder.hpp"
#include "sfrest_tracing.hpp"

#include "duckdb/common/error_data.hpp"
#include <yyjson.h>
#include <cstdlib>

namespace sfrest {

SalesforceConnection::SalesforceConnection(SalesforceConnectionParams params)
    : SalesforceConnection(params, std::make_shared<HttpClient>(params.ToHttpParams())) {
}

SalesforceConnection::SalesforceConnection(SalesforceConnectionParams params, std::shared_ptr<HttpClient> http_client)
    : http_client(http_client),
      authenticator(http_client, std::move(params)),
      schema_cache([this](const std::string &path) { return Dispatch(HttpMethod::GET, path); }, validation_enabled) {
}

const SalesforceConnectionParams &SalesforceConnection::Params() const {
    return authenticator.Params();
}

SalesforceAuthenticator &SalesforceConnection::Authenticator() {
    return authenticator;
}

SalesforceSchemaCache &SalesforceConnection::SchemaCache() {
    return schema_cache;
}

bool SalesforceConnection::IsValidationEnabled() const {
    return validation_enabled;
}

bool SalesforceConnection::IsSupportedMethod(HttpMethod method) {
    switch (method.Variant()) {
        case HttpMethod::GET:
        case HttpMethod::POST:
        case HttpMethod::PATCH:
        case HttpMethod::_DELETE:
            return true;
        default:
            return false;
    }
}

std::string SalesforceConnection::Dispatch(HttpMethod method, const std::string &path,
                                           std::optional<SalesforcePayload> payload) {
    return Dispatch(SalesforceRequestSpec{method, path, std::move(payload)});
}

std::string SalesforceConnection::Dispatch(const SalesforceRequestSpec &request_spec) {
    std::lock_guard<std::recursive_mutex> lock(dispatch_mutex);

    SFREST_TRACE_DEBUG("SF_DISPATCH", "Dispatching " + request_spec.method.ToString() + " " + request_spec.path +
                       (validation_enabled ? "" : " (validation suspended)"));

    authenticator.EnsureAuthenticated();

    if (!IsSupportedMethod(request_spec.method)) {
        SFREST_TRACE_ERROR("SF_DISPATCH", "Unsupported method: " + request_spec.method.ToString());
        throw SalesforceUnsupportedMethodException(request_spec.method.ToString());
    }

    ValidateRequest(request_spec);

    auto content = SendApiRequest(request_spec);
    validation_enabled = true;
    return content;
}

void SalesforceConnection::ValidateRequest(const SalesforceRequestSpec &request_spec) {
    std::string object_name;

    if (validation_enabled) {
        object_name = SalesforcePathInterpreter::ObjectNameFromPath(request_spec.path);
        if (!object_name.empty()) {
            const auto &object_names = schema_cache.ObjectNames();
            if (object_names.find(object_name) == object_names.end()) {
                SFREST_TRACE_ERROR("SF_DISPATCH", "Unknown object: " + object_name);
                throw SalesforceUnknownObjectException(object_name);
            }
        }
    }

    if (!request_spec.method.HasBody()) {
        return;
    }

    if (!request_spec.payload || request_spec.payload->empty()) {
        SFREST_TRACE_ERROR("SF_DISPATCH", "Missing payload for " + request_spec.method.ToString());
        throw SalesforceMissingPayloadException(request_spec.method.ToString());
    }

    // Without an object name there is no field list to check against
    if (validation_enabled && !object_name.empty()) {
        SalesforcePayloadValidator::Validate(*request_spec.payload, schema_cache.ObjectFields(object_name), object_name);
    }
}

std::string SalesforceConnection::SendApiRequest(const SalesforceRequestSpec &request_spec) {
    const auto &session = authenticator.Session();
    auto url = SalesforceUrlBuilder::BuildResourceUrl(session.instance_url, Params().api_version, request_spec.path);

    HttpRequest request(request_spec.method, url);
    request.headers["Accept"] = "application/json";
    request.AuthHeadersFromParams(session.AuthParams());
    if (request_spec.method.HasBody()) {
        request.content = SerializePayload(*request_spec.payload);
    }

    SFREST_TRACE_INFO("SF_DISPATCH", request_spec.method.ToString() + " " + url);
    SFREST_TRACE_TRACE_DATA("SF_DISPATCH", "Request body", request.content);

    std::unique_ptr<HttpResponse> response;
    try {
        response = http_client->SendRequest(request);
    } catch (const duckdb::IOException &e) {
        auto message = duckdb::ErrorData(e).RawMessage();
        SFREST_TRACE_ERROR("SF_DISPATCH", "Transport failure: " + message);
        throw SalesforceRequestException(0, message, request_spec.method.ToString() + " " + request_spec.path + " failed");
    }

    if (!response) {
        throw SalesforceRequestException(0, "", request_spec.method.ToString() + " " + request_spec.path +
                                                " returned no response");
    }

    SFREST_TRACE_DEBUG("SF_DISPATCH", "Response HTTP " + std::to_string(response->Code()) +
                       ", " + std::to_string(response->Content().size()) + " bytes");

    if (!response->IsSuccess()) {
        SFREST_TRACE_ERROR("SF_DISPATCH", request_spec.method.ToString() + " " + request_spec.path +
                           " returned HTTP " + std::to_string(response->Code()));
        throw SalesforceRequestException(response->Code(), response->Content(),
                                         request_spec.method.ToString() + " " + request_spec.path + " failed");
    }

    SFREST_TRACE_TRACE_DATA("SF_DISPATCH", "Response body", response->Content());
    return response->Content();
}

std::string SalesforceConnection::SerializePayload(const SalesforcePayload &payload) {
    auto doc = std::shared_ptr<yyjson_mut_doc>(yyjson_mut_doc_new(nullptr), yyjson_mut_doc_free);
    auto root = yyjson_mut_obj(doc.get());
    yyjson_mut_doc_set_root(doc.get(), root);

    for (const auto &entry : payload) {
        yyjson_mut_obj_add_strncpy(doc.get(), root, entry.first.c_str(), entry.second.c_str(), entry.second.size());
    }

    size_t len = 0;
    char *json = yyjson_mut_write(doc.get(), 0, &len);
    if (!json) {
        throw SalesforceRequestException(0, "", "Failed to serialize request payload");
    }
    std::string result(json, len);
    free(json);
    return result;
}

std::vector<std::string> SalesforceConnection::ParseQueryRecords(const std::string &content) {
    auto doc = std::shared_ptr<yyjson_doc>(yyjson_read(content.c_str(), content.size(), 0), yyjson_doc_free);
    auto root = doc ? yyjson_doc_get_root(doc.get()) : nullptr;
    auto records_val = root && yyjson_is_obj(root) ? yyjson_obj_get(root, "records") : nullptr;
    if (!records_val || !yyjson_is_arr(records_val)) {
        SFREST_TRACE_ERROR("SF_SOQL", "Query response has no records array");
        throw SalesforceRequestException(200, content, "Query response has no 'records' array");
    }

    std::vector<std::string> records;
    records.reserve(yyjson_arr_size(records_val));

    size_t idx, max;
    yyjson_val *record;
    yyjson_arr_foreach(records_val, idx, max, record) {
        size_t len = 0;
        char *json = yyjson_val_write(record, 0, &len);
        if (!json) {
            throw SalesforceRequestException(200, content, "Failed to serialize record " + std::to_string(idx));
        }
        records.emplace_back(json, len);
        free(json);
    }
    return records;
}

std::string SalesforceConnection::QueryWithSoqlRaw(const std::string &soql) {
    SFREST_TRACE_INFO("SF_SOQL", "Query: " + soql);
    return Dispatch(HttpMethod::GET, SalesforceUrlBuilder::BuildQueryPath(soql));
}

std::vector<std::string> SalesforceConnection::QueryWithSoql(const std::string &soql) {
    auto records = ParseQueryRecords(QueryWithSoqlRaw(soql));
    SFREST_TRACE_DEBUG("SF_SOQL", "Query returned " + std::to_string(records.size()) + " records");
    return records;
}

} // namespace sfrest
