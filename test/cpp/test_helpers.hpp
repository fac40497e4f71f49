#pragma once

#include "http_client.hpp"
#include "salesforce_authenticator.hpp"

#include "duckdb/common/exception.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace sfrest {
namespace test {

static constexpr const char *TEST_AUTH_URL = "https://login.example.com/services/oauth2/token";
static constexpr const char *TEST_INSTANCE_URL = "https://eu12.my.salesforce.com";
static constexpr const char *TEST_API_URL = "https://eu12.my.salesforce.com/services/data/v47.0/";

struct RecordedRequest {
    HttpMethod method;
    std::string url;
    HeaderMap headers;
    std::string content_type;
    std::string content;
};

struct CannedResponse {
    int code;
    std::string content;
};

// In-memory stand-in for the Salesforce endpoints. Responses are registered per
// "METHOD url"; unregistered requests get a 404.
class MockHttpClient : public HttpClient {
public:
    void On(HttpMethod method, const std::string &url, int code, const std::string &content) {
        responses[Key(method, url)] = CannedResponse{code, content};
    }

    void FailTransport(HttpMethod method, const std::string &url) {
        transport_failures.insert(Key(method, url));
    }

    void Clear(HttpMethod method, const std::string &url) {
        responses.erase(Key(method, url));
        transport_failures.erase(Key(method, url));
    }

    std::unique_ptr<HttpResponse> SendRequest(HttpRequest &request) override {
        auto url = request.url.ToString();
        requests.push_back(RecordedRequest{request.method, url, request.headers, request.content_type, request.content});

        auto key = Key(request.method, url);
        if (transport_failures.count(key)) {
            throw duckdb::IOException("Connection error for HTTP %s to '%s'", request.method.ToString(), url);
        }

        auto it = responses.find(key);
        if (it == responses.end()) {
            return std::make_unique<HttpResponse>(request.method, request.url, 404, "application/json",
                                                  R"([{"errorCode":"NOT_FOUND","message":"The requested resource does not exist"}])");
        }
        return std::make_unique<HttpResponse>(request.method, request.url, it->second.code, "application/json",
                                              it->second.content);
    }

    size_t CountRequests(HttpMethod method, const std::string &url) const {
        size_t count = 0;
        for (const auto &request : requests) {
            if (request.method == method && request.url == url) {
                count++;
            }
        }
        return count;
    }

    std::vector<std::string> RequestLines() const {
        std::vector<std::string> lines;
        for (const auto &request : requests) {
            lines.push_back(request.method.ToString() + " " + request.url);
        }
        return lines;
    }

    std::vector<RecordedRequest> requests;

private:
    static std::string Key(HttpMethod method, const std::string &url) {
        return method.ToString() + " " + url;
    }

    std::map<std::string, CannedResponse> responses;
    std::set<std::string> transport_failures;
};

inline SalesforceConnectionParams TestConnectionParams() {
    SalesforceConnectionParams params;
    params.auth_url = TEST_AUTH_URL;
    params.username = "integration@example.com";
    params.password = "pa ss&word";
    params.client_id = "client-id";
    params.client_secret = "client-secret";
    return params;
}

inline std::string ApiUrl(const std::string &path) {
    return std::string(TEST_API_URL) + path;
}

inline std::string TokenResponse() {
    return R"({"access_token":"00Dxx0000001gPL!token","instance_url":"https://eu12.my.salesforce.com","id":"https://login.salesforce.com/id/00Dxx0000001gPLEAY/005xx000001SwiUAAS","token_type":"Bearer","issued_at":"1571221234567","signature":"abc="})";
}

inline std::string ObjectsResponse() {
    return R"({"encoding":"UTF-8","maxBatchSize":200,"sobjects":[{"name":"Account","label":"Account"},{"name":"Contact","label":"Contact"},{"name":"Lead","label":"Lead"}]})";
}

inline std::string ContactDescribeResponse() {
    return R"({"name":"Contact","fields":[{"name":"Id","type":"id"},{"name":"FirstName","type":"string"},{"name":"LastName","type":"string"},{"name":"Email","type":"email"}]})";
}

// Registers the token endpoint, the object list and the Contact describe call
inline std::shared_ptr<MockHttpClient> SalesforceOrgMock() {
    auto mock = std::make_shared<MockHttpClient>();
    mock->On(HttpMethod::POST, TEST_AUTH_URL, 200, TokenResponse());
    mock->On(HttpMethod::GET, ApiUrl("sobjects"), 200, ObjectsResponse());
    mock->On(HttpMethod::GET, ApiUrl("sobjects/Contact/describe"), 200, ContactDescribeResponse());
    return mock;
}

} // namespace test
} // namespace sfrest
