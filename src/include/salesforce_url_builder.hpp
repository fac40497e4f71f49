#pragma once

#include <string>

namespace sfrest {

// URL builder for the Salesforce REST API
class SalesforceUrlBuilder {
public:
    static constexpr double DEFAULT_API_VERSION = 47.0;
    static constexpr const char *DEFAULT_AUTH_URL = "https://login.salesforce.com/services/oauth2/token";

    // e.g., 47.0 -> v47.0
    static std::string FormatApiVersion(double api_version);

    // e.g., https://eu12.my.salesforce.com/services/data/v47.0
    static std::string BuildApiUrl(const std::string &instance_url, double api_version = DEFAULT_API_VERSION);

    // e.g., https://eu12.my.salesforce.com/services/data/v47.0/sobjects/Account
    static std::string BuildResourceUrl(const std::string &instance_url, double api_version, const std::string &path);

    static std::string BuildObjectsPath();
    static std::string BuildObjectPath(const std::string &object_name);
    static std::string BuildDescribePath(const std::string &object_name);

    // e.g., SELECT Name FROM Account -> query?q=SELECT+Name+FROM+Account
    static std::string BuildQueryPath(const std::string &soql);
    static std::string EncodeSoql(const std::string &soql);
};

} // namespace sfrest
