#include "salesforce_url_builder.hpp"
#include "duckdb.hpp"
#include "duckdb/common/string_util.hpp"

namespace sfrest {

std::string SalesforceUrlBuilder::FormatApiVersion(double api_version) {
    return duckdb::StringUtil::Format("v%.1f", api_version);
}

std::string SalesforceUrlBuilder::BuildApiUrl(const std::string &instance_url, double api_version) {
    std::string base = instance_url;
    // Remove trailing slash if present
    if (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/services/data/" + FormatApiVersion(api_version);
}

std::string SalesforceUrlBuilder::BuildResourceUrl(const std::string &instance_url, double api_version, const std::string &path) {
    auto relative = path;
    if (!relative.empty() && relative.front() == '/') {
        relative.erase(0, 1);
    }
    return BuildApiUrl(instance_url, api_version) + "/" + relative;
}

std::string SalesforceUrlBuilder::BuildObjectsPath() {
    return "sobjects";
}

std::string SalesforceUrlBuilder::BuildObjectPath(const std::string &object_name) {
    return "sobjects/" + object_name;
}

std::string SalesforceUrlBuilder::BuildDescribePath(const std::string &object_name) {
    return "sobjects/" + object_name + "/describe";
}

std::string SalesforceUrlBuilder::BuildQueryPath(const std::string &soql) {
    return "query?q=" + EncodeSoql(soql);
}

std::string SalesforceUrlBuilder::EncodeSoql(const std::string &soql) {
    // Blanks become '+' so the object name lookup finds the FROM+ / +WHERE tokens.
    // '#' is escaped, otherwise the URL parser would cut the query at it.
    return duckdb::StringUtil::Replace(duckdb::StringUtil::Replace(soql, "#", "%23"), " ", "+");
}

} // namespace sfrest
