#pragma once

#include "salesforce_payload_validator.hpp"

#include <functional>
#include <map>
#include <string>

namespace sfrest {

// Issues a GET for an API-relative path and returns the body of a 2xx response.
using SalesforceMetadataFetcher = std::function<std::string(const std::string &path)>;

// Object names and per-object field names of the org, fetched on first use and
// kept for the lifetime of the owning connection.
class SalesforceSchemaCache {
public:
    SalesforceSchemaCache(SalesforceMetadataFetcher fetcher, bool &validation_enabled);

    const SalesforceNameSet &ObjectNames();
    const SalesforceNameSet &ObjectFields(const std::string &object_name);

    bool HasObjectNames() const;
    bool HasObjectFields(const std::string &object_name) const;

    // Reads the "name" member of every element in the array stored under array_key.
    static SalesforceNameSet ParseNameList(const std::string &content, const std::string &array_key,
                                           const std::string &path);

private:
    std::string FetchWithoutValidation(const std::string &path);

    SalesforceMetadataFetcher fetcher;
    bool &validation_enabled;

    bool object_names_loaded = false;
    SalesforceNameSet object_names;
    std::map<std::string, SalesforceNameSet> object_fields;
};

} // namespace sfrest
