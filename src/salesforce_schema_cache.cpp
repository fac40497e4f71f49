#include "salesforce_schema_cache.hpp"
#include "salesforce_exceptions.hpp"
#include "salesforce_url_builder.hpp"
#include "sfrest_tracing.hpp"

#include <yyjson.h>
#include <memory>

namespace sfrest {

namespace {

// Suspends validation for nested metadata requests. The previous value is put
// back on exit, including when the fetch throws.
class ValidationSuspension {
public:
    explicit ValidationSuspension(bool &validation_enabled)
        : validation_enabled(validation_enabled), previous(validation_enabled) {
        validation_enabled = false;
    }

    ~ValidationSuspension() {
        validation_enabled = previous;
    }

    ValidationSuspension(const ValidationSuspension &) = delete;
    ValidationSuspension &operator=(const ValidationSuspension &) = delete;

private:
    bool &validation_enabled;
    bool previous;
};

} // namespace

SalesforceSchemaCache::SalesforceSchemaCache(SalesforceMetadataFetcher fetcher, bool &validation_enabled)
    : fetcher(std::move(fetcher)), validation_enabled(validation_enabled) {
}

bool SalesforceSchemaCache::HasObjectNames() const {
    return object_names_loaded;
}

bool SalesforceSchemaCache::HasObjectFields(const std::string &object_name) const {
    return object_fields.find(object_name) != object_fields.end();
}

const SalesforceNameSet &SalesforceSchemaCache::ObjectNames() {
    if (object_names_loaded) {
        return object_names;
    }

    auto path = SalesforceUrlBuilder::BuildObjectsPath();
    SFREST_TRACE_INFO("SF_SCHEMA", "Fetching object names");

    auto content = FetchWithoutValidation(path);
    object_names = ParseNameList(content, "sobjects", path);
    object_names_loaded = true;

    SFREST_TRACE_DEBUG("SF_SCHEMA", "Cached " + std::to_string(object_names.size()) + " object names");
    return object_names;
}

const SalesforceNameSet &SalesforceSchemaCache::ObjectFields(const std::string &object_name) {
    auto it = object_fields.find(object_name);
    if (it != object_fields.end()) {
        return it->second;
    }

    auto path = SalesforceUrlBuilder::BuildDescribePath(object_name);
    SFREST_TRACE_INFO("SF_SCHEMA", "Fetching fields of " + object_name);

    auto content = FetchWithoutValidation(path);
    auto fields = ParseNameList(content, "fields", path);

    SFREST_TRACE_DEBUG("SF_SCHEMA", "Cached " + std::to_string(fields.size()) + " fields of " + object_name);
    return object_fields.emplace(object_name, std::move(fields)).first->second;
}

std::string SalesforceSchemaCache::FetchWithoutValidation(const std::string &path) {
    ValidationSuspension suspension(validation_enabled);
    return fetcher(path);
}

SalesforceNameSet SalesforceSchemaCache::ParseNameList(const std::string &content, const std::string &array_key,
                                                       const std::string &path) {
    auto doc = std::shared_ptr<yyjson_doc>(yyjson_read(content.c_str(), content.size(), 0), yyjson_doc_free);
    if (!doc) {
        SFREST_TRACE_ERROR("SF_SCHEMA", "Metadata response of " + path + " is not valid JSON");
        throw SalesforceRequestException(200, content, "Metadata response of '" + path + "' is not valid JSON");
    }

    auto root = yyjson_doc_get_root(doc.get());
    auto array_val = root && yyjson_is_obj(root) ? yyjson_obj_get(root, array_key.c_str()) : nullptr;
    if (!array_val || !yyjson_is_arr(array_val)) {
        SFREST_TRACE_ERROR("SF_SCHEMA", "Metadata response of " + path + " has no '" + array_key + "' array");
        throw SalesforceRequestException(200, content,
                                         "Metadata response of '" + path + "' has no '" + array_key + "' array");
    }

    SalesforceNameSet names;
    size_t idx, max;
    yyjson_val *item;
    yyjson_arr_foreach(array_val, idx, max, item) {
        auto name_val = yyjson_is_obj(item) ? yyjson_obj_get(item, "name") : nullptr;
        if (!name_val || !yyjson_is_str(name_val)) {
            throw SalesforceRequestException(200, content,
                                             "Element " + std::to_string(idx) + " of '" + array_key +
                                             "' in metadata response of '" + path + "' has no name");
        }
        names.insert(yyjson_get_str(name_val));
    }
    return names;
}

} // namespace sfrest
