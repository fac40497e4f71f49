#include "salesforce_payload_validator.hpp"
#include "salesforce_exceptions.hpp"
#include "sfrest_tracing.hpp"

namespace sfrest {

void SalesforcePayloadValidator::Validate(const SalesforcePayload &payload,
                                          const SalesforceNameSet &allowed_fields,
                                          const std::string &object_name) {
    for (const auto &entry : payload) {
        if (allowed_fields.find(entry.first) == allowed_fields.end()) {
            SFREST_TRACE_ERROR("SF_VALIDATOR", "Field '" + entry.first + "' isn't a field of '" + object_name + "'");
            throw SalesforceInvalidFieldException(entry.first, object_name);
        }
    }

    SFREST_TRACE_DEBUG("SF_VALIDATOR", "Payload with " + std::to_string(payload.size()) +
                       " fields is valid for '" + object_name + "'");
}

} // namespace sfrest
