#pragma once

#include <map>
#include <set>
#include <string>

namespace sfrest {

using SalesforcePayload = std::map<std::string, std::string>;
using SalesforceNameSet = std::set<std::string>;

class SalesforcePayloadValidator {
public:
    // Throws SalesforceInvalidFieldException for the first payload key that is
    // not in allowed_fields. Only field presence is checked, never values.
    static void Validate(const SalesforcePayload &payload,
                         const SalesforceNameSet &allowed_fields,
                         const std::string &object_name = "");
};

} // namespace sfrest
