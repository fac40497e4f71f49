#pragma once

#include <string>
#include <vector>

namespace sfrest {

// Derives the Salesforce object a request path refers to. An empty result means
// the path does not target a specific object and schema validation is skipped.
//
//   sobjects/Account/describe                        -> Account
//   query?q=SELECT+Name+FROM+Account+WHERE+Id='1'    -> Account
//   sobjects                                         -> ""
//   sobjects/Contact/003000000000001                 -> Contact
class SalesforcePathInterpreter {
public:
    static std::string ObjectNameFromPath(const std::string &path);

    static std::string ObjectNameFromSoqlPath(const std::string &path);
    static std::string ObjectNameAfterSObjects(const std::string &path);
    static bool HasDescribeSegment(const std::string &path);

private:
    static std::vector<std::string> SplitSegments(const std::string &path);
};

} // namespace sfrest
