#include "salesforce_exceptions.hpp"

namespace sfrest {

static constexpr size_t MAX_BODY_IN_MESSAGE = 500;

SalesforceException::SalesforceException(duckdb::ExceptionType type, const std::string &message)
    : duckdb::Exception(type, message) {
}

SalesforceAuthenticationException::SalesforceAuthenticationException(const std::string &message)
    : SalesforceException(duckdb::ExceptionType::PERMISSION, "Salesforce authentication failed: " + message) {
}

SalesforceUnsupportedMethodException::SalesforceUnsupportedMethodException(const std::string &method)
    : SalesforceException(duckdb::ExceptionType::NOT_IMPLEMENTED,
                          "Method '" + method + "' isn't supported, use one of GET, POST, PATCH, DELETE"),
      method(method) {
}

SalesforceUnknownObjectException::SalesforceUnknownObjectException(const std::string &object_name)
    : SalesforceException(duckdb::ExceptionType::CATALOG, object_name + " isn't a valid object"),
      object_name(object_name) {
}

SalesforceMissingPayloadException::SalesforceMissingPayloadException(const std::string &method)
    : SalesforceException(duckdb::ExceptionType::INVALID_INPUT,
                          "Payload must be defined for a " + method + " request") {
}

SalesforceInvalidFieldException::SalesforceInvalidFieldException(const std::string &field, const std::string &object_name)
    : SalesforceException(duckdb::ExceptionType::INVALID_INPUT,
                          field + " isn't a valid field" + (object_name.empty() ? std::string() : " of " + object_name)),
      field(field), object_name(object_name) {
}

static std::string FormatRequestMessage(int status, const std::string &body, const std::string &context) {
    std::string message = context;
    if (status > 0) {
        message += " (HTTP " + std::to_string(status) + ")";
    }
    if (!body.empty()) {
        message += ": " + body.substr(0, MAX_BODY_IN_MESSAGE);
    }
    return message;
}

SalesforceRequestException::SalesforceRequestException(int status, const std::string &body, const std::string &context)
    : SalesforceException(duckdb::ExceptionType::HTTP, FormatRequestMessage(status, body, context)),
      status(status), body(body) {
}

} // namespace sfrest
