#pragma once

#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include <string>

namespace sfrest {

// Base of every error raised by the Salesforce connector. The concrete classes
// carry the structured detail a caller needs to decide between retrying,
// fixing its input or aborting.
class SalesforceException : public duckdb::Exception {
public:
    SalesforceException(duckdb::ExceptionType type, const std::string &message);
};

// Password grant rejected or the token response is malformed.
class SalesforceAuthenticationException : public SalesforceException {
public:
    explicit SalesforceAuthenticationException(const std::string &message);
};

class SalesforceUnsupportedMethodException : public SalesforceException {
public:
    explicit SalesforceUnsupportedMethodException(const std::string &method);

    const std::string &Method() const { return method; }

private:
    std::string method;
};

// The request path resolves to an object that is not part of the org schema.
class SalesforceUnknownObjectException : public SalesforceException {
public:
    explicit SalesforceUnknownObjectException(const std::string &object_name);

    const std::string &ObjectName() const { return object_name; }

private:
    std::string object_name;
};

class SalesforceMissingPayloadException : public SalesforceException {
public:
    explicit SalesforceMissingPayloadException(const std::string &method);
};

// Reports the first payload field that is not a field of the target object.
class SalesforceInvalidFieldException : public SalesforceException {
public:
    SalesforceInvalidFieldException(const std::string &field, const std::string &object_name);

    const std::string &Field() const { return field; }
    const std::string &ObjectName() const { return object_name; }

private:
    std::string field;
    std::string object_name;
};

// Non-2xx response, transport failure or timeout (status 0), or a body that
// does not have the shape the connector expects.
class SalesforceRequestException : public SalesforceException {
public:
    SalesforceRequestException(int status, const std::string &body, const std::string &context);

    int Status() const { return status; }
    const std::string &Body() const { return body; }

private:
    int status;
    std::string body;
};

} // namespace sfrest
