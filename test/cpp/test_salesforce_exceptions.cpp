#include <catch2/catch.hpp>
#include "salesforce_exceptions.hpp"
#include "duckdb/common/error_data.hpp"

using namespace sfrest;

static std::string RawMessage(const std::exception &e) {
    return duckdb::ErrorData(e).RawMessage();
}

static duckdb::ExceptionType Type(const std::exception &e) {
    return duckdb::ErrorData(e).Type();
}

TEST_CASE("Salesforce exception types", "[exceptions]") {
    SECTION("Authentication") {
        SalesforceAuthenticationException e("invalid_grant");
        REQUIRE(Type(e) == duckdb::ExceptionType::PERMISSION);
        REQUIRE(RawMessage(e) == "Salesforce authentication failed: invalid_grant");
    }

    SECTION("Unsupported method") {
        SalesforceUnsupportedMethodException e("PUT");
        REQUIRE(Type(e) == duckdb::ExceptionType::NOT_IMPLEMENTED);
        REQUIRE(e.Method() == "PUT");
        REQUIRE(RawMessage(e) == "Method 'PUT' isn't supported, use one of GET, POST, PATCH, DELETE");
    }

    SECTION("Unknown object") {
        SalesforceUnknownObjectException e("Contakt");
        REQUIRE(Type(e) == duckdb::ExceptionType::CATALOG);
        REQUIRE(e.ObjectName() == "Contakt");
        REQUIRE(RawMessage(e) == "Contakt isn't a valid object");
    }

    SECTION("Missing payload") {
        SalesforceMissingPayloadException e("PATCH");
        REQUIRE(Type(e) == duckdb::ExceptionType::INVALID_INPUT);
        REQUIRE(RawMessage(e) == "Payload must be defined for a PATCH request");
    }

    SECTION("Invalid field") {
        SalesforceInvalidFieldException e("Name", "Contact");
        REQUIRE(Type(e) == duckdb::ExceptionType::INVALID_INPUT);
        REQUIRE(e.Field() == "Name");
        REQUIRE(RawMessage(e) == "Name isn't a valid field of Contact");
        REQUIRE(RawMessage(SalesforceInvalidFieldException("Name", "")) == "Name isn't a valid field");
    }

    SECTION("Request failure with status and body") {
        SalesforceRequestException e(400, R"([{"errorCode":"DUPLICATES_DETECTED"}])", "POST sobjects/Contact failed");
        REQUIRE(Type(e) == duckdb::ExceptionType::HTTP);
        REQUIRE(e.Status() == 400);
        REQUIRE(e.Body() == R"([{"errorCode":"DUPLICATES_DETECTED"}])");
        REQUIRE(RawMessage(e) == R"(POST sobjects/Contact failed (HTTP 400): [{"errorCode":"DUPLICATES_DETECTED"}])");
    }

    SECTION("Transport failure has status 0") {
        SalesforceRequestException e(0, "timeout", "GET sobjects failed");
        REQUIRE(e.Status() == 0);
        REQUIRE(RawMessage(e) == "GET sobjects failed: timeout");
    }

    SECTION("Long bodies are cut in the message only") {
        std::string body(2000, 'x');
        SalesforceRequestException e(500, body, "GET limits failed");
        REQUIRE(e.Body().size() == 2000);
        REQUIRE(RawMessage(e).size() < 600);
    }
}

TEST_CASE("Salesforce exceptions share a base", "[exceptions]") {
    REQUIRE_THROWS_AS(throw SalesforceUnknownObjectException("Foo"), SalesforceException);
    REQUIRE_THROWS_AS(throw SalesforceRequestException(503, "", "GET sobjects failed"), duckdb::Exception);
}
