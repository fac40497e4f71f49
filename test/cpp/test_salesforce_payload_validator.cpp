#include <catch2/catch.hpp>
#include "salesforce_exceptions.hpp"
#include "salesforce_payload_validator.hpp"

using namespace sfrest;

TEST_CASE("Payload validation against object fields", "[payload_validator]") {
    SalesforceNameSet contact_fields = {"Id", "FirstName", "LastName", "Email"};

    SECTION("Known fields pass") {
        SalesforcePayload payload = {{"FirstName", "Ken"}, {"LastName", "Williams"}};
        REQUIRE_NOTHROW(SalesforcePayloadValidator::Validate(payload, contact_fields, "Contact"));
    }

    SECTION("Empty payload passes") {
        REQUIRE_NOTHROW(SalesforcePayloadValidator::Validate(SalesforcePayload(), contact_fields));
        REQUIRE_NOTHROW(SalesforcePayloadValidator::Validate(SalesforcePayload(), SalesforceNameSet()));
    }

    SECTION("Values are not inspected") {
        SalesforcePayload payload = {{"Email", "not an email"}};
        REQUIRE_NOTHROW(SalesforcePayloadValidator::Validate(payload, contact_fields, "Contact"));
    }

    SECTION("First unknown field is reported") {
        SalesforcePayload payload = {{"FirstName", "Marie"}, {"Name", "Marie Rogers"}, {"Title", "CEO"}};
        try {
            SalesforcePayloadValidator::Validate(payload, contact_fields, "Contact");
            FAIL("Expected SalesforceInvalidFieldException");
        } catch (const SalesforceInvalidFieldException &e) {
            REQUIRE(e.Field() == "Name");
            REQUIRE(e.ObjectName() == "Contact");
        }
    }

    SECTION("Field names are case sensitive") {
        SalesforcePayload payload = {{"email", "ken@example.com"}};
        REQUIRE_THROWS_AS(SalesforcePayloadValidator::Validate(payload, contact_fields, "Contact"),
                          SalesforceInvalidFieldException);
    }
}
