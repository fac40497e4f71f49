#include <catch2/catch.hpp>
#include "salesforce_url_builder.hpp"
#include "http_client.hpp"

using namespace sfrest;

TEST_CASE("Salesforce API version formatting", "[url_builder]") {
    REQUIRE(SalesforceUrlBuilder::FormatApiVersion(47.0) == "v47.0");
    REQUIRE(SalesforceUrlBuilder::FormatApiVersion(58) == "v58.0");
    REQUIRE(SalesforceUrlBuilder::FormatApiVersion(52.5) == "v52.5");
    REQUIRE(SalesforceUrlBuilder::FormatApiVersion(SalesforceUrlBuilder::DEFAULT_API_VERSION) == "v47.0");
}

TEST_CASE("Salesforce API URLs", "[url_builder]") {
    SECTION("Base URL") {
        REQUIRE(SalesforceUrlBuilder::BuildApiUrl("https://eu12.my.salesforce.com") ==
                "https://eu12.my.salesforce.com/services/data/v47.0");
        REQUIRE(SalesforceUrlBuilder::BuildApiUrl("https://eu12.my.salesforce.com/", 58.0) ==
                "https://eu12.my.salesforce.com/services/data/v58.0");
    }

    SECTION("Resource URL") {
        REQUIRE(SalesforceUrlBuilder::BuildResourceUrl("https://eu12.my.salesforce.com", 47.0, "sobjects/Contact") ==
                "https://eu12.my.salesforce.com/services/data/v47.0/sobjects/Contact");
        REQUIRE(SalesforceUrlBuilder::BuildResourceUrl("https://eu12.my.salesforce.com", 47.0, "/sobjects") ==
                "https://eu12.my.salesforce.com/services/data/v47.0/sobjects");
    }
}

TEST_CASE("Salesforce resource paths", "[url_builder]") {
    REQUIRE(SalesforceUrlBuilder::BuildObjectsPath() == "sobjects");
    REQUIRE(SalesforceUrlBuilder::BuildObjectPath("Contact") == "sobjects/Contact");
    REQUIRE(SalesforceUrlBuilder::BuildDescribePath("Contact") == "sobjects/Contact/describe");
}

TEST_CASE("SOQL encoding", "[url_builder]") {
    REQUIRE(SalesforceUrlBuilder::EncodeSoql("SELECT Id, Name FROM Contact WHERE Email = 'a@b.c'") ==
            "SELECT+Id,+Name+FROM+Contact+WHERE+Email+=+'a@b.c'");
    REQUIRE(SalesforceUrlBuilder::BuildQueryPath("SELECT Id FROM Account") == "query?q=SELECT+Id+FROM+Account");
    REQUIRE(SalesforceUrlBuilder::EncodeSoql("") == "");
    REQUIRE(SalesforceUrlBuilder::EncodeSoql("SELECT Id FROM Account WHERE Name = 'A#1'") ==
            "SELECT+Id+FROM+Account+WHERE+Name+=+'A%231'");

    HttpUrl url(SalesforceUrlBuilder::BuildResourceUrl(
        "https://eu12.my.salesforce.com", 47.0, SalesforceUrlBuilder::BuildQueryPath("SELECT Id FROM Account WHERE Name = 'A#1'")));
    REQUIRE(url.ToPathQuery() == "/services/data/v47.0/query?q=SELECT+Id+FROM+Account+WHERE+Name+=+'A%231'");
}
