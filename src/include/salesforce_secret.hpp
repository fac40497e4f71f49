#pragma once

#include "duckdb.hpp"
#include "duckdb/main/secret/secret.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include "salesforce_authenticator.hpp"
#include <string>

namespace sfrest {

// Secret type "salesforce" holding the password grant credentials
class CreateSalesforceSecretFunctions {
public:
    static constexpr const char *SECRET_TYPE = "salesforce";
    static constexpr const char *PASSWORD_PROVIDER = "password";

    static void Register(duckdb::ExtensionLoader &loader);

    static duckdb::SecretType CreateSecretType();
    static duckdb::CreateSecretFunction CreatePasswordFunction();

    static duckdb::unique_ptr<duckdb::BaseSecret> CreateFromPassword(
        duckdb::ClientContext &context,
        duckdb::CreateSecretInput &input);

private:
    static void RedactSensitiveKeys(duckdb::KeyValueSecret &result);
};

// Builds connection parameters from a key/value secret of type "salesforce"
SalesforceConnectionParams SalesforceParamsFromSecret(const duckdb::KeyValueSecret &secret);

// Looks up the secret by name, or the first salesforce secret when the name is empty
SalesforceConnectionParams ResolveSalesforceParams(
    duckdb::ClientContext &context,
    const std::string &secret_name);

} // namespace sfrest
