#include "salesforce_secret.hpp"
#include "sfrest_tracing.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/main/secret/secret_manager.hpp"

namespace sfrest {

static const std::vector<std::string> REQUIRED_KEYS = {"username", "password", "client_id", "client_secret"};

void CreateSalesforceSecretFunctions::Register(duckdb::ExtensionLoader &loader) {
    SFREST_TRACE_INFO("SF_SECRET", "Registering Salesforce secret functions");

    auto secret_type = CreateSecretType();
    auto password_function = CreatePasswordFunction();

    loader.RegisterSecretType(secret_type);
    loader.RegisterFunction(password_function);
}

duckdb::SecretType CreateSalesforceSecretFunctions::CreateSecretType() {
    duckdb::SecretType secret_type;
    secret_type.name = SECRET_TYPE;
    secret_type.deserializer = duckdb::KeyValueSecret::Deserialize<duckdb::KeyValueSecret>;
    secret_type.default_provider = PASSWORD_PROVIDER;
    return secret_type;
}

duckdb::CreateSecretFunction CreateSalesforceSecretFunctions::CreatePasswordFunction() {
    duckdb::CreateSecretFunction password_function = {SECRET_TYPE, PASSWORD_PROVIDER, CreateFromPassword, {}};
    password_function.named_parameters["auth_url"] = duckdb::LogicalType(duckdb::LogicalTypeId::VARCHAR);
    password_function.named_parameters["username"] = duckdb::LogicalType(duckdb::LogicalTypeId::VARCHAR);
    password_function.named_parameters["password"] = duckdb::LogicalType(duckdb::LogicalTypeId::VARCHAR);
    password_function.named_parameters["client_id"] = duckdb::LogicalType(duckdb::LogicalTypeId::VARCHAR);
    password_function.named_parameters["client_secret"] = duckdb::LogicalType(duckdb::LogicalTypeId::VARCHAR);
    password_function.named_parameters["api_version"] = duckdb::LogicalType(duckdb::LogicalTypeId::DOUBLE);
    password_function.named_parameters["timeout"] = duckdb::LogicalType(duckdb::LogicalTypeId::UBIGINT);
    return password_function;
}

duckdb::unique_ptr<duckdb::BaseSecret> CreateSalesforceSecretFunctions::CreateFromPassword(
    duckdb::ClientContext &context,
    duckdb::CreateSecretInput &input) {

    SFREST_TRACE_DEBUG("SF_SECRET", "Creating Salesforce secret with password provider");

    auto scope = input.scope;
    auto result = duckdb::make_uniq<duckdb::KeyValueSecret>(scope, input.type, input.provider, input.name);

    for (const auto &key : {"auth_url", "username", "password", "client_id", "client_secret"}) {
        auto val = input.options.find(key);
        if (val != input.options.end()) {
            result->secret_map[key] = val->second;
        }
    }

    for (const auto &key : REQUIRED_KEYS) {
        if (result->secret_map.find(key) == result->secret_map.end()) {
            throw duckdb::InvalidInputException("'%s' is required for a Salesforce secret", key);
        }
    }

    if (result->secret_map.find("auth_url") == result->secret_map.end()) {
        result->secret_map["auth_url"] = duckdb::Value(SalesforceUrlBuilder::DEFAULT_AUTH_URL);
    }

    auto api_version = input.options.find("api_version");
    result->secret_map["api_version"] = api_version != input.options.end()
                                            ? api_version->second.DefaultCastAs(duckdb::LogicalType::DOUBLE)
                                            : duckdb::Value::DOUBLE(SalesforceUrlBuilder::DEFAULT_API_VERSION);
    if (result->secret_map["api_version"].GetValue<double>() <= 0) {
        throw duckdb::InvalidInputException("'api_version' of a Salesforce secret must be positive");
    }

    auto timeout = input.options.find("timeout");
    if (timeout != input.options.end()) {
        result->secret_map["timeout"] = timeout->second.DefaultCastAs(duckdb::LogicalType::UBIGINT);
    }

    RedactSensitiveKeys(*result);

    SFREST_TRACE_INFO("SF_SECRET", "Created Salesforce secret '" + input.name + "'");
    return std::move(result);
}

void CreateSalesforceSecretFunctions::RedactSensitiveKeys(duckdb::KeyValueSecret &result) {
    result.redact_keys.insert("password");
    result.redact_keys.insert("client_secret");
}

SalesforceConnectionParams SalesforceParamsFromSecret(const duckdb::KeyValueSecret &secret) {
    auto get_string = [&](const std::string &key) -> std::string {
        auto val = secret.secret_map.find(key);
        if (val == secret.secret_map.end() || val->second.IsNull()) {
            return "";
        }
        return val->second.ToString();
    };

    SalesforceConnectionParams params;

    auto auth_url = get_string("auth_url");
    if (!auth_url.empty()) {
        params.auth_url = auth_url;
    }
    params.username = get_string("username");
    params.password = get_string("password");
    params.client_id = get_string("client_id");
    params.client_secret = get_string("client_secret");

    auto api_version = secret.secret_map.find("api_version");
    if (api_version != secret.secret_map.end() && !api_version->second.IsNull()) {
        params.api_version = api_version->second.GetValue<double>();
    }

    auto timeout = secret.secret_map.find("timeout");
    if (timeout != secret.secret_map.end() && !timeout->second.IsNull()) {
        params.timeout_ms = timeout->second.GetValue<uint64_t>();
    }

    return params;
}

SalesforceConnectionParams ResolveSalesforceParams(
    duckdb::ClientContext &context,
    const std::string &secret_name) {

    SFREST_TRACE_DEBUG("SF_SECRET", "Resolving Salesforce secret: " + (secret_name.empty() ? "<default>" : secret_name));

    auto &secret_manager = duckdb::SecretManager::Get(context);
    auto transaction = duckdb::CatalogTransaction::GetSystemCatalogTransaction(context);

    duckdb::unique_ptr<duckdb::SecretEntry> secret_entry;
    if (secret_name.empty()) {
        for (auto &entry : secret_manager.AllSecrets(transaction)) {
            if (entry.secret && entry.secret->GetType() == CreateSalesforceSecretFunctions::SECRET_TYPE) {
                secret_entry = duckdb::make_uniq<duckdb::SecretEntry>(entry);
                break;
            }
        }
        if (!secret_entry) {
            throw duckdb::InvalidInputException("No Salesforce secret found. Use CREATE SECRET (TYPE salesforce, ...) to create one.");
        }
    } else {
        secret_entry = secret_manager.GetSecretByName(transaction, secret_name);
        if (!secret_entry) {
            throw duckdb::InvalidInputException("Salesforce secret '%s' not found. Use CREATE SECRET to create it.", secret_name);
        }
    }

    if (secret_entry->secret->GetType() != CreateSalesforceSecretFunctions::SECRET_TYPE) {
        throw duckdb::InvalidInputException("Secret '%s' is not of type salesforce", secret_entry->secret->GetName());
    }

    auto kv_secret = dynamic_cast<const duckdb::KeyValueSecret *>(secret_entry->secret.get());
    if (!kv_secret) {
        throw duckdb::InvalidInputException("Secret '%s' is not a KeyValueSecret", secret_entry->secret->GetName());
    }

    return SalesforceParamsFromSecret(*kv_secret);
}

} // namespace sfrest
