#include "duckdb.hpp"
#include "duckdb/function/pragma_function.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

#include "sfrest_extension.hpp"
#include "salesforce_functions.hpp"
#include "salesforce_secret.hpp"
#include "sfrest_tracing.hpp"

namespace duckdb {

static sfrest::TraceLevel ParseTraceLevel(const string &level_str) {
    try {
        return sfrest::TraceLevelFromString(level_str);
    } catch (const std::invalid_argument &) {
        throw BinderException("Invalid trace level '%s', use one of NONE, ERROR, WARN, INFO, DEBUG, TRACE", level_str);
    }
}

// Tracing configuration callbacks
static void OnTraceEnabled(ClientContext &context, SetScope scope, Value &parameter)
{
    sfrest::SfrestTracer::Instance().SetEnabled(parameter.GetValue<bool>());
}

static void OnTraceLevel(ClientContext &context, SetScope scope, Value &parameter)
{
    sfrest::SfrestTracer::Instance().SetLevel(ParseTraceLevel(parameter.GetValue<string>()));
}

static void OnTraceOutput(ClientContext &context, SetScope scope, Value &parameter)
{
    auto output = parameter.GetValue<string>();
    try {
        sfrest::SfrestTracer::Instance().SetOutputMode(StringUtil::Lower(output));
    } catch (const std::invalid_argument &) {
        throw BinderException("Invalid trace output '%s', use one of console, file, both", output);
    }
}

static void OnTraceDirectory(ClientContext &context, SetScope scope, Value &parameter)
{
    sfrest::SfrestTracer::Instance().SetTraceDirectory(parameter.GetValue<string>());
}

static string EnableTracingPragmaFunction(ClientContext &context, const FunctionParameters &parameters) {
    if (parameters.values.empty()) {
        throw BinderException("sfrest_trace_enable pragma requires a boolean parameter");
    }

    auto enabled = parameters.values[0].GetValue<bool>();
    sfrest::SfrestTracer::Instance().SetEnabled(enabled);

    stringstream result;
    result << "Tracing " << (enabled ? "enabled" : "disabled");
    return result.str();
}

static string SetTraceLevelPragmaFunction(ClientContext &context, const FunctionParameters &parameters) {
    if (parameters.values.empty()) {
        throw BinderException("sfrest_trace_level pragma requires a string parameter");
    }

    auto level = ParseTraceLevel(parameters.values[0].GetValue<string>());
    sfrest::SfrestTracer::Instance().SetLevel(level);

    stringstream result;
    result << "Trace level set to: " << sfrest::TraceLevelToString(level);
    return result.str();
}

static void RegisterConfiguration(DatabaseInstance &instance)
{
    auto &config = DBConfig::GetConfig(instance);

    config.AddExtensionOption("sfrest_trace_enabled", "Enable Salesforce connector tracing",
                              LogicalTypeId::BOOLEAN, Value(false), OnTraceEnabled);
    config.AddExtensionOption("sfrest_trace_level", "Set Salesforce connector trace level (TRACE, DEBUG, INFO, WARN, ERROR)",
                              LogicalTypeId::VARCHAR, Value("INFO"), OnTraceLevel);
    config.AddExtensionOption("sfrest_trace_output", "Set Salesforce connector trace output (console, file, both)",
                              LogicalTypeId::VARCHAR, Value("console"), OnTraceOutput);
    config.AddExtensionOption("sfrest_trace_directory", "Set the directory of the Salesforce connector trace file",
                              LogicalTypeId::VARCHAR, Value("."), OnTraceDirectory);
}

static void RegisterTracingPragmas(ExtensionLoader &loader)
{
    loader.RegisterFunction(PragmaFunctionSet(PragmaFunction::PragmaCall(
        "sfrest_trace_enable", EnableTracingPragmaFunction, {LogicalType::BOOLEAN})));

    loader.RegisterFunction(PragmaFunctionSet(PragmaFunction::PragmaCall(
        "sfrest_trace_level", SetTraceLevelPragmaFunction, {LogicalType::VARCHAR})));
}

static void LoadInternal(ExtensionLoader &loader) {
    RegisterConfiguration(loader.GetDatabaseInstance());
    sfrest::CreateSalesforceSecretFunctions::Register(loader);
    sfrest::SalesforceFunctions::Register(loader);
    RegisterTracingPragmas(loader);
}

void SfrestExtension::Load(ExtensionLoader &loader) {
    LoadInternal(loader);
}

std::string SfrestExtension::Name() {
    return "sfrest";
}

std::string SfrestExtension::Version() {
#ifdef EXT_VERSION_SFREST
    return EXT_VERSION_SFREST;
#else
    return "0.1.0";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(sfrest, loader) {
    duckdb::SfrestExtension::Load(loader);
}

}
