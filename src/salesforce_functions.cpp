#include "salesforce_functions.hpp"
#include "salesforce_connection.hpp"
#include "salesforce_exceptions.hpp"
#include "salesforce_secret.hpp"
#include "sfrest_tracing.hpp"

#include "duckdb/common/types/value.hpp"

using namespace duckdb;

namespace sfrest {

// =============================================================================
// Bind Data
// =============================================================================

// Every function fetches during bind and hands out a single VARCHAR column.
struct SalesforceRowsBindData : public TableFunctionData {
    std::vector<std::string> rows;
    idx_t current_idx = 0;
    bool done = false;
};

// =============================================================================
// Helper Functions
// =============================================================================

static std::string SecretNameFromInput(TableFunctionBindInput &input) {
    auto secret = input.named_parameters.find("secret");
    if (secret == input.named_parameters.end() || secret->second.IsNull()) {
        return "";
    }
    return secret->second.GetValue<std::string>();
}

static std::unique_ptr<SalesforceConnection> ConnectionFromInput(ClientContext &context, TableFunctionBindInput &input) {
    auto params = ResolveSalesforceParams(context, SecretNameFromInput(input));
    return std::make_unique<SalesforceConnection>(std::move(params));
}

static std::string RequiredStringArgument(TableFunctionBindInput &input, idx_t index, const std::string &name) {
    if (input.inputs.size() <= index || input.inputs[index].IsNull()) {
        throw BinderException("'%s' must not be NULL", name);
    }
    return input.inputs[index].GetValue<std::string>();
}

static SalesforcePayload PayloadFromValue(const Value &value) {
    SalesforcePayload payload;
    for (const auto &entry : MapValue::GetChildren(value)) {
        auto &kv = StructValue::GetChildren(entry);
        if (kv[0].IsNull()) {
            throw BinderException("Payload field names must not be NULL");
        }
        payload[kv[0].ToString()] = kv[1].IsNull() ? "" : kv[1].ToString();
    }
    return payload;
}

static void SetSingleVarcharColumn(const std::string &column_name,
                                   vector<LogicalType> &return_types,
                                   vector<std::string> &names) {
    names = {column_name};
    return_types = {LogicalType::VARCHAR};
}

// =============================================================================
// sf_request
// =============================================================================

unique_ptr<FunctionData> SalesforceFunctions::RequestBind(
    ClientContext &context,
    TableFunctionBindInput &input,
    vector<LogicalType> &return_types,
    vector<std::string> &names) {

    auto method_str = RequiredStringArgument(input, 0, "method");
    auto path = RequiredStringArgument(input, 1, "path");

    std::optional<SalesforcePayload> payload;
    if (input.inputs.size() > 2 && !input.inputs[2].IsNull()) {
        payload = PayloadFromValue(input.inputs[2]);
    }

    SFREST_TRACE_INFO("SF_FUNCTIONS", "sf_request " + method_str + " " + path);

    auto method = HttpMethod::FromString(method_str);
    auto connection = ConnectionFromInput(context, input);
    auto bind_data = make_uniq<SalesforceRowsBindData>();
    bind_data->rows.push_back(connection->Dispatch(method, path, std::move(payload)));

    SetSingleVarcharColumn("content", return_types, names);
    return bind_data;
}

// =============================================================================
// sf_query
// =============================================================================

unique_ptr<FunctionData> SalesforceFunctions::QueryBind(
    ClientContext &context,
    TableFunctionBindInput &input,
    vector<LogicalType> &return_types,
    vector<std::string> &names) {

    auto soql = RequiredStringArgument(input, 0, "soql");

    auto connection = ConnectionFromInput(context, input);
    auto bind_data = make_uniq<SalesforceRowsBindData>();
    bind_data->rows = connection->QueryWithSoql(soql);

    SetSingleVarcharColumn("record", return_types, names);
    return bind_data;
}

// =============================================================================
// sf_show_objects / sf_describe
// =============================================================================

unique_ptr<FunctionData> SalesforceFunctions::ShowObjectsBind(
    ClientContext &context,
    TableFunctionBindInput &input,
    vector<LogicalType> &return_types,
    vector<std::string> &names) {

    auto connection = ConnectionFromInput(context, input);

    auto bind_data = make_uniq<SalesforceRowsBindData>();
    const auto &object_names = connection->SchemaCache().ObjectNames();
    bind_data->rows.assign(object_names.begin(), object_names.end());

    SetSingleVarcharColumn("name", return_types, names);
    return bind_data;
}

unique_ptr<FunctionData> SalesforceFunctions::DescribeBind(
    ClientContext &context,
    TableFunctionBindInput &input,
    vector<LogicalType> &return_types,
    vector<std::string> &names) {

    auto object_name = RequiredStringArgument(input, 0, "object");

    auto connection = ConnectionFromInput(context, input);

    auto &schema_cache = connection->SchemaCache();
    const auto &object_names = schema_cache.ObjectNames();
    if (object_names.find(object_name) == object_names.end()) {
        throw SalesforceUnknownObjectException(object_name);
    }

    auto bind_data = make_uniq<SalesforceRowsBindData>();
    const auto &fields = schema_cache.ObjectFields(object_name);
    bind_data->rows.assign(fields.begin(), fields.end());

    SetSingleVarcharColumn("name", return_types, names);
    return bind_data;
}

// =============================================================================
// Scan
// =============================================================================

void SalesforceFunctions::StringRowsScan(
    ClientContext &context,
    TableFunctionInput &data,
    DataChunk &output) {

    auto &bind_data = data.bind_data->CastNoConst<SalesforceRowsBindData>();

    if (bind_data.done) {
        output.SetCardinality(0);
        return;
    }

    idx_t count = 0;
    while (bind_data.current_idx < bind_data.rows.size() && count < STANDARD_VECTOR_SIZE) {
        output.SetValue(0, count, Value(bind_data.rows[bind_data.current_idx]));
        bind_data.current_idx++;
        count++;
    }

    if (bind_data.current_idx >= bind_data.rows.size()) {
        bind_data.done = true;
    }

    output.SetCardinality(count);
}

// =============================================================================
// Registration
// =============================================================================

TableFunctionSet SalesforceFunctions::CreateRequestFunction() {
    TableFunctionSet function_set("sf_request");

    TableFunction without_payload("sf_request", {LogicalType::VARCHAR, LogicalType::VARCHAR}, StringRowsScan, RequestBind);
    without_payload.named_parameters["secret"] = LogicalType::VARCHAR;
    function_set.AddFunction(without_payload);

    TableFunction with_payload("sf_request", {LogicalType::VARCHAR, LogicalType::VARCHAR,
                                              LogicalType::MAP(LogicalType::VARCHAR, LogicalType::VARCHAR)},
                              StringRowsScan, RequestBind);
    with_payload.named_parameters["secret"] = LogicalType::VARCHAR;
    function_set.AddFunction(with_payload);

    return function_set;
}

TableFunction SalesforceFunctions::CreateQueryFunction() {
    TableFunction query_func("sf_query", {LogicalType::VARCHAR}, StringRowsScan, QueryBind);
    query_func.named_parameters["secret"] = LogicalType::VARCHAR;
    return query_func;
}

TableFunction SalesforceFunctions::CreateShowObjectsFunction() {
    TableFunction show_func("sf_show_objects", {}, StringRowsScan, ShowObjectsBind);
    show_func.named_parameters["secret"] = LogicalType::VARCHAR;
    return show_func;
}

TableFunction SalesforceFunctions::CreateDescribeFunction() {
    TableFunction describe_func("sf_describe", {LogicalType::VARCHAR}, StringRowsScan, DescribeBind);
    describe_func.named_parameters["secret"] = LogicalType::VARCHAR;
    return describe_func;
}

void SalesforceFunctions::Register(ExtensionLoader &loader) {
    SFREST_TRACE_INFO("SF_FUNCTIONS", "Registering Salesforce table functions");

    loader.RegisterFunction(CreateRequestFunction());
    loader.RegisterFunction(CreateQueryFunction());
    loader.RegisterFunction(CreateShowObjectsFunction());
    loader.RegisterFunction(CreateDescribeFunction());
}

} // namespace sfrest
