#pragma once

#include "duckdb.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace sfrest {

// Salesforce REST table functions
class SalesforceFunctions {
public:
    static void Register(duckdb::ExtensionLoader &loader);

    static duckdb::TableFunctionSet CreateRequestFunction();
    static duckdb::TableFunction CreateQueryFunction();
    static duckdb::TableFunction CreateShowObjectsFunction();
    static duckdb::TableFunction CreateDescribeFunction();

private:
    // sf_request(method, path [, payload], secret := ...) - raw API call
    static duckdb::unique_ptr<duckdb::FunctionData> RequestBind(
        duckdb::ClientContext &context,
        duckdb::TableFunctionBindInput &input,
        duckdb::vector<duckdb::LogicalType> &return_types,
        duckdb::vector<std::string> &names);

    // sf_query(soql, secret := ...) - one row per record
    static duckdb::unique_ptr<duckdb::FunctionData> QueryBind(
        duckdb::ClientContext &context,
        duckdb::TableFunctionBindInput &input,
        duckdb::vector<duckdb::LogicalType> &return_types,
        duckdb::vector<std::string> &names);

    // sf_show_objects(secret := ...) - object names of the org
    static duckdb::unique_ptr<duckdb::FunctionData> ShowObjectsBind(
        duckdb::ClientContext &context,
        duckdb::TableFunctionBindInput &input,
        duckdb::vector<duckdb::LogicalType> &return_types,
        duckdb::vector<std::string> &names);

    // sf_describe(object, secret := ...) - field names of one object
    static duckdb::unique_ptr<duckdb::FunctionData> DescribeBind(
        duckdb::ClientContext &context,
        duckdb::TableFunctionBindInput &input,
        duckdb::vector<duckdb::LogicalType> &return_types,
        duckdb::vector<std::string> &names);

    static void StringRowsScan(
        duckdb::ClientContext &context,
        duckdb::TableFunctionInput &data,
        duckdb::DataChunk &output);
};

} // namespace sfrest
