//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// protocol/commands.cpp
//
// JSON conversion of protocol commands and responses
//===----------------------------------------------------------------------===//

#include "protocol/commands.hpp"

namespace exaconn {

namespace {

template <typename T>
void SetIfPresent(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

template <typename T>
void GetIfPresent(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        it->get_to(out);
    }
}

} // anonymous namespace

//===----------------------------------------------------------------------===//
// Shared types
//===----------------------------------------------------------------------===//

void to_json(json& j, const Attributes& a) {
    j = json::object();
    if (a.autocommit) {
        j["autocommit"] = *a.autocommit;
    }
    if (a.current_schema) {
        j["currentSchema"] = *a.current_schema;
    }
    if (a.query_timeout) {
        j["queryTimeout"] = *a.query_timeout;
    }
    if (a.result_set_max_rows) {
        j["resultSetMaxRows"] = *a.result_set_max_rows;
    }
}

void from_json(const json& j, Attributes& a) {
    SetIfPresent(j, "autocommit", a.autocommit);
    SetIfPresent(j, "currentSchema", a.current_schema);
    SetIfPresent(j, "queryTimeout", a.query_timeout);
    SetIfPresent(j, "resultSetMaxRows", a.result_set_max_rows);
}

void to_json(json& j, const DataType& t) {
    j = json{{"type", t.type}};
    if (t.precision) j["precision"] = *t.precision;
    if (t.scale) j["scale"] = *t.scale;
    if (t.size) j["size"] = *t.size;
    if (t.character_set) j["characterSet"] = *t.character_set;
    if (t.with_local_time_zone) j["withLocalTimeZone"] = *t.with_local_time_zone;
    if (t.fraction) j["fraction"] = *t.fraction;
    if (t.srid) j["srid"] = *t.srid;
}

void from_json(const json& j, DataType& t) {
    j.at("type").get_to(t.type);
    SetIfPresent(j, "precision", t.precision);
    SetIfPresent(j, "scale", t.scale);
    SetIfPresent(j, "size", t.size);
    SetIfPresent(j, "characterSet", t.character_set);
    SetIfPresent(j, "withLocalTimeZone", t.with_local_time_zone);
    SetIfPresent(j, "fraction", t.fraction);
    SetIfPresent(j, "srid", t.srid);
}

void to_json(json& j, const SqlColumn& c) {
    j = json{{"name", c.name}, {"dataType", c.data_type}};
}

void from_json(const json& j, SqlColumn& c) {
    GetIfPresent(j, "name", c.name);
    j.at("dataType").get_to(c.data_type);
}

void from_json(const json& j, ServerException& e) {
    GetIfPresent(j, "text", e.text);
    GetIfPresent(j, "sqlCode", e.sql_code);
}

void from_json(const json& j, ResponseEnvelope& e) {
    j.at("status").get_to(e.status);
    auto data = j.find("responseData");
    e.response_data = data != j.end() ? *data : json();
    auto ex = j.find("exception");
    if (ex != j.end() && !ex->is_null()) {
        e.exception = ex->get<ServerException>();
    }
}

//===----------------------------------------------------------------------===//
// Commands
//===----------------------------------------------------------------------===//

void to_json(json& j, const LoginCommand& c) {
    j = json{{"command", c.command},
             {"protocolVersion", c.protocol_version},
             {"attributes", c.attributes}};
}

void to_json(json& j, const AuthCommand& c) {
    j = json::object();
    if (!c.username.empty()) {
        j["username"] = c.username;
    }
    if (!c.password.empty()) {
        j["password"] = c.password;
    }
    if (!c.access_token.empty()) {
        j["accessToken"] = c.access_token;
    }
    if (!c.refresh_token.empty()) {
        j["refreshToken"] = c.refresh_token;
    }
    j["useCompression"] = c.use_compression;
    j["clientName"] = c.client_name;
    j["driverName"] = c.driver_name;
    j["clientOs"] = c.client_os;
    j["clientOsUsername"] = c.client_os_username;
    j["clientLanguage"] = c.client_language;
    j["clientVersion"] = c.client_version;
    j["clientRuntime"] = c.client_runtime;
    j["attributes"] = c.attributes;
}

void to_json(json& j, const ExecuteCommand& c) {
    j = json{{"command", "execute"},
             {"sqlText", c.sql_text},
             {"attributes", c.attributes}};
}

void to_json(json& j, const CreatePreparedStatementCommand& c) {
    j = json{{"command", "createPreparedStatement"},
             {"sqlText", c.sql_text},
             {"attributes", c.attributes}};
}

void to_json(json& j, const ExecutePreparedStatementCommand& c) {
    j = json{{"command", "executePreparedStatement"},
             {"statementHandle", c.statement_handle},
             {"columns", c.columns},
             {"numColumns", c.num_columns},
             {"numRows", c.num_rows},
             {"attributes", c.attributes}};
    if (!c.data.empty()) {
        j["data"] = c.data;
    }
}

void to_json(json& j, const ClosePreparedStatementCommand& c) {
    j = json{{"command", "closePreparedStatement"},
             {"statementHandle", c.statement_handle}};
}

void to_json(json& j, const FetchCommand& c) {
    j = json{{"command", "fetch"},
             {"resultSetHandle", c.result_set_handle},
             {"startPosition", c.start_position},
             {"numBytes", c.num_bytes}};
}

void to_json(json& j, const CloseResultSetCommand& c) {
    j = json{{"command", "closeResultSet"},
             {"resultSetHandles", c.result_set_handles}};
}

void to_json(json& j, const SetAttributesCommand& c) {
    j = json{{"command", "setAttributes"}, {"attributes", c.attributes}};
}

void to_json(json& j, const DisconnectCommand&) {
    j = json{{"command", "disconnect"}};
}

//===----------------------------------------------------------------------===//
// Responses
//===----------------------------------------------------------------------===//

void from_json(const json& j, PublicKeyResponse& r) {
    j.at("publicKeyPem").get_to(r.public_key_pem);
    GetIfPresent(j, "publicKeyModulus", r.public_key_modulus);
    GetIfPresent(j, "publicKeyExponent", r.public_key_exponent);
}

void from_json(const json& j, AuthResponse& r) {
    GetIfPresent(j, "sessionId", r.session_id);
    GetIfPresent(j, "protocolVersion", r.protocol_version);
    GetIfPresent(j, "releaseVersion", r.release_version);
    GetIfPresent(j, "databaseName", r.database_name);
    GetIfPresent(j, "productName", r.product_name);
    GetIfPresent(j, "maxDataMessageSize", r.max_data_message_size);
    GetIfPresent(j, "maxIdentifierLength", r.max_identifier_length);
    GetIfPresent(j, "maxVarcharLength", r.max_varchar_length);
    GetIfPresent(j, "identifierQuoteString", r.identifier_quote_string);
    GetIfPresent(j, "timeZone", r.time_zone);
    GetIfPresent(j, "timeZoneBehavior", r.time_zone_behavior);
}

void from_json(const json& j, SqlQueriesResponse& r) {
    j.at("numResults").get_to(r.num_results);
    GetIfPresent(j, "results", r.results);
}

void from_json(const json& j, ParameterData& r) {
    GetIfPresent(j, "numColumns", r.num_columns);
    GetIfPresent(j, "columns", r.columns);
}

void from_json(const json& j, CreatePreparedStatementResponse& r) {
    j.at("statementHandle").get_to(r.statement_handle);
    GetIfPresent(j, "parameterData", r.parameter_data);
    GetIfPresent(j, "numResults", r.num_results);
    GetIfPresent(j, "results", r.results);
}

void from_json(const json& j, FetchResponse& r) {
    j.at("numRows").get_to(r.num_rows);
    auto data = j.find("data");
    r.data = data != j.end() && !data->is_null() ? *data : json::array();
}

} // namespace exaconn
