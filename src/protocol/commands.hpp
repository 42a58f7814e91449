//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// protocol/commands.hpp
//
// JSON command and response definitions of the WebSocket protocol
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace exaconn {

using json = nlohmann::json;

//===----------------------------------------------------------------------===//
// Shared types
//===----------------------------------------------------------------------===//

// Session attributes; only fields that are set are serialized
struct Attributes {
    std::optional<bool> autocommit;
    std::optional<std::string> current_schema;
    std::optional<uint32_t> query_timeout;
    std::optional<uint64_t> result_set_max_rows;
};

struct DataType {
    std::string type;
    std::optional<int64_t> precision;
    std::optional<int64_t> scale;
    std::optional<int64_t> size;
    std::optional<std::string> character_set;
    std::optional<bool> with_local_time_zone;
    std::optional<int64_t> fraction;
    std::optional<int64_t> srid;
};

struct SqlColumn {
    std::string name;
    DataType data_type;
};

struct ServerException {
    std::string text;
    std::string sql_code;
};

struct ResponseEnvelope {
    std::string status;
    json response_data;  // null when absent
    std::optional<ServerException> exception;
};

//===----------------------------------------------------------------------===//
// Commands
//===----------------------------------------------------------------------===//

struct LoginCommand {
    std::string command = "login";  // or "loginToken"
    int protocol_version = 0;
    Attributes attributes;
};

struct AuthCommand {
    std::string username;
    std::string password;      // RSA encrypted, base64
    std::string access_token;
    std::string refresh_token;
    bool use_compression = false;
    std::string client_name;
    std::string driver_name;
    std::string client_os;
    std::string client_os_username;
    std::string client_language;
    std::string client_version;
    std::string client_runtime;
    Attributes attributes;
};

struct ExecuteCommand {
    std::string sql_text;
    Attributes attributes;
};

struct CreatePreparedStatementCommand {
    std::string sql_text;
    Attributes attributes;
};

struct ExecutePreparedStatementCommand {
    int64_t statement_handle = 0;
    std::vector<SqlColumn> columns;
    int64_t num_columns = 0;
    int64_t num_rows = 0;
    std::vector<std::vector<json>> data;  // column-major
    Attributes attributes;
};

struct ClosePreparedStatementCommand {
    int64_t statement_handle = 0;
};

struct FetchCommand {
    int64_t result_set_handle = 0;
    int64_t start_position = 0;
    int64_t num_bytes = 0;
};

struct CloseResultSetCommand {
    std::vector<int64_t> result_set_handles;
};

struct SetAttributesCommand {
    Attributes attributes;
};

struct DisconnectCommand {};

//===----------------------------------------------------------------------===//
// Responses
//
// NAME identifies the type in decode errors.
//===----------------------------------------------------------------------===//

struct PublicKeyResponse {
    static constexpr const char* NAME = "PublicKeyResponse";

    std::string public_key_pem;
    std::string public_key_modulus;
    std::string public_key_exponent;
};

struct AuthResponse {
    static constexpr const char* NAME = "AuthResponse";

    int64_t session_id = 0;
    int protocol_version = 0;
    std::string release_version;
    std::string database_name;
    std::string product_name;
    int64_t max_data_message_size = 0;
    int64_t max_identifier_length = 0;
    int64_t max_varchar_length = 0;
    std::string identifier_quote_string;
    std::string time_zone;
    std::string time_zone_behavior;
};

struct SqlQueriesResponse {
    static constexpr const char* NAME = "SqlQueriesResponse";

    int64_t num_results = 0;
    std::vector<json> results;
};

struct ParameterData {
    int64_t num_columns = 0;
    std::vector<SqlColumn> columns;
};

struct CreatePreparedStatementResponse {
    static constexpr const char* NAME = "CreatePreparedStatementResponse";

    int64_t statement_handle = 0;
    ParameterData parameter_data;
    int64_t num_results = 0;
    std::vector<json> results;
};

struct FetchResponse {
    static constexpr const char* NAME = "FetchResponse";

    int64_t num_rows = 0;
    json data;  // column-major
};

//===----------------------------------------------------------------------===//
// JSON conversion
//===----------------------------------------------------------------------===//

void to_json(json& j, const Attributes& a);
void from_json(const json& j, Attributes& a);
void to_json(json& j, const DataType& t);
void from_json(const json& j, DataType& t);
void to_json(json& j, const SqlColumn& c);
void from_json(const json& j, SqlColumn& c);
void from_json(const json& j, ServerException& e);
void from_json(const json& j, ResponseEnvelope& e);

void to_json(json& j, const LoginCommand& c);
void to_json(json& j, const AuthCommand& c);
void to_json(json& j, const ExecuteCommand& c);
void to_json(json& j, const CreatePreparedStatementCommand& c);
void to_json(json& j, const ExecutePreparedStatementCommand& c);
void to_json(json& j, const ClosePreparedStatementCommand& c);
void to_json(json& j, const FetchCommand& c);
void to_json(json& j, const CloseResultSetCommand& c);
void to_json(json& j, const SetAttributesCommand& c);
void to_json(json& j, const DisconnectCommand& c);

void from_json(const json& j, PublicKeyResponse& r);
void from_json(const json& j, AuthResponse& r);
void from_json(const json& j, SqlQueriesResponse& r);
void from_json(const json& j, ParameterData& r);
void from_json(const json& j, CreatePreparedStatementResponse& r);
void from_json(const json& j, FetchResponse& r);

} // namespace exaconn
