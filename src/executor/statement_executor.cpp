//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// executor/statement_executor.cpp
//
// Direct and prepared statement execution
//===----------------------------------------------------------------------===//

#include "executor/statement_executor.hpp"
#include "import/import_query.hpp"
#include "import/import_server.hpp"
#include "session/session.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"

namespace exaconn {

namespace {

Attributes ExecuteAttributes(const ExecutorOptions& options) {
    Attributes attributes;
    if (options.result_set_max_rows > 0) {
        attributes.result_set_max_rows = options.result_set_max_rows;
    }
    return attributes;
}

const json& FirstResult(const SqlQueriesResponse& response) {
    if (response.num_results == 0 || response.results.empty()) {
        throw MalformedDataError("response contains no result");
    }
    return response.results.front();
}

} // anonymous namespace

//===----------------------------------------------------------------------===//
// Binding and result helpers
//===----------------------------------------------------------------------===//

std::vector<std::vector<json>> BindColumnar(const std::vector<Value>& values, size_t num_columns) {
    if (num_columns == 0) {
        if (!values.empty()) {
            throw InvalidArgumentError(error_code::INVALID_VALUES_COUNT,
                "invalid value count " + std::to_string(values.size()) +
                " for a statement without parameters");
        }
        return {};
    }
    if (values.size() % num_columns != 0) {
        throw InvalidArgumentError(error_code::INVALID_VALUES_COUNT,
            "invalid value count " + std::to_string(values.size()) +
            ", expected a multiple of " + std::to_string(num_columns));
    }

    std::vector<std::vector<json>> data(num_columns);
    for (auto& column : data) {
        column.reserve(values.size() / num_columns);
    }
    for (size_t i = 0; i < values.size(); i++) {
        data[i % num_columns].push_back(values[i].ToJson());
    }
    return data;
}

std::vector<Value> NamedValuesToValues(const std::vector<NamedValue>& args) {
    std::vector<Value> values;
    values.reserve(args.size());
    for (const auto& arg : args) {
        if (!arg.name.empty()) {
            throw InvalidArgumentError(error_code::NAMED_PARAMETERS,
                                       "named parameters not supported");
        }
        values.push_back(arg.value);
    }
    return values;
}

int64_t ToRowCount(const SqlQueriesResponse& response, Session* session) {
    auto result = DecodeResult(FirstResult(response));
    if (auto* count = std::get_if<RowCountResult>(&result)) {
        return count->row_count;
    }

    // A result set has no affected rows; release its cursor
    auto& data = std::get<ResultSetResult>(result).result_set;
    if (data.result_set_handle && session && !session->IsClosed()) {
        CloseResultSetCommand command;
        command.result_set_handles.push_back(*data.result_set_handle);
        session->Send(command, nullptr);
    }
    return 0;
}

std::unique_ptr<Rows> ToRows(const SqlQueriesResponse& response, Session* session,
                             uint32_t fetch_size_kb) {
    auto result = DecodeResult(FirstResult(response));
    if (std::holds_alternative<RowCountResult>(result)) {
        return std::make_unique<Rows>();
    }
    return std::make_unique<Rows>(session, std::move(std::get<ResultSetResult>(result).result_set),
                                  fetch_size_kb);
}

//===----------------------------------------------------------------------===//
// PreparedStatement
//===----------------------------------------------------------------------===//

PreparedStatement::PreparedStatement(Session* session, const ExecutorOptions& options,
                                     int64_t handle, std::vector<SqlColumn> columns)
    : session_(session)
    , options_(options)
    , handle_(handle)
    , columns_(std::move(columns)) {
}

PreparedStatement::~PreparedStatement() {
    Session* session = session_.Get();
    if (closed_ || !session || session->IsClosed()) {
        return;
    }
    try {
        Close();
    } catch (const Error& e) {
        ELOG_WARN("executor", "Failed to close prepared statement {}: {}", handle_, e.what());
    }
}

SqlQueriesResponse PreparedStatement::Execute(const std::vector<Value>& values) {
    Session* session = session_.Get();
    if (!session) {
        throw BadConnectionError();
    }
    auto data = BindColumnar(values, columns_.size());

    ExecutePreparedStatementCommand command;
    command.statement_handle = handle_;
    command.columns = columns_;
    command.num_columns = static_cast<int64_t>(columns_.size());
    command.num_rows = data.empty() ? 0 : static_cast<int64_t>(data.front().size());
    command.data = std::move(data);
    command.attributes = ExecuteAttributes(options_);

    ELOG_DEBUG("executor", "Executing prepared statement {} with {} row(s)",
               handle_, command.num_rows);

    SqlQueriesResponse response;
    session->Send(command, &response);
    if (response.num_results == 0) {
        throw MalformedDataError("prepared statement " + std::to_string(handle_) +
                                 " returned no result");
    }
    return response;
}

std::unique_ptr<Rows> PreparedStatement::Query(const std::vector<Value>& values) {
    auto response = Execute(values);
    return ToRows(response, session_.Get(), options_.fetch_size_kb);
}

int64_t PreparedStatement::Exec(const std::vector<Value>& values) {
    auto response = Execute(values);
    return ToRowCount(response, session_.Get());
}

std::unique_ptr<Rows> PreparedStatement::QueryNamed(const std::vector<NamedValue>& args) {
    return Query(NamedValuesToValues(args));
}

int64_t PreparedStatement::ExecNamed(const std::vector<NamedValue>& args) {
    return Exec(NamedValuesToValues(args));
}

void PreparedStatement::Close() {
    if (closed_) {
        return;
    }
    Session* session = session_.Get();
    if (!session || session->IsClosed()) {
        closed_ = true;
        throw BadConnectionError();
    }
    closed_ = true;

    ClosePreparedStatementCommand command;
    command.statement_handle = handle_;
    session->Send(command, nullptr);
}

//===----------------------------------------------------------------------===//
// StatementExecutor
//===----------------------------------------------------------------------===//

StatementExecutor::StatementExecutor(Session& session, ExecutorOptions options)
    : session_(session)
    , options_(std::move(options)) {
}

SqlQueriesResponse StatementExecutor::Execute(const std::string& sql) {
    if (IsImportQuery(sql)) {
        return ExecuteImport(sql);
    }
    return ExecuteDirect(sql);
}

SqlQueriesResponse StatementExecutor::ExecuteDirect(const std::string& sql) {
    ExecuteCommand command;
    command.sql_text = sql;
    command.attributes = ExecuteAttributes(options_);

    SqlQueriesResponse response;
    session_.Send(command, &response);
    return response;
}

SqlQueriesResponse StatementExecutor::ExecuteImport(const std::string& sql) {
    auto paths = GetFilePaths(sql);

    // Files are opened and the port is bound before anything is sent
    std::string host = options_.import_host.empty() ? session_.GetLocalAddress()
                                                    : options_.import_host;
    ImportServer server(paths, GetRowSeparator(sql), host);
    server.Start();

    auto rewritten = UpdateImportQuery(sql, host, server.Port());
    ELOG_DEBUG("executor", "Import of {} file(s) rewritten to: {}", paths.size(), rewritten);
    return ExecuteDirect(rewritten);
}

std::unique_ptr<PreparedStatement> StatementExecutor::Prepare(const std::string& sql) {
    CreatePreparedStatementCommand command;
    command.sql_text = sql;

    CreatePreparedStatementResponse response;
    session_.Send(command, &response);

    ELOG_DEBUG("executor", "Prepared statement {} with {} parameter(s)",
               response.statement_handle, response.parameter_data.columns.size());
    return std::make_unique<PreparedStatement>(&session_, options_, response.statement_handle,
                                               std::move(response.parameter_data.columns));
}

std::unique_ptr<Rows> StatementExecutor::Query(const std::string& sql, const std::vector<Value>& args) {
    if (args.empty()) {
        return ToRows(Execute(sql), &session_, options_.fetch_size_kb);
    }
    auto statement = Prepare(sql);
    auto rows = statement->Query(args);
    statement->Close();
    return rows;
}

int64_t StatementExecutor::Exec(const std::string& sql, const std::vector<Value>& args) {
    if (args.empty()) {
        return ToRowCount(Execute(sql), &session_);
    }
    auto statement = Prepare(sql);
    auto count = statement->Exec(args);
    statement->Close();
    return count;
}

} // namespace exaconn
