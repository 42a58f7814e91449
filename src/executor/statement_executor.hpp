//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// executor/statement_executor.hpp
//
// Direct and prepared statement execution
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <memory>
#include <vector>
#include "config/connection_config.hpp"
#include "protocol/commands.hpp"
#include "result/result_set.hpp"
#include "result/value.hpp"
#include "session/session.hpp"

namespace exaconn {

struct ExecutorOptions {
    uint32_t fetch_size_kb = DEFAULT_FETCH_SIZE_KB;
    uint64_t result_set_max_rows = 0;  // 0 = unlimited
    std::string import_host;           // empty = local address of the session

    static ExecutorOptions FromConfig(const ConnectionConfig& config) {
        ExecutorOptions options;
        options.fetch_size_kb = config.fetch_size_kb;
        options.result_set_max_rows = config.result_set_max_rows;
        options.import_host = config.import_host;
        return options;
    }
};

// Regroup a flat parameter list into num_columns column-major sequences:
// value i belongs to column i % num_columns. Throws InvalidArgumentError
// when the count is not a multiple of num_columns.
std::vector<std::vector<json>> BindColumnar(const std::vector<Value>& values, size_t num_columns);

// Strip names from positional parameters; named ones are rejected
std::vector<Value> NamedValuesToValues(const std::vector<NamedValue>& args);

// Affected rows of the first result; a result set counts as 0 and its
// cursor is released
int64_t ToRowCount(const SqlQueriesResponse& response, Session* session);

// Rows of the first result; a row count yields an empty sequence
std::unique_ptr<Rows> ToRows(const SqlQueriesResponse& response, Session* session,
                             uint32_t fetch_size_kb);

// Server side parsed statement. Usable while its Session is open; once the
// Session is destroyed every call throws BadConnectionError and
// destruction sends nothing.
class PreparedStatement {
public:
    PreparedStatement(Session* session, const ExecutorOptions& options,
                      int64_t handle, std::vector<SqlColumn> columns);
    ~PreparedStatement();

    // Non-copyable
    PreparedStatement(const PreparedStatement&) = delete;
    PreparedStatement& operator=(const PreparedStatement&) = delete;

    int64_t GetHandle() const { return handle_; }
    const std::vector<SqlColumn>& Columns() const { return columns_; }
    size_t NumInput() const { return columns_.size(); }

    // One executePreparedStatement; values.size() / NumInput() rows
    SqlQueriesResponse Execute(const std::vector<Value>& values);

    std::unique_ptr<Rows> Query(const std::vector<Value>& values);
    int64_t Exec(const std::vector<Value>& values);

    std::unique_ptr<Rows> QueryNamed(const std::vector<NamedValue>& args);
    int64_t ExecNamed(const std::vector<NamedValue>& args);

    // Release the server handle. Throws BadConnectionError when the
    // session is closed already; closing twice is a no-op.
    void Close();

    bool IsClosed() const { return closed_; }

private:
    SessionRef session_;
    ExecutorOptions options_;
    int64_t handle_;
    std::vector<SqlColumn> columns_;
    bool closed_ = false;
};

class StatementExecutor {
public:
    StatementExecutor(Session& session, ExecutorOptions options);

    // Direct execute; IMPORT ... FROM LOCAL CSV goes through the local
    // import bridge
    SqlQueriesResponse Execute(const std::string& sql);

    std::unique_ptr<PreparedStatement> Prepare(const std::string& sql);

    // Direct execute without arguments, prepare-execute-close otherwise
    std::unique_ptr<Rows> Query(const std::string& sql, const std::vector<Value>& args = {});
    int64_t Exec(const std::string& sql, const std::vector<Value>& args = {});

    const ExecutorOptions& GetOptions() const { return options_; }

private:
    SqlQueriesResponse ExecuteDirect(const std::string& sql);
    SqlQueriesResponse ExecuteImport(const std::string& sql);

private:
    Session& session_;
    ExecutorOptions options_;
};

} // namespace exaconn
