//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// client/connection.hpp
//
// SQL connection: open, prepare, query, exec, transactions
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <memory>
#include <vector>
#include "config/connection_config.hpp"
#include "executor/statement_executor.hpp"
#include "network/websocket.hpp"
#include "result/result_set.hpp"
#include "session/session.hpp"

namespace exaconn {

class Connection {
public:
    // Parse the DSN, connect and log in. Throws InvalidArgumentError for a
    // bad DSN and ConnectionError when no host accepts the login.
    static std::unique_ptr<Connection> Open(const std::string& dsn);
    static std::unique_ptr<Connection> Open(const ConnectionConfig& config,
                                            WebSocketFactory factory = DefaultWebSocketFactory());

    ~Connection();

    // Non-copyable
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Statements and rows refer to this connection's session and release
    // their server handles on destruction: destroy them before the
    // Connection.
    std::unique_ptr<PreparedStatement> Prepare(const std::string& sql);
    std::unique_ptr<Rows> Query(const std::string& sql, const std::vector<Value>& args = {});
    int64_t Exec(const std::string& sql, const std::vector<Value>& args = {});

    // Transactions switch autocommit off until Commit or Rollback. A failed
    // COMMIT or ROLLBACK still ends the transaction and restores autocommit.
    void Begin();
    void Commit();
    void Rollback();
    bool InTransaction() const { return in_transaction_; }

    // Send disconnect and close the transport, idempotent
    void Close();

    // Abort the statement in flight; the connection is closed afterwards
    void Cancel();

    bool IsClosed() const { return !session_ || session_->IsClosed(); }

    Session& GetSession() { return *session_; }
    const ConnectionConfig& GetConfig() const { return config_; }

private:
    Connection(ConnectionConfig config, Session::Ptr session);

    void CheckOpen() const;
    void SetAutocommit(bool enabled);
    void EndTransaction(const std::string& statement);

private:
    ConnectionConfig config_;
    Session::Ptr session_;
    StatementExecutor executor_;
    bool in_transaction_ = false;
};

} // namespace exaconn
