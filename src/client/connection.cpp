//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// client/connection.cpp
//===----------------------------------------------------------------------===//

#include "client/connection.hpp"
#include "session/connector.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"

namespace exaconn {

std::unique_ptr<Connection> Connection::Open(const std::string& dsn) {
    return Open(ConfigFromDsn(dsn));
}

std::unique_ptr<Connection> Connection::Open(const ConnectionConfig& config, WebSocketFactory factory) {
    std::string error;
    if (!config.Validate(error)) {
        throw InvalidArgumentError(error_code::INVALID_CONFIG, error);
    }

    Connector connector(config, std::move(factory));
    auto session = connector.Connect();
    return std::unique_ptr<Connection>(new Connection(config, std::move(session)));
}

Connection::Connection(ConnectionConfig config, Session::Ptr session)
    : config_(std::move(config))
    , session_(std::move(session))
    , executor_(*session_, ExecutorOptions::FromConfig(config_)) {
}

Connection::~Connection() {
    Close();
}

std::unique_ptr<PreparedStatement> Connection::Prepare(const std::string& sql) {
    CheckOpen();
    return executor_.Prepare(sql);
}

std::unique_ptr<Rows> Connection::Query(const std::string& sql, const std::vector<Value>& args) {
    CheckOpen();
    return executor_.Query(sql, args);
}

int64_t Connection::Exec(const std::string& sql, const std::vector<Value>& args) {
    CheckOpen();
    return executor_.Exec(sql, args);
}

void Connection::Begin() {
    CheckOpen();
    if (in_transaction_) {
        throw InvalidArgumentError(error_code::INVALID_TRANSACTION, "transaction already started");
    }
    SetAutocommit(false);
    in_transaction_ = true;
    LOG_DEBUG("connection", "Transaction started");
}

void Connection::Commit() {
    EndTransaction("COMMIT");
}

void Connection::Rollback() {
    EndTransaction("ROLLBACK");
}

void Connection::EndTransaction(const std::string& statement) {
    CheckOpen();
    if (!in_transaction_) {
        throw InvalidArgumentError(error_code::INVALID_TRANSACTION, "no transaction in progress");
    }
    in_transaction_ = false;
    try {
        executor_.Execute(statement);
    } catch (const ServerError& e) {
        // The transaction is over either way; leave the server in the
        // configured autocommit mode
        ELOG_WARN("connection", "{} failed: {}", statement, e.what());
        SetAutocommit(config_.autocommit);
        throw;
    }
    SetAutocommit(config_.autocommit);
    ELOG_DEBUG("connection", "Transaction finished with {}", statement);
}

void Connection::SetAutocommit(bool enabled) {
    SetAttributesCommand command;
    command.attributes.autocommit = enabled;
    session_->Send(command, nullptr);
}

void Connection::Close() {
    if (!session_ || session_->IsClosed()) {
        return;
    }
    session_->Close();
}

void Connection::Cancel() {
    if (session_) {
        session_->Cancel();
    }
}

void Connection::CheckOpen() const {
    if (IsClosed()) {
        throw BadConnectionError();
    }
}

} // namespace exaconn
