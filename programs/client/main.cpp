//===----------------------------------------------------------------------===//
//                         ExaConn CLI
//
// programs/client/main.cpp
//
// Interactive SQL shell over the Exasol WebSocket protocol.
//
// Usage:
//   exaconn-cli "exa:db1..3:8563;user=sys;password=exasol"
//   exaconn-cli -c connection.yaml
//   exaconn-cli -h 10.0.0.11..13 -u sys -P exasol --no-cert-check
//
// Statements are terminated with ';'. IMPORT ... FROM LOCAL CSV FILE
// statements upload the named local files.
//===----------------------------------------------------------------------===//

#include "client/connection.hpp"
#include "config/connection_config.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <iostream>
#include <string>

#include <readline/readline.h>
#include <readline/history.h>

using namespace exaconn;

static std::string Trim(const std::string &s) {
    auto b = s.find_first_not_of(" \t\n\r");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\n\r");
    return s.substr(b, e - b + 1);
}

static void PrintHelp() {
    std::cout <<
        "\nExaConn CLI\n"
        "\nMeta commands:\n"
        "  .help           Show this message\n"
        "  .quit / .exit   Exit the shell\n"
        "  .tables         List tables visible to the current user\n"
        "  .schema TABLE   Show column info for TABLE\n"
        "  .begin          Start a transaction (autocommit off)\n"
        "  .commit         Commit the transaction\n"
        "  .rollback       Roll the transaction back\n"
        "\nSQL tips:\n"
        "  Terminate statements with ';'\n"
        "  IMPORT INTO t FROM LOCAL CSV FILE '/path/data.csv'; uploads a local file\n\n";
}

static void PrintRows(Rows &rows) {
    const auto &columns = rows.Columns();
    if (columns.empty()) {
        std::cout << "OK\n\n";
        return;
    }

    // header
    std::cout << "\n";
    for (size_t c = 0; c < columns.size(); c++) {
        if (c) std::cout << "\t";
        std::cout << columns[c].name;
    }
    std::cout << "\n";
    for (size_t c = 0; c < columns.size(); c++) {
        if (c) std::cout << "\t";
        std::cout << std::string(columns[c].name.size(), '-');
    }
    std::cout << "\n";

    Row row;
    int64_t count = 0;
    while (rows.Next(row)) {
        for (size_t c = 0; c < row.Size(); c++) {
            if (c) std::cout << "\t";
            try {
                std::cout << row.Get(c).ToString();
            } catch (const MalformedDataError &) {
                std::cout << row.GetRaw(c).dump();
            }
        }
        std::cout << "\n";
        count++;
    }
    std::cout << "(" << count << " row" << (count != 1 ? "s" : "") << ")\n\n";
}

static bool IsQueryStatement(const std::string &sql) {
    std::string low = Trim(sql);
    std::transform(low.begin(), low.end(), low.begin(), ::tolower);
    return low.rfind("select", 0) == 0 || low.rfind("with", 0) == 0 ||
           low.rfind("describe", 0) == 0 || low.rfind("values", 0) == 0;
}

static void RunStatement(Connection &conn, const std::string &sql) {
    if (IsQueryStatement(sql)) {
        auto rows = conn.Query(sql);
        PrintRows(*rows);
    } else {
        auto affected = conn.Exec(sql);
        std::cout << affected << " row" << (affected != 1 ? "s" : "") << " affected\n\n";
    }
}

// Returns false when the shell should exit
static bool RunMeta(Connection &conn, const std::string &line) {
    std::string low = Trim(line);
    std::transform(low.begin(), low.end(), low.begin(), ::tolower);

    if (low == ".quit" || low == ".exit" || low == ".q") {
        return false;
    }
    if (low == ".help" || low == ".h") {
        PrintHelp();
    } else if (low == ".tables") {
        auto rows = conn.Query(
            "SELECT TABLE_SCHEMA, TABLE_NAME FROM EXA_ALL_TABLES ORDER BY TABLE_SCHEMA, TABLE_NAME");
        PrintRows(*rows);
    } else if (low.substr(0, 7) == ".schema") {
        std::string table = Trim(Trim(line).substr(7));
        if (table.empty()) {
            std::cerr << "Usage: .schema TABLENAME\n";
        } else {
            std::transform(table.begin(), table.end(), table.begin(), ::toupper);
            auto rows = conn.Query(
                "SELECT COLUMN_NAME, COLUMN_TYPE, COLUMN_IS_NULLABLE FROM EXA_ALL_COLUMNS"
                " WHERE COLUMN_TABLE = ? ORDER BY COLUMN_ORDINAL_POSITION",
                {Value(table)});
            PrintRows(*rows);
        }
    } else if (low == ".begin") {
        conn.Begin();
    } else if (low == ".commit") {
        conn.Commit();
    } else if (low == ".rollback") {
        conn.Rollback();
    } else {
        std::cerr << "Unknown command " << line << ", try .help\n";
    }
    return true;
}

int main(int argc, char *argv[]) {
    bool show_version = false;
    ConnectionConfig config = ParseCommandLine(argc, argv, show_version);
    if (show_version) {
        std::cout << "exaconn-cli " << DRIVER_VERSION << " (protocol version "
                  << PROTOCOL_VERSION << ")\n";
        return 0;
    }

    Logger::Initialize(config.log_file, config.log_level);

    std::unique_ptr<Connection> conn;
    try {
        conn = Connection::Open(config);
    } catch (const Error &e) {
        std::cerr << "Failed to connect to " << config.host << ":" << config.port << ":\n"
                  << e.what() << "\n";
        return 1;
    }

    const auto &info = conn->GetSession().GetInfo();
    std::cout << "ExaConn CLI - connected to " << conn->GetSession().GetHost() << ":" << config.port
              << " (" << info.product_name << " " << info.release_version
              << ", session " << info.session_id << ")\n"
                 "Enter SQL followed by ';'  |  .help for tips  |  .quit to exit\n\n";

    using_history();

    std::string buf;
    bool multiline = false;

    while (true) {
        const char *prompt = multiline ? "   ...> " : "exa> ";
        char *raw = readline(prompt);
        if (!raw) { std::cout << "\nBye!\n"; break; }

        std::string line(raw);
        free(raw);

        if (Trim(line).empty()) continue;
        add_history(line.c_str());

        try {
            // Meta commands (only at start of a fresh statement)
            if (!multiline && Trim(line)[0] == '.') {
                if (!RunMeta(*conn, line)) {
                    std::cout << "Bye!\n";
                    break;
                }
                continue;
            }

            buf += (multiline ? "\n" : "") + line;

            if (Trim(buf).back() != ';') { multiline = true; continue; }
            multiline = false;

            std::string sql = Trim(buf);
            buf.clear();
            sql.pop_back();
            RunStatement(*conn, sql);
        } catch (const BadConnectionError &e) {
            std::cerr << "Error: " << e.what() << "\nConnection lost.\n";
            return 1;
        } catch (const Error &e) {
            std::cerr << "Error: " << e.what() << "\n";
        }
    }

    conn->Close();
    Logger::Shutdown();
    return 0;
}
