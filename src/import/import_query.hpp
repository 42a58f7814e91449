//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// import/import_query.hpp
//
// Detection and rewriting of IMPORT ... FROM LOCAL CSV statements
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace exaconn {

// True for "IMPORT ... FROM LOCAL CSV ..." (keywords case-insensitive)
bool IsImportQuery(const std::string& query);

// Quoted paths following each FILE keyword, in statement order.
// Throws InvalidArgumentError when there is none.
std::vector<std::string> GetFilePaths(const std::string& query);

// Open a local file for binary reading.
// Throws InvalidArgumentError "file '<path>' not found".
std::ifstream OpenFile(const std::string& path);

// Separator named by ROW SEPARATOR = 'LF' | 'CR' | 'CRLF', "\n" otherwise
std::string GetRowSeparator(const std::string& query);

// Point the statement at http://<host>:<port> ("[<host>]" for IPv6
// literals) and collapse all FILE clauses into a single FILE 'data.csv'.
// Other clauses are untouched.
std::string UpdateImportQuery(const std::string& query, const std::string& host, uint16_t port);

} // namespace exaconn
