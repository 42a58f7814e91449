//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// errors.cpp
//===----------------------------------------------------------------------===//

#include "errors.hpp"

namespace exaconn {

ServerError::ServerError(const std::string& sql_code, const std::string& text)
    : Error(error_code::SERVER_EXCEPTION,
            "execution failed with SQL error code '" + sql_code + "' and message '" + text + "'")
    , sql_code_(sql_code)
    , text_(text) {}

} // namespace exaconn
