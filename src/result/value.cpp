//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// result/value.cpp
//===----------------------------------------------------------------------===//

#include "result/value.hpp"
#include <sstream>

namespace exaconn {

json Value::ToJson() const {
    return std::visit([](const auto& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else {
            return v;
        }
    }, data_);
}

std::string Value::ToString() const {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream out;
            out.precision(15);
            out << v;
            return out.str();
        } else {
            return std::to_string(v);
        }
    }, data_);
}

} // namespace exaconn
