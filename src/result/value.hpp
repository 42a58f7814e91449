//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// result/value.hpp
//
// Parameter and cell values
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/commands.hpp"
#include <cstdint>
#include <string>
#include <variant>

namespace exaconn {

class Value {
public:
    using Storage = std::variant<std::monostate, bool, int64_t, double, std::string>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool v) : data_(v) {}
    Value(int v) : data_(static_cast<int64_t>(v)) {}
    Value(int64_t v) : data_(v) {}
    Value(double v) : data_(v) {}
    Value(std::string v) : data_(std::move(v)) {}
    Value(const char* v) : data_(std::string(v)) {}

    bool IsNull() const { return std::holds_alternative<std::monostate>(data_); }

    template <typename T>
    bool Is() const { return std::holds_alternative<T>(data_); }

    // Throws std::bad_variant_access on a type mismatch
    template <typename T>
    const T& Get() const { return std::get<T>(data_); }

    const Storage& GetStorage() const { return data_; }

    // Wire representation
    json ToJson() const;

    // Text representation, "NULL" for null
    std::string ToString() const;

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return data_ != other.data_; }

private:
    Storage data_;
};

// Parameter with an optional name; named parameters are rejected
struct NamedValue {
    std::string name;
    int ordinal = 0;
    Value value;
};

} // namespace exaconn
