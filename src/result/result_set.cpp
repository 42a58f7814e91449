//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// result/result_set.cpp
//
// Result decoding, cell conversion and paging
//===----------------------------------------------------------------------===//

#include "result/result_set.hpp"
#include "session/session.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace exaconn {

namespace {

constexpr int64_t MAX_INTEGER_PRECISION = 18;

ResultSetData ParseResultSet(const json& j) {
    ResultSetData data;
    auto handle = j.find("resultSetHandle");
    if (handle != j.end() && !handle->is_null()) {
        data.result_set_handle = handle->get<int64_t>();
    }
    j.at("numColumns").get_to(data.num_columns);
    j.at("numRows").get_to(data.num_rows);
    data.num_rows_in_message = j.value("numRowsInMessage", data.num_rows);
    j.at("columns").get_to(data.columns);
    auto rows = j.find("data");
    data.data = rows != j.end() && !rows->is_null() ? *rows : json::array();
    return data;
}

[[noreturn]] void ThrowCellError(const SqlColumn& column, const json& cell) {
    throw MalformedDataError("cannot convert value '" + cell.dump() + "' of column '" +
                             column.name + "' to " + column.data_type.type);
}

Value ToInteger(const SqlColumn& column, const json& cell) {
    if (cell.is_number_integer()) {
        return Value(cell.get<int64_t>());
    }
    if (cell.is_number_float()) {
        double d = cell.get<double>();
        if (std::trunc(d) == d && std::fabs(d) < 9.2e18) {
            return Value(static_cast<int64_t>(d));
        }
        ThrowCellError(column, cell);
    }
    if (cell.is_string()) {
        const auto& text = cell.get_ref<const std::string&>();
        try {
            size_t consumed = 0;
            int64_t v = std::stoll(text, &consumed);
            if (consumed == text.size()) {
                return Value(v);
            }
        } catch (const std::logic_error&) {
        }
    }
    ThrowCellError(column, cell);
}

Value ToDouble(const SqlColumn& column, const json& cell) {
    if (cell.is_number()) {
        return Value(cell.get<double>());
    }
    if (cell.is_string()) {
        const auto& text = cell.get_ref<const std::string&>();
        try {
            size_t consumed = 0;
            double v = std::stod(text, &consumed);
            if (consumed == text.size()) {
                return Value(v);
            }
        } catch (const std::logic_error&) {
        }
    }
    ThrowCellError(column, cell);
}

} // anonymous namespace

//===----------------------------------------------------------------------===//
// DecodeResult
//===----------------------------------------------------------------------===//

QueryResult DecodeResult(const json& result) {
    if (!result.is_object()) {
        throw MalformedDataError("unexpected result '" + result.dump() + "'");
    }

    auto type = result.find("resultType");
    bool is_row_count = type != result.end() && type->is_string() &&
                        type->get_ref<const std::string&>() == "rowCount";
    if (is_row_count) {
        auto count = result.find("rowCount");
        if (count != result.end() && count->is_number_integer()) {
            return RowCountResult{count->get<int64_t>()};
        }
    }

    auto result_set = result.find("resultSet");
    if (result_set == result.end() || !result_set->is_object()) {
        throw MalformedDataError("result is neither a row count nor a result set: '" +
                                 result.dump() + "'");
    }

    ResultSetResult decoded;
    try {
        decoded.result_set = ParseResultSet(*result_set);
    } catch (const json::exception& e) {
        throw MalformedDataError("failed to parse result set '" + result_set->dump() +
                                 "': " + e.what());
    }
    if (static_cast<int64_t>(decoded.result_set.columns.size()) != decoded.result_set.num_columns) {
        throw MalformedDataError("result set declares " +
                                 std::to_string(decoded.result_set.num_columns) +
                                 " columns but describes " +
                                 std::to_string(decoded.result_set.columns.size()));
    }
    return decoded;
}

//===----------------------------------------------------------------------===//
// Row
//===----------------------------------------------------------------------===//

const json& Row::GetRaw(size_t index) const {
    if (index >= cells_.size()) {
        throw InvalidArgumentError(error_code::INVALID_COLUMN_INDEX,
                                   "column index " + std::to_string(index) + " out of range");
    }
    return cells_[index];
}

const SqlColumn& Row::Column(size_t index) const {
    if (!columns_ || index >= columns_->size()) {
        throw InvalidArgumentError(error_code::INVALID_COLUMN_INDEX,
                                   "column index " + std::to_string(index) + " out of range");
    }
    return (*columns_)[index];
}

Value Row::Get(size_t index) const {
    const auto& cell = GetRaw(index);
    const auto& column = Column(index);
    if (cell.is_null()) {
        return Value();
    }

    const auto& type = column.data_type;
    if (type.type == "DECIMAL") {
        int64_t scale = type.scale.value_or(0);
        int64_t precision = type.precision.value_or(MAX_INTEGER_PRECISION);
        if (scale == 0 && precision <= MAX_INTEGER_PRECISION) {
            return ToInteger(column, cell);
        }
        return ToDouble(column, cell);
    }
    if (type.type == "DOUBLE") {
        return ToDouble(column, cell);
    }
    if (type.type == "BOOLEAN") {
        if (cell.is_boolean()) {
            return Value(cell.get<bool>());
        }
        ThrowCellError(column, cell);
    }
    if (cell.is_string()) {
        return Value(cell.get<std::string>());
    }
    if (cell.is_number() || cell.is_boolean()) {
        return Value(cell.dump());
    }
    ThrowCellError(column, cell);
}

//===----------------------------------------------------------------------===//
// Rows
//===----------------------------------------------------------------------===//

Rows::Rows()
    : columns_(std::make_shared<std::vector<SqlColumn>>())
    , closed_(true) {
}

Rows::Rows(Session* session, ResultSetData data, uint32_t fetch_size_kb)
    : session_(session)
    , fetch_size_kb_(fetch_size_kb)
    , columns_(std::make_shared<std::vector<SqlColumn>>(std::move(data.columns)))
    , handle_(data.result_set_handle)
    , num_rows_(data.num_rows)
    , page_(std::move(data.data))
    , page_rows_(static_cast<size_t>(std::max<int64_t>(data.num_rows_in_message, 0)))
    , received_(data.num_rows_in_message) {
}

Rows::~Rows() {
    try {
        Close();
    } catch (const Error& e) {
        LOG_WARN("rows", std::string("Failed to close result set: ") + e.what());
    }
}

std::vector<std::string> Rows::ColumnNames() const {
    std::vector<std::string> names;
    names.reserve(columns_->size());
    for (const auto& column : *columns_) {
        names.push_back(column.name);
    }
    return names;
}

bool Rows::Next(Row& row) {
    if (closed_) {
        return false;
    }
    if (page_offset_ >= page_rows_) {
        if (received_ >= num_rows_) {
            Close();
            return false;
        }
        Fetch();
    }

    row.columns_ = columns_;
    row.cells_.clear();
    row.cells_.reserve(columns_->size());
    for (size_t c = 0; c < columns_->size(); c++) {
        if (!page_.is_array() || c >= page_.size() || !page_[c].is_array() ||
            page_offset_ >= page_[c].size()) {
            throw MalformedDataError("result data has no value for row " +
                                     std::to_string(page_offset_) + " of column '" +
                                     (*columns_)[c].name + "'");
        }
        row.cells_.push_back(page_[c][page_offset_]);
    }
    page_offset_++;
    return true;
}

void Rows::Fetch() {
    if (session_.Dangling()) {
        throw BadConnectionError();
    }
    Session* session = session_.Get();
    if (!session || !handle_) {
        throw MalformedDataError("result set has " + std::to_string(num_rows_) +
                                 " rows but only " + std::to_string(received_) +
                                 " were delivered and there is no cursor to fetch from");
    }

    FetchCommand command;
    command.result_set_handle = *handle_;
    command.start_position = received_;
    command.num_bytes = static_cast<int64_t>(fetch_size_kb_) * 1024;

    ELOG_DEBUG("rows", "Fetching rows of result set {} from position {}", *handle_, received_);

    FetchResponse response;
    session->Send(command, &response);
    if (response.num_rows <= 0) {
        throw MalformedDataError("fetch at position " + std::to_string(received_) +
                                 " returned no rows");
    }
    page_ = std::move(response.data);
    page_rows_ = static_cast<size_t>(response.num_rows);
    page_offset_ = 0;
    received_ += response.num_rows;
}

void Rows::Close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    page_ = json();
    Session* session = session_.Get();
    if (!handle_ || !session || session->IsClosed()) {
        return;
    }
    CloseResultSetCommand command;
    command.result_set_handles.push_back(*handle_);
    session->Send(command, nullptr);
}

} // namespace exaconn
