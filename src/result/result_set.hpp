//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// result/result_set.hpp
//
// Decoding of execute results and lazy row iteration
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <memory>
#include <vector>
#include "protocol/commands.hpp"
#include "result/value.hpp"
#include "session/session.hpp"
#include <optional>
#include <variant>

namespace exaconn {

struct RowCountResult {
    int64_t row_count = 0;
};

struct ResultSetData {
    std::optional<int64_t> result_set_handle;  // absent when all rows are inline
    int64_t num_columns = 0;
    int64_t num_rows = 0;
    int64_t num_rows_in_message = 0;
    std::vector<SqlColumn> columns;
    json data;  // column-major
};

struct ResultSetResult {
    ResultSetData result_set;
};

using QueryResult = std::variant<RowCountResult, ResultSetResult>;

// Decode one entry of a "results" array: a row count when the entry is a
// rowCount acknowledgment, a result set otherwise. Throws
// MalformedDataError when it is neither.
QueryResult DecodeResult(const json& result);

// One row of a result set. Cells are converted on access; a cell that does
// not match its column type fails only that access.
class Row {
public:
    Row() = default;

    size_t Size() const { return cells_.size(); }

    // Converted by the column's type; throws MalformedDataError
    Value Get(size_t index) const;

    // Wire representation of the cell
    const json& GetRaw(size_t index) const;

    bool IsNull(size_t index) const { return GetRaw(index).is_null(); }

    const SqlColumn& Column(size_t index) const;

private:
    friend class Rows;

    std::shared_ptr<const std::vector<SqlColumn>> columns_;
    std::vector<json> cells_;
};

// Forward-only, not restartable sequence of rows. Further pages are
// fetched from the server cursor when the buffered rows are exhausted;
// the cursor is released once exhausted or closed. Fetching after the
// Session is destroyed throws BadConnectionError.
class Rows {
public:
    // Empty sequence without columns
    Rows();
    Rows(Session* session, ResultSetData data, uint32_t fetch_size_kb);
    ~Rows();

    // Non-copyable
    Rows(const Rows&) = delete;
    Rows& operator=(const Rows&) = delete;

    const std::vector<SqlColumn>& Columns() const { return *columns_; }
    std::vector<std::string> ColumnNames() const;

    // Total number of rows of the result set
    int64_t NumRows() const { return num_rows_; }

    // Advance to the next row; false once the sequence is exhausted
    bool Next(Row& row);

    // Release the server cursor, idempotent
    void Close();

    bool IsClosed() const { return closed_; }

private:
    void Fetch();

private:
    SessionRef session_;
    uint32_t fetch_size_kb_ = DEFAULT_FETCH_SIZE_KB;

    std::shared_ptr<const std::vector<SqlColumn>> columns_;
    std::optional<int64_t> handle_;
    int64_t num_rows_ = 0;

    // Current page, column-major
    json page_;
    size_t page_rows_ = 0;
    size_t page_offset_ = 0;

    // Rows received so far, across pages
    int64_t received_ = 0;

    bool closed_ = false;
};

} // namespace exaconn
