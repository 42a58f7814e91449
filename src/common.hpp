//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// common.hpp
//
// Protocol and client-wide constants
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace exaconn {

// WebSocket protocol version requested at login
constexpr int PROTOCOL_VERSION = 3;
constexpr uint16_t DEFAULT_PORT = 8563;

constexpr const char* DRIVER_NAME = "exaconn";
constexpr const char* DRIVER_VERSION = "1.0.0";

// Result sets are fetched in chunks of this many KiB
constexpr uint32_t DEFAULT_FETCH_SIZE_KB = 2000;
constexpr uint32_t DEFAULT_CONNECT_TIMEOUT_MS = 10000;

// I/O chunk sizes for WebSocket reads and import uploads
constexpr size_t DEFAULT_READ_BUFFER_SIZE = 64 * 1024;
constexpr size_t DEFAULT_WRITE_BUFFER_SIZE = 64 * 1024;

// Name the server requests local import files under
constexpr const char* IMPORT_RESOURCE_NAME = "data.csv";

} // namespace exaconn
