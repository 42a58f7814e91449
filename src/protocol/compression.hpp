//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// protocol/compression.hpp
//
// zlib payload compression for negotiated sessions
//===----------------------------------------------------------------------===//

#pragma once

#include <stdexcept>
#include <string>

namespace exaconn {

class CompressionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// zlib-wrapped deflate stream (RFC 1950)
std::string Compress(const std::string& input, int level = -1);

// Inflate a zlib stream; throws CompressionError on corrupt or truncated input
std::string Decompress(const std::string& input);

} // namespace exaconn
