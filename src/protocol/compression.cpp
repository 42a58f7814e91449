//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// protocol/compression.cpp
//===----------------------------------------------------------------------===//

#include "protocol/compression.hpp"
#include "common.hpp"
#include <vector>
#include <zlib.h>

namespace exaconn {

std::string Compress(const std::string& input, int level) {
    std::vector<Bytef> out(::compressBound(static_cast<uLong>(input.size())));

    z_stream strm{};
    if (deflateInit(&strm, level) != Z_OK) {
        throw CompressionError("deflateInit failed");
    }

    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    strm.avail_in = static_cast<uInt>(input.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    int ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        throw CompressionError("deflate failed with code " + std::to_string(ret));
    }

    return std::string(reinterpret_cast<const char*>(out.data()), out.size() - strm.avail_out);
}

std::string Decompress(const std::string& input) {
    z_stream strm{};
    if (inflateInit(&strm) != Z_OK) {
        throw CompressionError("inflateInit failed");
    }

    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    strm.avail_in = static_cast<uInt>(input.size());

    std::string output;
    std::vector<char> chunk(DEFAULT_READ_BUFFER_SIZE);
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        strm.next_out = reinterpret_cast<Bytef*>(chunk.data());
        strm.avail_out = static_cast<uInt>(chunk.size());

        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            std::string reason = strm.msg ? strm.msg : "code " + std::to_string(ret);
            inflateEnd(&strm);
            throw CompressionError("inflate failed: " + reason);
        }
        output.append(chunk.data(), chunk.size() - strm.avail_out);

        if (ret == Z_OK && strm.avail_in == 0 && strm.avail_out != 0) {
            inflateEnd(&strm);
            throw CompressionError("inflate failed: truncated input");
        }
    }

    inflateEnd(&strm);
    return output;
}

} // namespace exaconn
