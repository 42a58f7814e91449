//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// protocol/crypto.hpp
//
// Credential encryption for the login handshake
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace exaconn {

// Encrypt 'secret' with the server's RSA public key (PKCS#1 v1.5 padding)
// and return it base64 encoded. The PEM may be a PKCS#1 "RSA PUBLIC KEY"
// or an X.509 "PUBLIC KEY" block. Throws ConnectionError on failure.
std::string EncryptPassword(const std::string& public_key_pem, const std::string& secret);

std::string Base64Encode(const std::string& data);
std::string Base64Decode(const std::string& data);

} // namespace exaconn
