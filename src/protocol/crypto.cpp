//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// protocol/crypto.cpp
//
// RSA and base64 helpers on top of OpenSSL
//===----------------------------------------------------------------------===//

#include "protocol/crypto.hpp"
#include "errors.hpp"

#include <memory>
#include <vector>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

namespace exaconn {

namespace {

struct BioDeleter { void operator()(BIO* b) const { BIO_free(b); } };
struct PkeyDeleter { void operator()(EVP_PKEY* k) const { EVP_PKEY_free(k); } };
struct PkeyCtxDeleter { void operator()(EVP_PKEY_CTX* c) const { EVP_PKEY_CTX_free(c); } };
struct RsaDeleter { void operator()(RSA* r) const { RSA_free(r); } };

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

std::string LastOpenSslError() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

PkeyPtr ReadPublicKey(const std::string& pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw ConnectionError(error_code::LOGIN_FAILED, "could not allocate key buffer");
    }

    PkeyPtr key(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (key) {
        return key;
    }
    ERR_clear_error();

    // The server sends a PKCS#1 block ("BEGIN RSA PUBLIC KEY")
    BioPtr pkcs1_bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    std::unique_ptr<RSA, RsaDeleter> rsa(
        PEM_read_bio_RSAPublicKey(pkcs1_bio.get(), nullptr, nullptr, nullptr));
    if (!rsa) {
        throw ConnectionError(error_code::LOGIN_FAILED,
                              "could not parse public key: " + LastOpenSslError());
    }

    key.reset(EVP_PKEY_new());
    if (!key || EVP_PKEY_assign_RSA(key.get(), rsa.get()) != 1) {
        throw ConnectionError(error_code::LOGIN_FAILED,
                              "could not wrap public key: " + LastOpenSslError());
    }
    rsa.release();  // owned by key now
    return key;
}

} // namespace

std::string EncryptPassword(const std::string& public_key_pem, const std::string& secret) {
    PkeyPtr key = ReadPublicKey(public_key_pem);

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(key.get(), nullptr));
    if (!ctx || EVP_PKEY_encrypt_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) <= 0) {
        throw ConnectionError(error_code::LOGIN_FAILED,
                              "could not initialize encryption: " + LastOpenSslError());
    }

    const auto* in = reinterpret_cast<const unsigned char*>(secret.data());
    size_t out_len = 0;
    if (EVP_PKEY_encrypt(ctx.get(), nullptr, &out_len, in, secret.size()) <= 0) {
        throw ConnectionError(error_code::LOGIN_FAILED,
                              "could not encrypt password: " + LastOpenSslError());
    }

    std::vector<unsigned char> out(out_len);
    if (EVP_PKEY_encrypt(ctx.get(), out.data(), &out_len, in, secret.size()) <= 0) {
        throw ConnectionError(error_code::LOGIN_FAILED,
                              "could not encrypt password: " + LastOpenSslError());
    }

    return Base64Encode(std::string(reinterpret_cast<const char*>(out.data()), out_len));
}

std::string Base64Encode(const std::string& data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::string Base64Decode(const std::string& data) {
    if (data.empty()) {
        return "";
    }
    std::string out(3 * (data.size() / 4) + 3, '\0');
    int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    if (written < 0) {
        throw MalformedDataError("invalid base64 data");
    }
    // EVP_DecodeBlock keeps the bytes produced by '=' padding
    size_t padding = 0;
    if (data.size() >= 1 && data[data.size() - 1] == '=') padding++;
    if (data.size() >= 2 && data[data.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

} // namespace exaconn
