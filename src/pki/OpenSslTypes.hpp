/**
 * @file OpenSslTypes.hpp
 * @brief RAII owners for OpenSSL objects and error-queue helpers
 */

#pragma once

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/cms.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pkcs12.h>
#include <openssl/x509.h>

#include <memory>
#include <string>

namespace pki {

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free_all(bio); }
};
struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
struct X509Deleter {
    void operator()(X509* cert) const { X509_free(cert); }
};
struct X509StoreDeleter {
    void operator()(X509_STORE* store) const { X509_STORE_free(store); }
};
struct Pkcs12Deleter {
    void operator()(PKCS12* p12) const { PKCS12_free(p12); }
};
struct CmsDeleter {
    void operator()(CMS_ContentInfo* cms) const { CMS_ContentInfo_free(cms); }
};
struct BignumDeleter {
    void operator()(BIGNUM* bn) const { BN_free(bn); }
};
struct X509StackDeleter {
    void operator()(STACK_OF(X509)* certs) const { sk_X509_pop_free(certs, X509_free); }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using X509StorePtr = std::unique_ptr<X509_STORE, X509StoreDeleter>;
using Pkcs12Ptr = std::unique_ptr<PKCS12, Pkcs12Deleter>;
using CmsPtr = std::unique_ptr<CMS_ContentInfo, CmsDeleter>;
using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;
using X509StackPtr = std::unique_ptr<STACK_OF(X509), X509StackDeleter>;

/**
 * @brief Drain the thread's OpenSSL error queue into one line
 *
 * Returns "no OpenSSL error reported" when the queue is empty.
 */
inline auto drain_openssl_errors() -> std::string {
    std::string text;
    while (const unsigned long code = ERR_get_error()) {
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        if (!text.empty()) {
            text += "; ";
        }
        text += buffer;
    }
    return text.empty() ? std::string{"no OpenSSL error reported"} : text;
}

/**
 * @brief Everything written to a memory BIO, as a string
 */
inline auto bio_contents(BIO* bio) -> std::string {
    char* data = nullptr;
    const long length = BIO_get_mem_data(bio, &data);
    if (length <= 0 || data == nullptr) {
        return {};
    }
    return std::string{data, static_cast<size_t>(length)};
}

} // namespace pki
