#include "certificate/DocumentSigner.hpp"

#include "pki/OpenSslTypes.hpp"

#include <openssl/x509_vfy.h>

#include <format>

namespace certificate {

namespace {

auto signing_error(std::string message) -> util::Error {
    return util::Error{util::ErrorKind::SIGNING, std::move(message)};
}

auto to_lf(std::string text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            continue;
        }
        out += text[i];
    }
    return out;
}

} // anonymous namespace

auto sign_document(const std::string& document, const pki::SigningIdentity& identity)
    -> std::expected<std::string, util::Error> {
    if (!identity.private_key || !identity.certificate) {
        return std::unexpected(signing_error("Signing identity is incomplete"));
    }

    constexpr unsigned int flags = CMS_DETACHED | CMS_STREAM;

    pki::BioPtr in{BIO_new_mem_buf(document.data(), static_cast<int>(document.size()))};
    if (!in) {
        return std::unexpected(signing_error("Cannot allocate input buffer"));
    }

    pki::CmsPtr cms{CMS_sign(identity.certificate.get(), identity.private_key.get(), nullptr,
                             in.get(), flags)};
    if (!cms) {
        return std::unexpected(
            signing_error(std::format("CMS_sign failed: {}", pki::drain_openssl_errors())));
    }

    pki::BioPtr out{BIO_new(BIO_s_mem())};
    if (!out || SMIME_write_CMS(out.get(), cms.get(), in.get(), flags) != 1) {
        return std::unexpected(signing_error(
            std::format("Cannot write S/MIME envelope: {}", pki::drain_openssl_errors())));
    }
    return pki::bio_contents(out.get());
}

auto verify_document(const std::string& envelope, const pki::SigningIdentity& identity)
    -> std::expected<std::string, util::Error> {
    if (!identity.certificate) {
        return std::unexpected(signing_error("No certificate to verify against"));
    }

    pki::BioPtr in{BIO_new_mem_buf(envelope.data(), static_cast<int>(envelope.size()))};
    BIO* raw_content = nullptr;
    pki::CmsPtr cms{in ? SMIME_read_CMS(in.get(), &raw_content) : nullptr};
    pki::BioPtr content{raw_content};
    if (!cms) {
        return std::unexpected(signing_error(
            std::format("Not a valid S/MIME envelope: {}", pki::drain_openssl_errors())));
    }
    if (!content) {
        return std::unexpected(signing_error("S/MIME envelope carries no signed content"));
    }

    pki::X509StorePtr store{X509_STORE_new()};
    if (!store || X509_STORE_add_cert(store.get(), identity.certificate.get()) != 1) {
        return std::unexpected(signing_error(
            std::format("Cannot build trust store: {}", pki::drain_openssl_errors())));
    }
    // The identity is self-signed and trusted as-is.
    X509_STORE_set_flags(store.get(), X509_V_FLAG_PARTIAL_CHAIN);

    pki::BioPtr out{BIO_new(BIO_s_mem())};
    if (!out || CMS_verify(cms.get(), nullptr, store.get(), content.get(), out.get(), 0) != 1) {
        return std::unexpected(signing_error(
            std::format("Signature verification failed: {}", pki::drain_openssl_errors())));
    }
    return to_lf(pki::bio_contents(out.get()));
}

} // namespace certificate
