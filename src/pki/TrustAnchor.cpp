#include "pki/TrustAnchor.hpp"

#include "util/FileDescriptor.hpp"
#include "util/Logger.hpp"

#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/x509v3.h>

#include <cerrno>
#include <cstring>
#include <ctime>
#include <format>
#include <fstream>
#include <iterator>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace pki {

namespace {

constexpr int SERIAL_BYTES = 16;
constexpr long SECONDS_PER_DAY = 60L * 60L * 24L;

auto name_to_string(const X509_NAME* name) -> std::string {
    BioPtr bio{BIO_new(BIO_s_mem())};
    if (!bio || X509_NAME_print_ex(bio.get(), name, 0, XN_FLAG_RFC2253) < 0) {
        return {};
    }
    return bio_contents(bio.get());
}

auto time_to_string(const ASN1_TIME* time) -> std::string {
    std::tm tm{};
    if (time == nullptr || ASN1_TIME_to_tm(time, &tm) != 1) {
        return {};
    }
    char buffer[32];
    if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0) {
        return {};
    }
    return buffer;
}

auto identity_error(std::string message) -> util::Error {
    return util::Error{util::ErrorKind::IDENTITY, std::move(message)};
}

auto temporary_path_for(const fs::path& target) -> std::expected<fs::path, util::Error> {
    unsigned char nonce[8];
    if (RAND_bytes(nonce, sizeof(nonce)) != 1) {
        return std::unexpected(identity_error("Random number generator unavailable"));
    }
    std::string suffix;
    for (const auto byte : nonce) {
        suffix += std::format("{:02x}", byte);
    }
    auto tmp = target;
    tmp += std::format(".{}.{}.tmp", ::getpid(), suffix);
    return tmp;
}

} // anonymous namespace

auto SigningIdentity::subject() const -> std::string {
    return certificate ? name_to_string(X509_get_subject_name(certificate.get())) : std::string{};
}

auto SigningIdentity::issuer() const -> std::string {
    return certificate ? name_to_string(X509_get_issuer_name(certificate.get())) : std::string{};
}

auto SigningIdentity::serial_hex() const -> std::string {
    if (!certificate) {
        return {};
    }
    BignumPtr serial{ASN1_INTEGER_to_BN(X509_get0_serialNumber(certificate.get()), nullptr)};
    if (!serial) {
        return {};
    }
    char* hex = BN_bn2hex(serial.get());
    if (hex == nullptr) {
        return {};
    }
    std::string text{hex};
    OPENSSL_free(hex);
    return text;
}

auto SigningIdentity::not_before() const -> std::string {
    return certificate ? time_to_string(X509_get0_notBefore(certificate.get())) : std::string{};
}

auto SigningIdentity::not_after() const -> std::string {
    return certificate ? time_to_string(X509_get0_notAfter(certificate.get())) : std::string{};
}

auto SigningIdentity::fingerprint_sha256() const -> std::string {
    if (!certificate) {
        return {};
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (X509_digest(certificate.get(), EVP_sha256(), digest, &length) != 1) {
        return {};
    }
    std::string text;
    for (unsigned int i = 0; i < length; ++i) {
        if (i > 0) {
            text += ':';
        }
        text += std::format("{:02X}", digest[i]);
    }
    return text;
}

TrustAnchor::TrustAnchor(fs::path bundle_path, IdentitySettings settings)
    : bundle_path_(std::move(bundle_path)), settings_(std::move(settings)) {}

auto TrustAnchor::ensure_identity(const std::string& passphrase)
    -> std::expected<SigningIdentity, util::Error> {
    std::error_code ec;
    if (fs::exists(bundle_path_, ec)) {
        return load_identity(passphrase);
    }
    return create(passphrase);
}

auto TrustAnchor::load_identity(const std::string& passphrase) const
    -> std::expected<SigningIdentity, util::Error> {
    std::ifstream file{bundle_path_, std::ios::binary};
    if (!file) {
        return std::unexpected(identity_error(
            std::format("Cannot open identity bundle {}", bundle_path_.string())));
    }
    const std::string der{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};

    BioPtr bio{BIO_new_mem_buf(der.data(), static_cast<int>(der.size()))};
    Pkcs12Ptr p12{bio ? d2i_PKCS12_bio(bio.get(), nullptr) : nullptr};
    if (!p12) {
        return std::unexpected(identity_error(std::format(
            "{} is not a PKCS#12 bundle: {}", bundle_path_.string(), drain_openssl_errors())));
    }

    if (PKCS12_verify_mac(p12.get(), passphrase.c_str(), static_cast<int>(passphrase.size())) != 1) {
        drain_openssl_errors();
        LOG_ERROR("TrustAnchor",
                  std::format("Passphrase rejected for identity bundle {}", bundle_path_.string()));
        return std::unexpected(identity_error(
            std::format("Wrong passphrase for identity bundle {}", bundle_path_.string())));
    }

    EVP_PKEY* raw_key = nullptr;
    X509* raw_cert = nullptr;
    if (PKCS12_parse(p12.get(), passphrase.c_str(), &raw_key, &raw_cert, nullptr) != 1) {
        return std::unexpected(identity_error(std::format(
            "Cannot decrypt identity bundle {}: {}", bundle_path_.string(), drain_openssl_errors())));
    }
    EvpPkeyPtr key{raw_key};
    X509Ptr cert{raw_cert};

    if (!key || !cert) {
        return std::unexpected(identity_error(std::format(
            "Identity bundle {} lacks a key or certificate", bundle_path_.string())));
    }
    if (X509_check_private_key(cert.get(), key.get()) != 1) {
        drain_openssl_errors();
        return std::unexpected(identity_error(std::format(
            "Key and certificate in {} do not match", bundle_path_.string())));
    }

    SigningIdentity identity{.private_key = std::shared_ptr<EVP_PKEY>(key.release(), EvpPkeyDeleter{}),
                             .certificate = std::shared_ptr<X509>(cert.release(), X509Deleter{})};
    LOG_DEBUG("TrustAnchor", std::format("Loaded signing identity {} (SHA-256 {})",
                                         identity.subject(), identity.fingerprint_sha256()));
    return identity;
}

auto TrustAnchor::create(const std::string& passphrase)
    -> std::expected<SigningIdentity, util::Error> {
    std::lock_guard lock(create_mutex_);

    std::error_code ec;
    if (fs::exists(bundle_path_, ec)) {
        return load_identity(passphrase);
    }

    if (const auto parent = bundle_path_.parent_path(); !parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(identity_error(
                std::format("Cannot create {}: {}", parent.string(), ec.message())));
        }
    }

    auto generated = generate(passphrase);
    if (!generated) {
        return std::unexpected(generated.error());
    }
    auto& [identity, der] = *generated;

    auto tmp = temporary_path_for(bundle_path_);
    if (!tmp) {
        return std::unexpected(tmp.error());
    }

    {
        auto fd = util::FileDescriptor::create_exclusive(*tmp, 0600);
        if (!fd) {
            return std::unexpected(identity_error(
                std::format("Cannot write {}: {}", tmp->string(), std::strerror(errno))));
        }
        if (!fd.write_durably(der)) {
            const int err = errno;
            fd.reset();
            ::unlink(tmp->c_str());
            return std::unexpected(identity_error(
                std::format("Cannot write {}: {}", tmp->string(), std::strerror(err))));
        }
    }

    // link(2) fails with EEXIST instead of replacing, unlike rename(2).
    const int linked = ::link(tmp->c_str(), bundle_path_.c_str());
    const int link_errno = errno;
    ::unlink(tmp->c_str());

    if (linked != 0) {
        if (link_errno == EEXIST) {
            LOG_INFO("TrustAnchor", std::format("Identity bundle {} was created concurrently; loading it",
                                                bundle_path_.string()));
            return load_identity(passphrase);
        }
        return std::unexpected(identity_error(std::format(
            "Cannot publish identity bundle {}: {}", bundle_path_.string(), std::strerror(link_errno))));
    }

    LOG_INFO("TrustAnchor",
             std::format("Created signing identity {} at {} (valid until {}, SHA-256 {})",
                         identity.subject(), bundle_path_.string(), identity.not_after(),
                         identity.fingerprint_sha256()));
    return std::move(identity);
}

auto TrustAnchor::generate(const std::string& passphrase) const
    -> std::expected<std::pair<SigningIdentity, std::string>, util::Error> {
    EvpPkeyPtr key{EVP_RSA_gen(static_cast<unsigned int>(settings_.key_bits))};
    if (!key) {
        return std::unexpected(
            identity_error(std::format("RSA key generation failed: {}", drain_openssl_errors())));
    }

    X509Ptr cert{X509_new()};
    if (!cert) {
        return std::unexpected(identity_error("X509_new failed"));
    }

    unsigned char serial_bytes[SERIAL_BYTES];
    if (RAND_bytes(serial_bytes, sizeof(serial_bytes)) != 1) {
        return std::unexpected(identity_error("Random number generator unavailable"));
    }
    serial_bytes[0] &= 0x7F;  // keep the serial positive
    BignumPtr serial{BN_bin2bn(serial_bytes, sizeof(serial_bytes), nullptr)};

    X509_NAME* name = X509_get_subject_name(cert.get());
    const auto* cn = reinterpret_cast<const unsigned char*>(settings_.common_name.c_str());
    const auto* org = reinterpret_cast<const unsigned char*>(settings_.organization.c_str());

    const bool built =
        serial && X509_set_version(cert.get(), 2) == 1 &&
        BN_to_ASN1_INTEGER(serial.get(), X509_get_serialNumber(cert.get())) != nullptr &&
        X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0) != nullptr &&
        X509_gmtime_adj(X509_getm_notAfter(cert.get()), settings_.validity_days * SECONDS_PER_DAY) !=
            nullptr &&
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_UTF8, cn, -1, -1, 0) == 1 &&
        X509_NAME_add_entry_by_txt(name, "O", MBSTRING_UTF8, org, -1, -1, 0) == 1 &&
        X509_set_issuer_name(cert.get(), name) == 1 &&
        X509_set_pubkey(cert.get(), key.get()) == 1 &&
        X509_sign(cert.get(), key.get(), EVP_sha256()) > 0;
    if (!built) {
        return std::unexpected(identity_error(
            std::format("Cannot build self-signed certificate: {}", drain_openssl_errors())));
    }

    Pkcs12Ptr p12{PKCS12_create(passphrase.c_str(), settings_.common_name.c_str(), key.get(),
                                cert.get(), nullptr, 0, 0, 0, 0, 0)};
    if (!p12) {
        return std::unexpected(identity_error(
            std::format("Cannot assemble PKCS#12 bundle: {}", drain_openssl_errors())));
    }

    BioPtr out{BIO_new(BIO_s_mem())};
    if (!out || i2d_PKCS12_bio(out.get(), p12.get()) != 1) {
        return std::unexpected(identity_error(
            std::format("Cannot encode PKCS#12 bundle: {}", drain_openssl_errors())));
    }

    SigningIdentity identity{.private_key = std::shared_ptr<EVP_PKEY>(key.release(), EvpPkeyDeleter{}),
                             .certificate = std::shared_ptr<X509>(cert.release(), X509Deleter{})};
    return std::pair{std::move(identity), bio_contents(out.get())};
}

} // namespace pki
