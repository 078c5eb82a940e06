/**
 * @file TrustAnchor.hpp
 * @brief Persistent self-signed signing identity
 */

#pragma once

#include "pki/OpenSslTypes.hpp"
#include "util/Error.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace pki {

/**
 * @struct SigningIdentity
 * @brief Private key and its self-signed certificate
 *
 * Cheap to copy; copies share the underlying OpenSSL objects, which are only
 * read after loading.
 */
struct SigningIdentity {
    std::shared_ptr<EVP_PKEY> private_key;
    std::shared_ptr<X509> certificate;

    [[nodiscard]] auto subject() const -> std::string;
    [[nodiscard]] auto issuer() const -> std::string;
    [[nodiscard]] auto serial_hex() const -> std::string;
    [[nodiscard]] auto not_before() const -> std::string;
    [[nodiscard]] auto not_after() const -> std::string;

    /**
     * @brief SHA-256 of the DER certificate, colon-separated uppercase hex
     */
    [[nodiscard]] auto fingerprint_sha256() const -> std::string;
};

/**
 * @struct IdentitySettings
 * @brief Parameters used only when a new identity is created
 */
struct IdentitySettings {
    std::string common_name = "Media Sanitizer Signing Authority";
    std::string organization = "Media Sanitizer";
    int key_bits = 2048;
    int validity_days = 365;
};

/**
 * @class TrustAnchor
 * @brief Create-if-absent owner of the PKCS#12 identity bundle
 *
 * The bundle is created once, on first use, and never regenerated or
 * rotated. Creation writes a private temporary file and publishes it with
 * link(2), so among concurrent creators (threads or processes) exactly one
 * bundle wins and every loser loads it.
 */
class TrustAnchor {
public:
    explicit TrustAnchor(std::filesystem::path bundle_path, IdentitySettings settings = {});

    /**
     * @brief Load the identity, creating the bundle first if it does not exist
     * @param passphrase Bundle encryption passphrase
     * @return Identity, or IDENTITY on a wrong passphrase or unreadable bundle
     */
    [[nodiscard]] auto ensure_identity(const std::string& passphrase)
        -> std::expected<SigningIdentity, util::Error>;

    /**
     * @brief Load an existing identity without ever creating one
     * @return Identity, or IDENTITY if the bundle is missing or cannot be decrypted
     */
    [[nodiscard]] auto load_identity(const std::string& passphrase) const
        -> std::expected<SigningIdentity, util::Error>;

    [[nodiscard]] auto bundle_path() const -> const std::filesystem::path& { return bundle_path_; }

private:
    [[nodiscard]] auto create(const std::string& passphrase)
        -> std::expected<SigningIdentity, util::Error>;
    [[nodiscard]] auto generate(const std::string& passphrase) const
        -> std::expected<std::pair<SigningIdentity, std::string>, util::Error>;

    std::filesystem::path bundle_path_;
    IdentitySettings settings_;
    std::mutex create_mutex_;
};

} // namespace pki
