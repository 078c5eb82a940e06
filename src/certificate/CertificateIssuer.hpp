/**
 * @file CertificateIssuer.hpp
 * @brief Issues signed certificates of sanitization for finished jobs
 */

#pragma once

#include "models/CertificateTypes.hpp"
#include "models/WipeTypes.hpp"
#include "pki/TrustAnchor.hpp"
#include "util/Error.hpp"

#include <expected>
#include <filesystem>
#include <string>

/**
 * @struct IssuerSettings
 * @brief Where certificates go and how they are signed
 */
struct IssuerSettings {
    std::filesystem::path output_dir;
    std::string tool_used;   ///< "toolUsed" field, e.g. "media-sanitizer 1.0.0"
    std::string passphrase;  ///< Identity bundle passphrase
};

/**
 * @struct IssuedCertificate
 * @brief Files produced by one issuance
 */
struct IssuedCertificate {
    std::string report_uuid;
    std::filesystem::path json_path;    ///< sanitization_report_<uuid>.json
    std::filesystem::path signed_path;  ///< sanitization_report_<uuid>.txt
};

/**
 * @class CertificateIssuer
 * @brief Record, JSON, document, signature, in that order
 *
 * The JSON record is written before anything is signed and is left alone by
 * signing failures. The unsigned document is removed only once the signed
 * one exists, so a failed signing step can be retried from it.
 */
class CertificateIssuer {
public:
    CertificateIssuer(pki::TrustAnchor& trust_anchor, IssuerSettings settings);

    /**
     * @brief Issue the certificate for a successful, real (not dry-run) job
     * @return Produced files; CERTIFICATE_CREATION if the report is not
     *         certifiable or a file cannot be written, SIGNING if signing fails
     */
    [[nodiscard]] auto issue(const OperatorMetadata& operator_metadata,
                             const MediaMetadata& media_metadata, const WipeReport& report,
                             const std::string& report_uuid)
        -> std::expected<IssuedCertificate, util::Error>;

    /**
     * @brief Verify a signed document against the stored identity
     * @return The signed text on success, SIGNING or IDENTITY otherwise
     */
    [[nodiscard]] auto verify(const std::filesystem::path& signed_path)
        -> std::expected<std::string, util::Error>;

    [[nodiscard]] auto json_path_for(const std::string& report_uuid) const -> std::filesystem::path;
    [[nodiscard]] auto unsigned_path_for(const std::string& report_uuid) const
        -> std::filesystem::path;
    [[nodiscard]] auto signed_path_for(const std::string& report_uuid) const
        -> std::filesystem::path;

private:
    pki::TrustAnchor& trust_anchor_;
    IssuerSettings settings_;
};
