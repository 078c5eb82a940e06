#include "certificate/CertificateIssuer.hpp"

#include "certificate/CertificateRecord.hpp"
#include "certificate/DocumentRenderer.hpp"
#include "certificate/DocumentSigner.hpp"
#include "services/ReportSynthesizer.hpp"
#include "util/Logger.hpp"
#include "util/Uuid.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <utility>

namespace fs = std::filesystem;

namespace {

auto write_file(const fs::path& path, const std::string& content, util::ErrorKind kind)
    -> std::expected<void, util::Error> {
    std::ofstream file{path, std::ios::binary | std::ios::trunc};
    if (!file) {
        return std::unexpected(util::Error{kind, std::format("Cannot open {} for writing", path.string())});
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
        return std::unexpected(util::Error{kind, std::format("Cannot write {}", path.string())});
    }
    return {};
}

// Written beside the target and renamed over it, so a partial file never
// appears under the final name.
auto write_file_atomically(const fs::path& path, const std::string& content, util::ErrorKind kind)
    -> std::expected<void, util::Error> {
    auto tmp = path;
    tmp += ".partial";
    if (auto written = write_file(tmp, content, kind); !written) {
        return written;
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return std::unexpected(
            util::Error{kind, std::format("Cannot move {} into place", path.string())});
    }
    return {};
}

} // anonymous namespace

CertificateIssuer::CertificateIssuer(pki::TrustAnchor& trust_anchor, IssuerSettings settings)
    : trust_anchor_(trust_anchor), settings_(std::move(settings)) {}

auto CertificateIssuer::json_path_for(const std::string& report_uuid) const -> fs::path {
    return settings_.output_dir / std::format("sanitization_report_{}.json", report_uuid);
}

auto CertificateIssuer::unsigned_path_for(const std::string& report_uuid) const -> fs::path {
    return settings_.output_dir / std::format("unsigned_report_{}.txt", report_uuid);
}

auto CertificateIssuer::signed_path_for(const std::string& report_uuid) const -> fs::path {
    return settings_.output_dir / std::format("sanitization_report_{}.txt", report_uuid);
}

auto CertificateIssuer::issue(const OperatorMetadata& operator_metadata,
                              const MediaMetadata& media_metadata, const WipeReport& report,
                              const std::string& report_uuid)
    -> std::expected<IssuedCertificate, util::Error> {
    using util::ErrorKind;

    if (report.status != WipeStatus::SUCCESS) {
        return std::unexpected(util::Error{ErrorKind::CERTIFICATE_CREATION,
                                           "Refusing to certify a job that did not succeed"});
    }
    if (report.dry_run) {
        return std::unexpected(util::Error{ErrorKind::CERTIFICATE_CREATION,
                                           "Refusing to certify a dry run: no data was destroyed"});
    }
    if (!util::is_valid_uuid(report_uuid)) {
        return std::unexpected(util::Error{ErrorKind::CERTIFICATE_CREATION,
                                           std::format("Invalid report UUID '{}'", report_uuid)});
    }

    std::error_code ec;
    fs::create_directories(settings_.output_dir, ec);
    if (ec) {
        return std::unexpected(util::Error{
            ErrorKind::CERTIFICATE_CREATION,
            std::format("Cannot create {}: {}", settings_.output_dir.string(), ec.message())});
    }

    const auto record =
        certificate::build_record(operator_metadata, media_metadata, report, report_uuid,
                                  settings_.tool_used);

    IssuedCertificate issued{.report_uuid = report_uuid,
                             .json_path = json_path_for(report_uuid),
                             .signed_path = signed_path_for(report_uuid)};

    if (auto written = write_file(issued.json_path, certificate::serialize(record),
                                  ErrorKind::CERTIFICATE_CREATION);
        !written) {
        LOG_ERROR("CertificateIssuer", written.error().describe());
        return std::unexpected(written.error());
    }
    LOG_INFO("CertificateIssuer", std::format("Wrote certificate record {}", issued.json_path.string()));

    const auto unsigned_path = unsigned_path_for(report_uuid);
    const auto document = certificate::render_document(record);
    if (auto written = write_file(unsigned_path, document, ErrorKind::CERTIFICATE_CREATION);
        !written) {
        LOG_ERROR("CertificateIssuer", written.error().describe());
        return std::unexpected(written.error());
    }

    auto identity = trust_anchor_.ensure_identity(settings_.passphrase);
    if (!identity) {
        util::Error err{ErrorKind::SIGNING,
                        std::format("No signing identity: {}", identity.error().message)};
        LOG_ERROR("CertificateIssuer", std::format("{}; unsigned document kept at {}",
                                                   err.describe(), unsigned_path.string()));
        return std::unexpected(std::move(err));
    }

    const auto signing_time = report::format_utc_timestamp(report::Clock::now());
    auto envelope = certificate::sign_document(
        document + certificate::render_signature_page(*identity, signing_time), *identity);
    if (!envelope) {
        LOG_ERROR("CertificateIssuer", std::format("{}; unsigned document kept at {}",
                                                   envelope.error().describe(),
                                                   unsigned_path.string()));
        return std::unexpected(envelope.error());
    }

    if (auto written = write_file_atomically(issued.signed_path, *envelope, ErrorKind::SIGNING);
        !written) {
        LOG_ERROR("CertificateIssuer", written.error().describe());
        return std::unexpected(written.error());
    }

    if (fs::exists(issued.signed_path, ec)) {
        fs::remove(unsigned_path, ec);
        if (ec) {
            LOG_WARNING("CertificateIssuer", std::format("Cannot remove {}: {}",
                                                         unsigned_path.string(), ec.message()));
        }
    }

    LOG_INFO("CertificateIssuer",
             std::format("Issued certificate {} signed by {} (SHA-256 {})",
                         issued.signed_path.string(), identity->subject(),
                         identity->fingerprint_sha256()));
    return issued;
}

auto CertificateIssuer::verify(const fs::path& signed_path)
    -> std::expected<std::string, util::Error> {
    std::ifstream file{signed_path, std::ios::binary};
    if (!file) {
        return std::unexpected(util::Error{util::ErrorKind::IO,
                                           std::format("Cannot read {}", signed_path.string())});
    }
    const std::string envelope{std::istreambuf_iterator<char>{file},
                               std::istreambuf_iterator<char>{}};

    auto identity = trust_anchor_.load_identity(settings_.passphrase);
    if (!identity) {
        return std::unexpected(identity.error());
    }

    auto content = certificate::verify_document(envelope, *identity);
    if (!content) {
        LOG_WARNING("CertificateIssuer", std::format("Verification of {} failed: {}",
                                                     signed_path.string(),
                                                     content.error().describe()));
        return std::unexpected(content.error());
    }
    LOG_INFO("CertificateIssuer", std::format("Verified {}", signed_path.string()));
    return content;
}
