#include "certificate/DocumentRenderer.hpp"

#include <format>
#include <string_view>
#include <utility>
#include <vector>

namespace certificate {

namespace {

constexpr size_t PAGE_WIDTH = 78;
constexpr size_t LABEL_WIDTH = 34;
constexpr auto TITLE = "MEDIA SANITIZATION REPORT";
constexpr auto FORM_FEED = '\f';

using Fields = std::vector<std::pair<std::string_view, std::string>>;

auto centered(std::string_view text) -> std::string {
    const auto padding = text.size() < PAGE_WIDTH ? (PAGE_WIDTH - text.size()) / 2 : 0;
    return std::string(padding, ' ') + std::string{text};
}

auto value_or_na(const std::string& value) -> std::string {
    return value.empty() ? std::string{"N/A"} : value;
}

void append_section(std::string& out, int number, std::string_view heading, const Fields& fields) {
    const auto title = std::format("{}. {}", number, heading);
    out += title;
    out += '\n';
    out += std::string(title.size(), '-');
    out += '\n';
    for (const auto& [label, value] : fields) {
        out += std::format("  {:<{}} {}\n", std::format("{}:", label), LABEL_WIDTH,
                           value_or_na(value));
    }
    out += '\n';
}

auto person_fields(const PersonInfo& person) -> Fields {
    return {{"Name", person.name},
            {"Title", person.title},
            {"Organization", person.organization},
            {"Location", person.location},
            {"Phone", person.phone}};
}

} // anonymous namespace

auto render_document(const CertificateRecord& record) -> std::string {
    std::string out;
    out += std::string(PAGE_WIDTH, '=') + '\n';
    out += centered(TITLE) + '\n';
    out += std::string(PAGE_WIDTH, '=') + '\n';
    out += '\n';
    out += std::format("Report ID: {}\n\n", value_or_na(record.report_uuid));

    append_section(out, 1, "Person Performing Sanitization",
                   person_fields(record.person_performing_sanitization));

    const auto& media = record.media_information;
    append_section(out, 2, "Media Information",
                   {{"Make / Vendor", media.make_vendor},
                    {"Model Number", media.model_number},
                    {"Serial Number", media.serial_number},
                    {"Media Property Number", media.media_property_number},
                    {"Media Type", media.media_type},
                    {"Source", media.source},
                    {"Classification", media.classification},
                    {"Data Backed Up", media.data_backed_up},
                    {"Backup Location", media.backup_location}});

    const auto& details = record.sanitization_details;
    append_section(out, 3, "Sanitization Details",
                   {{"Method Type", details.method_type},
                    {"Method Used", details.method_used},
                    {"Method Details", details.method_details},
                    {"Tool Used", details.tool_used},
                    {"Verification Method", details.verification_method},
                    {"Post-Sanitization Classification", details.post_sanitization_classification},
                    {"Notes", details.notes}});

    append_section(out, 4, "Media Destination",
                   {{"Destination", record.media_destination.destination},
                    {"Details", record.media_destination.details}});

    auto validation = person_fields(record.validation.validator);
    validation.emplace_back("Validation Date", record.validation.validation_date);
    append_section(out, 5, "Validation", validation);

    return out;
}

auto render_signature_page(const pki::SigningIdentity& identity, const std::string& signing_time_utc)
    -> std::string {
    std::string out;
    out += FORM_FEED;
    out += '\n';
    out += std::string(PAGE_WIDTH, '=') + '\n';
    out += centered("DIGITAL SIGNATURE") + '\n';
    out += std::string(PAGE_WIDTH, '=') + '\n';
    out += '\n';
    out += "This document is signed with a detached CMS (S/MIME) signature.\n";
    out += "Any change to its text invalidates the signature.\n\n";

    const Fields fields{{"Signed By", identity.subject()},
                        {"Issuer", identity.issuer()},
                        {"Certificate Serial", identity.serial_hex()},
                        {"Valid From", identity.not_before()},
                        {"Valid Until", identity.not_after()},
                        {"SHA-256 Fingerprint", identity.fingerprint_sha256()},
                        {"Signing Time", signing_time_utc}};
    for (const auto& [label, value] : fields) {
        out += std::format("  {:<{}} {}\n", std::format("{}:", label), LABEL_WIDTH - 12,
                           value_or_na(value));
    }
    return out;
}

} // namespace certificate
