#include "certificate/CertificateRecord.hpp"

#include <algorithm>
#include <format>
#include <string_view>
#include <vector>

namespace certificate {

namespace {

constexpr int JSON_INDENT = 4;

auto join(const std::vector<std::string>& items, std::string_view separator) -> std::string {
    std::string text;
    for (const auto& item : items) {
        if (!text.empty()) {
            text += separator;
        }
        text += item;
    }
    return text;
}

auto method_type_for(const WipeReport& report) -> std::string {
    const bool any_clear = std::ranges::any_of(report.methods_applied, [](SanitizationMethod m) {
        return nist_category(m) == "Clear";
    });
    return std::string{any_clear ? nist_category(SanitizationMethod::OVERWRITE)
                                 : nist_category(SanitizationMethod::NVME_SANITIZE)};
}

auto method_used_for(const WipeReport& report) -> std::string {
    std::vector<std::string> names;
    for (const auto& path : report.devices_wiped_successfully) {
        if (auto it = report.methods_used.find(path); it != report.methods_used.end()) {
            names.push_back(it->second);
        }
    }
    if (names.empty()) {
        return {};
    }
    if (std::ranges::all_of(names, [&](const std::string& n) { return n == names.front(); })) {
        return names.front();
    }

    std::vector<std::string> entries;
    for (const auto& path : report.devices_wiped_successfully) {
        if (auto it = report.methods_used.find(path); it != report.methods_used.end()) {
            entries.push_back(std::format("{}: {}", path, it->second));
        }
    }
    return join(entries, "; ");
}

auto person_json(const PersonInfo& person) -> nlohmann::ordered_json {
    return nlohmann::ordered_json{
        {"name", person.name},
        {"title", person.title},
        {"organization", person.organization},
        {"location", person.location},
        {"phone", person.phone},
    };
}

} // anonymous namespace

auto build_record(const OperatorMetadata& operator_metadata, const MediaMetadata& media_metadata,
                  const WipeReport& report, const std::string& report_uuid,
                  const std::string& tool_used) -> CertificateRecord {
    auto method_details = std::format(
        "Devices: {}; Started: {}; Finished: {}; Duration: {:.2f} s; Status: {}",
        join(report.devices_wiped_successfully, ", "), report.start_time_utc, report.end_time_utc,
        report.duration_seconds, to_string(report.status));

    return CertificateRecord{
        .person_performing_sanitization = operator_metadata.sanitizer,
        .media_information = media_metadata,
        .sanitization_details =
            SanitizationDetails{
                .method_type = method_type_for(report),
                .method_used = method_used_for(report),
                .method_details = std::move(method_details),
                .tool_used = tool_used,
                .verification_method = operator_metadata.verification_method.empty()
                                           ? std::string{NOT_PERFORMED}
                                           : operator_metadata.verification_method,
                .post_sanitization_classification =
                    operator_metadata.post_sanitization_classification,
                .notes = operator_metadata.notes,
            },
        .media_destination = MediaDestination{.destination = operator_metadata.destination,
                                              .details = operator_metadata.destination_details},
        .validation = ValidationInfo{.validator = operator_metadata.validator,
                                     .validation_date = operator_metadata.validation_date},
        .report_uuid = report_uuid,
    };
}

auto to_json(const CertificateRecord& record) -> nlohmann::ordered_json {
    const auto& media = record.media_information;
    const auto& details = record.sanitization_details;
    const auto& validator = record.validation.validator;

    return nlohmann::ordered_json{
        {"personPerformingSanitization", person_json(record.person_performing_sanitization)},
        {"mediaInformation",
         {
             {"makeVendor", media.make_vendor},
             {"modelNumber", media.model_number},
             {"serialNumber", media.serial_number},
             {"mediaPropertyNumber", media.media_property_number},
             {"mediaType", media.media_type},
             {"source", media.source},
             {"classification", media.classification},
             {"dataBackedUp", media.data_backed_up},
             {"backupLocation", media.backup_location},
         }},
        {"sanitizationDetails",
         {
             {"methodType", details.method_type},
             {"methodUsed", details.method_used},
             {"methodDetails", details.method_details},
             {"toolUsed", details.tool_used},
             {"verificationMethod", details.verification_method},
             {"postSanitizationClassification", details.post_sanitization_classification},
             {"notes", details.notes},
         }},
        {"mediaDestination",
         {
             {"destination", record.media_destination.destination},
             {"details", record.media_destination.details},
         }},
        {"validation",
         {
             {"validatorName", validator.name},
             {"validatorTitle", validator.title},
             {"validatorOrganization", validator.organization},
             {"validatorLocation", validator.location},
             {"validatorPhone", validator.phone},
             {"validationDate", record.validation.validation_date},
         }},
        {"report_uuid", record.report_uuid},
    };
}

auto serialize(const CertificateRecord& record) -> std::string {
    return to_json(record).dump(JSON_INDENT) + "\n";
}

} // namespace certificate
