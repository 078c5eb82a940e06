#include "config/MetadataLoader.hpp"

#include "util/Logger.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace config {

namespace {

using nlohmann::json;

struct Field {
    const char* key;
    std::string* target;
};

auto metadata_error(std::string message) -> util::Error {
    return util::Error{util::ErrorKind::CONFIGURATION, std::move(message)};
}

auto read_group(const json& root, const char* group, const std::vector<Field>& fields)
    -> std::expected<void, util::Error> {
    const auto it = root.find(group);
    if (it == root.end() || it->is_null()) {
        return {};
    }
    if (!it->is_object()) {
        return std::unexpected(metadata_error(std::format("\"{}\" must be an object", group)));
    }
    for (const auto& field : fields) {
        const auto value = it->find(field.key);
        if (value == it->end() || value->is_null()) {
            continue;
        }
        if (!value->is_string()) {
            return std::unexpected(
                metadata_error(std::format("\"{}.{}\" must be a string", group, field.key)));
        }
        *field.target = value->get<std::string>();
    }
    return {};
}

} // anonymous namespace

auto parse_metadata(std::string_view json_text) -> std::expected<CertificateMetadata, util::Error> {
    const auto root = json::parse(json_text.begin(), json_text.end(), nullptr, false);
    if (root.is_discarded()) {
        return std::unexpected(metadata_error("Metadata is not valid JSON"));
    }
    if (!root.is_object()) {
        return std::unexpected(metadata_error("Metadata must be a JSON object"));
    }

    CertificateMetadata metadata{};
    auto& op = metadata.operator_info;
    auto& media = metadata.media;

    const std::expected<void, util::Error> groups[] = {
        read_group(root, "personPerformingSanitization",
                   {{"name", &op.sanitizer.name},
                    {"title", &op.sanitizer.title},
                    {"organization", &op.sanitizer.organization},
                    {"location", &op.sanitizer.location},
                    {"phone", &op.sanitizer.phone}}),
        read_group(root, "mediaInformation",
                   {{"makeVendor", &media.make_vendor},
                    {"modelNumber", &media.model_number},
                    {"serialNumber", &media.serial_number},
                    {"mediaPropertyNumber", &media.media_property_number},
                    {"mediaType", &media.media_type},
                    {"source", &media.source},
                    {"classification", &media.classification},
                    {"dataBackedUp", &media.data_backed_up},
                    {"backupLocation", &media.backup_location}}),
        read_group(root, "sanitizationDetails",
                   {{"verificationMethod", &op.verification_method},
                    {"postSanitizationClassification", &op.post_sanitization_classification},
                    {"notes", &op.notes}}),
        read_group(root, "mediaDestination",
                   {{"destination", &op.destination}, {"details", &op.destination_details}}),
        read_group(root, "validation",
                   {{"validatorName", &op.validator.name},
                    {"validatorTitle", &op.validator.title},
                    {"validatorOrganization", &op.validator.organization},
                    {"validatorLocation", &op.validator.location},
                    {"validatorPhone", &op.validator.phone},
                    {"validationDate", &op.validation_date}}),
    };
    for (const auto& group : groups) {
        if (!group) {
            return std::unexpected(group.error());
        }
    }
    return metadata;
}

auto load_metadata(const std::filesystem::path& path)
    -> std::expected<CertificateMetadata, util::Error> {
    std::ifstream file{path};
    if (!file) {
        return std::unexpected(metadata_error(std::format("Cannot open metadata file {}", path.string())));
    }
    const std::string text{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};

    auto metadata = parse_metadata(text);
    if (!metadata) {
        return std::unexpected(metadata_error(
            std::format("{}: {}", path.string(), metadata.error().message)));
    }
    LOG_INFO("MetadataLoader", std::format("Loaded certificate metadata from {}", path.string()));
    return metadata;
}

namespace {

auto media_type_of(const DeviceInfo& device) -> std::string {
    if (device.category == DeviceCategory::NVME) {
        return "NVMe SSD";
    }
    return std::format("{} {}", to_string(device.category), to_string(device.rotational));
}

// "value" for a single device, "/dev/a: v1, /dev/b: v2" otherwise
template<typename Getter>
auto describe_devices(const std::vector<DeviceInfo>& devices, Getter field) -> std::string {
    if (devices.size() == 1) {
        return field(devices.front());
    }
    std::string text;
    for (const auto& device : devices) {
        const std::string value = field(device);
        if (value.empty()) {
            continue;
        }
        if (!text.empty()) {
            text += ", ";
        }
        text += std::format("{}: {}", device.path, value);
    }
    return text;
}

} // namespace

void fill_media_defaults(MediaMetadata& media, const std::vector<DeviceInfo>& devices) {
    if (devices.empty()) {
        return;
    }
    if (media.make_vendor.empty()) {
        media.make_vendor = describe_devices(devices, [](const DeviceInfo& d) { return d.vendor; });
    }
    if (media.model_number.empty()) {
        media.model_number = describe_devices(devices, [](const DeviceInfo& d) { return d.model; });
    }
    if (media.serial_number.empty()) {
        media.serial_number = describe_devices(devices, [](const DeviceInfo& d) { return d.serial; });
    }
    if (media.media_type.empty()) {
        media.media_type = describe_devices(devices, media_type_of);
    }
}

} // namespace config
