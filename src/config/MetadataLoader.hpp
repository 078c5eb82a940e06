/**
 * @file MetadataLoader.hpp
 * @brief Reads operator and media fields for the certificate from JSON
 */

#pragma once

#include "models/CertificateTypes.hpp"
#include "models/DeviceInfo.hpp"
#include "util/Error.hpp"

#include <expected>
#include <filesystem>
#include <string_view>
#include <vector>

namespace config {

/**
 * @struct CertificateMetadata
 * @brief Everything on the certificate that the job itself does not know
 */
struct CertificateMetadata {
    OperatorMetadata operator_info;
    MediaMetadata media;
};

/**
 * @brief Parse metadata JSON
 *
 * The top-level groups reuse the certificate's own names
 * (personPerformingSanitization, mediaInformation, sanitizationDetails,
 * mediaDestination, validation), so a previously issued record can be fed
 * back in. Every group and key is optional; present values must be strings.
 * Generated fields (methodType, methodUsed, methodDetails, toolUsed,
 * report_uuid) are ignored.
 *
 * @return Metadata, or CONFIGURATION on malformed input
 */
[[nodiscard]] auto parse_metadata(std::string_view json_text)
    -> std::expected<CertificateMetadata, util::Error>;

[[nodiscard]] auto load_metadata(const std::filesystem::path& path)
    -> std::expected<CertificateMetadata, util::Error>;

/**
 * @brief Fill media fields the operator left empty from the classified devices
 *
 * With one device the fields hold its plain values. With several, each field
 * lists "<path>: <value>" for every device that reports one, joined with
 * ", " in job order. Fields the operator set are never touched.
 */
void fill_media_defaults(MediaMetadata& media, const std::vector<DeviceInfo>& devices);

} // namespace config
