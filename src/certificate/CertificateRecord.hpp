/**
 * @file CertificateRecord.hpp
 * @brief Assembly and JSON form of the canonical certificate record
 */

#pragma once

#include "models/CertificateTypes.hpp"
#include "models/WipeTypes.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace certificate {

constexpr auto NOT_PERFORMED = "Not performed";

/**
 * @brief Build the record for a successful job
 *
 * methodType is "Purge" unless any device was only overwritten, in which
 * case the weaker "Clear" applies to the whole record. methodUsed is the
 * method description when all devices used the same one, otherwise a
 * "path: method" list in job order.
 *
 * @param tool_used Tool name and version, e.g. "media-sanitizer 1.0.0"
 */
[[nodiscard]] auto build_record(const OperatorMetadata& operator_metadata,
                                const MediaMetadata& media_metadata, const WipeReport& report,
                                const std::string& report_uuid, const std::string& tool_used)
    -> CertificateRecord;

/**
 * @brief JSON form with the external field names, in their fixed order
 *
 * All values are strings. Identical records serialize to identical text.
 */
[[nodiscard]] auto to_json(const CertificateRecord& record) -> nlohmann::ordered_json;

/**
 * @brief Serialized JSON as written to sanitization_report_<uuid>.json
 */
[[nodiscard]] auto serialize(const CertificateRecord& record) -> std::string;

} // namespace certificate
