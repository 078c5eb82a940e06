/**
 * @file CertificateTypes.hpp
 * @brief Data model for certificates of sanitization
 */

#pragma once

#include <string>

/**
 * @struct PersonInfo
 * @brief Contact details of a person named on the certificate
 */
struct PersonInfo {
    std::string name;
    std::string title;
    std::string organization;
    std::string location;
    std::string phone;

    auto operator==(const PersonInfo&) const -> bool = default;
};

/**
 * @struct OperatorMetadata
 * @brief Operator-supplied certificate fields that do not describe the media
 */
struct OperatorMetadata {
    PersonInfo sanitizer;                         ///< Person performing sanitization
    std::string verification_method;             ///< Empty means "Not performed"
    std::string post_sanitization_classification;
    std::string notes;
    std::string destination;                     ///< e.g. "Reuse", "Disposal", "Return to vendor"
    std::string destination_details;
    PersonInfo validator;                        ///< Filled in by a later validation step, may be empty
    std::string validation_date;

    auto operator==(const OperatorMetadata&) const -> bool = default;
};

/**
 * @struct MediaMetadata
 * @brief Identity of the sanitized media
 */
struct MediaMetadata {
    std::string make_vendor;
    std::string model_number;
    std::string serial_number;
    std::string media_property_number;
    std::string media_type;
    std::string source;
    std::string classification;
    std::string data_backed_up;
    std::string backup_location;

    auto operator==(const MediaMetadata&) const -> bool = default;
};

/**
 * @struct SanitizationDetails
 * @brief How the media was sanitized
 */
struct SanitizationDetails {
    std::string method_type;  ///< "Purge" or "Clear"
    std::string method_used;
    std::string method_details;
    std::string tool_used;
    std::string verification_method;
    std::string post_sanitization_classification;
    std::string notes;

    auto operator==(const SanitizationDetails&) const -> bool = default;
};

/**
 * @struct MediaDestination
 * @brief Where the media goes after sanitization
 */
struct MediaDestination {
    std::string destination;
    std::string details;

    auto operator==(const MediaDestination&) const -> bool = default;
};

/**
 * @struct ValidationInfo
 * @brief Validation block, a placeholder until a verification workflow exists
 */
struct ValidationInfo {
    PersonInfo validator;
    std::string validation_date;

    auto operator==(const ValidationInfo&) const -> bool = default;
};

/**
 * @struct CertificateRecord
 * @brief Canonical certificate content, immutable once assembled
 */
struct CertificateRecord {
    PersonInfo person_performing_sanitization;
    MediaMetadata media_information;
    SanitizationDetails sanitization_details;
    MediaDestination media_destination;
    ValidationInfo validation;
    std::string report_uuid;

    auto operator==(const CertificateRecord&) const -> bool = default;
};
