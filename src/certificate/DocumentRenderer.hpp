/**
 * @file DocumentRenderer.hpp
 * @brief Human-readable rendering of a certificate record
 */

#pragma once

#include "models/CertificateTypes.hpp"
#include "pki/TrustAnchor.hpp"

#include <string>

namespace certificate {

/**
 * @brief Render the record as a plain-text document
 *
 * Title and report ID first, then five numbered sections in fixed order:
 * person performing sanitization, media information, sanitization details,
 * media destination, validation. Empty fields render as "N/A".
 */
[[nodiscard]] auto render_document(const CertificateRecord& record) -> std::string;

/**
 * @brief Visible signature page appended as the last page of a signed document
 * @param identity Signer
 * @param signing_time_utc ISO-8601 UTC signing time
 */
[[nodiscard]] auto render_signature_page(const pki::SigningIdentity& identity,
                                         const std::string& signing_time_utc) -> std::string;

} // namespace certificate
