/**
 * @file DocumentSigner.hpp
 * @brief S/MIME clear-signing and verification of rendered documents
 */

#pragma once

#include "pki/TrustAnchor.hpp"
#include "util/Error.hpp"

#include <expected>
#include <string>

namespace certificate {

/**
 * @brief Wrap @p document in a multipart/signed S/MIME envelope
 *
 * The document stays readable as the first MIME part; the second part is a
 * detached CMS signature made with SHA-256 over the canonicalized text.
 *
 * @return Envelope text, or SIGNING with the OpenSSL error queue
 */
[[nodiscard]] auto sign_document(const std::string& document,
                                 const pki::SigningIdentity& identity)
    -> std::expected<std::string, util::Error>;

/**
 * @brief Check an envelope produced by sign_document()
 *
 * The signer certificate must be @p identity's certificate.
 *
 * @return The signed document text (LF line endings), or SIGNING if the
 *         envelope is malformed, was altered, or was signed by someone else
 */
[[nodiscard]] auto verify_document(const std::string& envelope,
                                   const pki::SigningIdentity& identity)
    -> std::expected<std::string, util::Error>;

} // namespace certificate
