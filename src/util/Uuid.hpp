#pragma once

#include "util/Error.hpp"

#include <expected>
#include <string>
#include <string_view>

namespace util {

/**
 * @brief Random (version 4) UUID in canonical lowercase form
 *
 * Uses the OpenSSL CSPRNG; fails only if it cannot be seeded.
 */
[[nodiscard]] auto generate_uuid_v4() -> std::expected<std::string, Error>;

/**
 * @brief Whether @p text is a canonical 8-4-4-4-12 hex UUID
 */
[[nodiscard]] auto is_valid_uuid(std::string_view text) -> bool;

} // namespace util
