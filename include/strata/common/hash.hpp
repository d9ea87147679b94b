#pragma once

#include <cstddef>
#include <string>

namespace strata::common {

/// Lowercase hex SHA-256 of the input bytes.
[[nodiscard]] std::string sha256_hex(const std::string &text);

/// Random lowercase hex identifier of `bytes` random bytes, optionally prefixed.
[[nodiscard]] std::string random_id(const std::string &prefix = "", std::size_t bytes = 8);

} // namespace strata::common
