/**
 * @file hex.hpp
 * @brief Hexadecimal encoding of byte sequences.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace cluster_exec::hex {

/// Lowercase hex, two digits per byte.
[[nodiscard]] std::string encode(const Bytes& bytes);

/// Accepts upper- and lowercase digits; fails on odd length or a non-hex digit.
[[nodiscard]] Result<Bytes> decode(std::string_view text);

}  // namespace cluster_exec::hex
