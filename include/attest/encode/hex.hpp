#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <attest/encode/error.hpp>

namespace attest::encode {

enum class hex_prefix : bool
{
  none,
  with_0x
};

std::string to_hex( std::span< const std::byte > s, hex_prefix prefix = hex_prefix::with_0x ) noexcept;

// Accepts input with or without a leading "0x".
result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept;

} // namespace attest::encode
