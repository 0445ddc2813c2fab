#pragma once

#include <expected>
#include <system_error>

namespace attest::crypto {

enum class crypto_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  initialization_failed,
  invalid_leaf_index,
  invalid_tree_size,
  invalid_public_key,
  unsupported_key_type,
  unreadable_key_file
};

const std::error_category& crypto_category() noexcept;

std::error_code make_error_code( crypto_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace attest::crypto

template<>
struct std::is_error_code_enum< attest::crypto::crypto_errc >: public std::true_type
{};
