#pragma once

#include <expected>
#include <system_error>

namespace attest::store {

enum class store_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  malformed_proof,
  missing_tx_metadata,
  entry_not_found
};

const std::error_category& store_category() noexcept;

std::error_code make_error_code( store_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace attest::store

template<>
struct std::is_error_code_enum< attest::store::store_errc >: public std::true_type
{};
