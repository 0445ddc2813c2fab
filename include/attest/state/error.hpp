#pragma once

#include <expected>
#include <system_error>

namespace attest::state {

enum class state_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  signature_missing,
  signature_invalid,
  database_mismatch,
  io_error,
  corrupted_state
};

const std::error_category& state_category() noexcept;

std::error_code make_error_code( state_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace attest::state

template<>
struct std::is_error_code_enum< attest::state::state_errc >: public std::true_type
{};
