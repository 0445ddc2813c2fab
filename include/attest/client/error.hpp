#pragma once

#include <expected>
#include <system_error>

namespace attest::client {

enum class client_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  tamper_detected,
  malformed_proof,
  signature_invalid,
  invalid_public_key,
  invalid_configuration
};

const std::error_category& client_category() noexcept;

std::error_code make_error_code( client_errc e );

// True for failures that mean the server returned forged or inconsistent data.
bool is_tamper( const std::error_code& ec ) noexcept;

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace attest::client

template<>
struct std::is_error_code_enum< attest::client::client_errc >: public std::true_type
{};
