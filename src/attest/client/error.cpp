#include <attest/client/error.hpp>

#include <string>
#include <utility>

namespace attest::client {

struct _client_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "client";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< client_errc >( condition ) )
    {
      case client_errc::ok:
        return "ok"s;
      case client_errc::tamper_detected:
        return "server data failed verification"s;
      case client_errc::malformed_proof:
        return "malformed proof"s;
      case client_errc::signature_invalid:
        return "server signature is missing or invalid"s;
      case client_errc::invalid_public_key:
        return "invalid server public key"s;
      case client_errc::invalid_configuration:
        return "invalid configuration"s;
    }
    std::unreachable();
  }
};

const std::error_category& client_category() noexcept
{
  static _client_category category;
  return category;
}

std::error_code make_error_code( client_errc e )
{
  return std::error_code( static_cast< int >( e ), client_category() );
}

bool is_tamper( const std::error_code& ec ) noexcept
{
  return ec == client_errc::tamper_detected || ec == client_errc::signature_invalid;
}

} // namespace attest::client
