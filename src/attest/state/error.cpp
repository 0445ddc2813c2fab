#include <attest/state/error.hpp>

#include <string>
#include <utility>

namespace attest::state {

struct _state_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "state";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< state_errc >( condition ) )
    {
      case state_errc::ok:
        return "ok"s;
      case state_errc::signature_missing:
        return "state is not signed"s;
      case state_errc::signature_invalid:
        return "state signature is invalid"s;
      case state_errc::database_mismatch:
        return "state belongs to a different database"s;
      case state_errc::io_error:
        return "unable to access state storage"s;
      case state_errc::corrupted_state:
        return "stored state is corrupted"s;
    }
    std::unreachable();
  }
};

const std::error_category& state_category() noexcept
{
  static _state_category category;
  return category;
}

std::error_code make_error_code( state_errc e )
{
  return std::error_code( static_cast< int >( e ), state_category() );
}

} // namespace attest::state
