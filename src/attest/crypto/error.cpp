#include <attest/crypto/error.hpp>

#include <string>
#include <utility>

namespace attest::crypto {

struct _crypto_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "crypto";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< crypto_errc >( condition ) )
    {
      case crypto_errc::ok:
        return "ok"s;
      case crypto_errc::initialization_failed:
        return "crypto library initialization failed"s;
      case crypto_errc::invalid_leaf_index:
        return "leaf index is outside of the tree"s;
      case crypto_errc::invalid_tree_size:
        return "invalid tree size"s;
      case crypto_errc::invalid_public_key:
        return "invalid public key"s;
      case crypto_errc::unsupported_key_type:
        return "unsupported public key type"s;
      case crypto_errc::unreadable_key_file:
        return "unable to read public key file"s;
    }
    std::unreachable();
  }
};

const std::error_category& crypto_category() noexcept
{
  static _crypto_category category;
  return category;
}

std::error_code make_error_code( crypto_errc e )
{
  return std::error_code( static_cast< int >( e ), crypto_category() );
}

} // namespace attest::crypto
