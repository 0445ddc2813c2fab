#pragma once

#include <filesystem>
#include <memory>
#include <span>
#include <string_view>

#include <attest/crypto/error.hpp>

struct evp_pkey_st;

namespace attest::crypto {

result< void > initialize() noexcept;

/**
 * A server signing key loaded from a PEM encoded SubjectPublicKeyInfo.
 *
 * EC keys verify DER encoded ECDSA signatures over the SHA-256 of the message,
 * Ed25519 keys verify the message directly.
 */
class public_key final
{
public:
  public_key() = delete;
  public_key( const public_key& pk ) noexcept = default;
  public_key( public_key&& pk ) noexcept      = default;
  ~public_key() noexcept                      = default;

  public_key& operator=( const public_key& pk ) noexcept = default;
  public_key& operator=( public_key&& pk ) noexcept      = default;

  bool operator==( const public_key& rhs ) const noexcept;
  bool operator!=( const public_key& rhs ) const noexcept;

  static result< public_key > from_pem( std::string_view pem ) noexcept;
  static result< public_key > from_pem_file( const std::filesystem::path& path );

  bool verify( std::span< const std::byte > signature, std::span< const std::byte > message ) const noexcept;

private:
  explicit public_key( std::shared_ptr< evp_pkey_st > key ) noexcept;

  std::shared_ptr< evp_pkey_st > _key;
};

} // namespace attest::crypto
