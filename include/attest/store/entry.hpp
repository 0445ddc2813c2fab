#pragma once

#include <cstdint>
#include <span>
#include <variant>
#include <vector>

#include <attest/crypto/hash.hpp>

namespace attest::store {

using bytes = std::vector< std::byte >;

constexpr std::byte set_key_prefix{ 0x00 };
constexpr std::byte sorted_key_prefix{ 0x01 };
constexpr std::byte plain_value_prefix{ 0x00 };
constexpr std::byte reference_value_prefix{ 0x01 };

/**
 * A key and value as the log stores them, prefixes included.
 *
 * The digested form is `key || H( value )`. The value hash has a fixed width,
 * so no two distinct key/value pairs share a digested form.
 */
struct encoded_kv
{
  bytes key;
  bytes value;

  bytes encode() const;
  crypto::digest value_hash() const noexcept;
  crypto::digest digest() const noexcept;
};

bytes encode_key( std::span< const std::byte > key );

encoded_kv encode_plain( std::span< const std::byte > key, std::span< const std::byte > value );
encoded_kv
encode_reference( std::span< const std::byte > key, std::span< const std::byte > referenced_key, std::uint64_t at_tx );
encoded_kv
encode_zadd( std::span< const std::byte > set, double score, std::span< const std::byte > key, std::uint64_t at_tx );

struct plain_entry
{
  bytes key;
  bytes value;

  encoded_kv encode() const;
};

// `key` resolves to the value of `referenced_key` as of `at_tx` (0 = latest).
struct reference_entry
{
  bytes key;
  bytes referenced_key;
  std::uint64_t at_tx = 0;

  encoded_kv encode() const;
};

struct sorted_set_entry
{
  bytes set;
  double score = 0;
  bytes key;
  std::uint64_t at_tx = 0;

  encoded_kv encode() const;
};

using entry = std::variant< plain_entry, reference_entry, sorted_set_entry >;

encoded_kv encode( const entry& e );
crypto::digest entry_digest( const entry& e );

} // namespace attest::store
