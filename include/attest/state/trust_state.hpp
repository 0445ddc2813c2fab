#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <vector>

#include <boost/serialization/array.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include <attest/crypto/hash.hpp>
#include <attest/crypto/public_key.hpp>

namespace attest::state {

// The highest log state a client accepts for one database.
struct trust_state
{
  std::string database;
  std::uint64_t tx_id = 0;
  crypto::digest tx_hash{};
  std::vector< std::byte > signature;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & database;
    ar & tx_id;
    ar & tx_hash;
    ar & signature;
  }

  bool operator==( const trust_state& ) const = default;
};

// u32be( len database ) || database || u64be( tx_id ) || tx_hash
std::vector< std::byte > signing_bytes( const trust_state& s );

bool check_signature( const trust_state& s, const crypto::public_key& key );

struct state_key
{
  std::string server;
  std::string database;

  auto operator<=>( const state_key& ) const = default;
};

} // namespace attest::state
