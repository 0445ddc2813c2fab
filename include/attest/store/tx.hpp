#pragma once

#include <span>
#include <vector>

#include <attest/crypto/hash.hpp>
#include <attest/store/entry.hpp>
#include <attest/store/error.hpp>
#include <attest/store/proof.hpp>
#include <attest/store/tx_metadata.hpp>

namespace attest::store {

struct tx_entry
{
  bytes key;
  crypto::digest value_hash{};

  crypto::digest digest() const noexcept;
};

tx_entry make_tx_entry( const encoded_kv& kv );

struct tx
{
  tx_metadata metadata;
  std::vector< tx_entry > entries;

  // Recomputed from the entries, independent of metadata.eh.
  crypto::digest entries_root() const;

  result< inclusion_proof > proof( std::span< const std::byte > key ) const;
};

} // namespace attest::store
