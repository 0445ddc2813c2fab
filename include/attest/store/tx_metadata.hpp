#pragma once

#include <cstdint>

#include <attest/crypto/hash.hpp>

namespace attest::store {

struct tx_metadata
{
  std::uint64_t id = 0;
  crypto::digest prev_alh{};
  std::int64_t ts        = 0;
  std::uint32_t nentries = 0;
  crypto::digest eh{};
  std::uint64_t bl_tx_id = 0;
  crypto::digest bl_root{};

  // H( ts || nentries || eh || bl_tx_id || bl_root )
  crypto::digest inner_hash() const noexcept;

  // Accumulated linear hash: H( id || prev_alh || inner_hash ).
  crypto::digest alh() const noexcept;

  bool operator==( const tx_metadata& ) const = default;
};

} // namespace attest::store
