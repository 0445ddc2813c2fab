#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <attest/crypto/hash.hpp>
#include <attest/store/tx_metadata.hpp>

namespace attest::store {

// Audit path for leaf `leaf` of an entries tree holding `width` leaves.
struct inclusion_proof
{
  std::uint64_t leaf  = 0;
  std::uint64_t width = 0;
  std::vector< crypto::digest > terms;
};

/**
 * terms[ 0 ] is the alh of source_tx_id and terms[ i ] the inner hash of
 * transaction source_tx_id + i.
 */
struct linear_proof
{
  std::uint64_t source_tx_id = 0;
  std::uint64_t target_tx_id = 0;
  std::vector< crypto::digest > terms;
};

/**
 * Links two log states. The binary linking (bl) tree of a transaction is the
 * Merkle tree over the alh values of transactions 1..bl_tx_id.
 */
struct dual_proof
{
  std::optional< tx_metadata > source_tx_metadata;
  std::optional< tx_metadata > target_tx_metadata;
  std::vector< crypto::digest > bl_inclusion_proof;
  std::vector< crypto::digest > bl_consistency_proof;
  crypto::digest target_bl_tx_alh{};
  std::vector< crypto::digest > bl_last_inclusion_proof;
  store::linear_proof linear;
};

} // namespace attest::store
