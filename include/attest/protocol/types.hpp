#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <attest/crypto/hash.hpp>
#include <attest/store/entry.hpp>
#include <attest/store/proof.hpp>
#include <attest/store/tx.hpp>

namespace attest::protocol {

using bytes = store::bytes;

// Raw data as returned by the server. None of these carry an entry digest.

struct reference
{
  std::uint64_t tx = 0;
  bytes key;
  std::uint64_t at_tx = 0;
};

struct entry
{
  std::uint64_t tx = 0;
  bytes key;
  bytes value;
  std::optional< protocol::reference > referenced_by;
};

struct verifiable_tx
{
  store::tx tx;
  store::dual_proof dual_proof;
  std::vector< std::byte > signature;
};

struct verifiable_entry
{
  protocol::entry entry;
  protocol::verifiable_tx verifiable_tx;
  store::inclusion_proof inclusion_proof;
};

struct immutable_state
{
  std::string database;
  std::uint64_t tx_id = 0;
  crypto::digest tx_hash{};
  std::vector< std::byte > signature;
};

struct key_request
{
  bytes key;
  std::uint64_t at_tx    = 0;
  std::uint64_t since_tx = 0;
};

struct verifiable_get_request
{
  protocol::key_request key_request;
  std::uint64_t prove_since_tx = 0;
};

struct verifiable_set_request
{
  bytes key;
  bytes value;
  std::uint64_t prove_since_tx = 0;
};

struct verifiable_reference_request
{
  bytes key;
  bytes referenced_key;
  std::uint64_t at_tx          = 0;
  std::uint64_t prove_since_tx = 0;
};

struct verifiable_zadd_request
{
  bytes set;
  double score = 0;
  bytes key;
  std::uint64_t at_tx          = 0;
  std::uint64_t prove_since_tx = 0;
};

struct verifiable_tx_request
{
  std::uint64_t tx             = 0;
  std::uint64_t prove_since_tx = 0;
};

} // namespace attest::protocol
