#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include <attest/crypto/error.hpp>
#include <attest/crypto/hash.hpp>

namespace attest::crypto {

/**
 * RFC 6962 Merkle Tree Hash over an append-only sequence of values.
 *
 * Each value becomes the leaf node leaf_hash( value ); the left subtree of an
 * n leaf tree holds the largest power of two strictly below n. Every query can
 * be asked against any prefix of the tree, which is how the proofs for older
 * tree sizes are produced.
 */
class merkle_tree final
{
public:
  merkle_tree() noexcept = default;
  explicit merkle_tree( std::span< const digest > values );

  merkle_tree( const merkle_tree& other )            = default;
  merkle_tree( merkle_tree&& other ) noexcept        = default;
  merkle_tree& operator=( const merkle_tree& rhs )   = default;
  merkle_tree& operator=( merkle_tree&& rhs ) noexcept = default;
  ~merkle_tree() noexcept                            = default;

  void append( const digest& value );

  std::uint64_t size() const noexcept;

  // The zero digest for an empty tree.
  digest root() const noexcept;
  result< digest > root( std::uint64_t size ) const noexcept;

  result< std::vector< digest > > inclusion_proof( std::uint64_t index ) const;
  result< std::vector< digest > > inclusion_proof( std::uint64_t index, std::uint64_t size ) const;
  result< std::vector< digest > > consistency_proof( std::uint64_t first, std::uint64_t second ) const;

private:
  digest subtree_root( std::uint64_t begin, std::uint64_t end ) const noexcept;
  void path( std::uint64_t index, std::uint64_t begin, std::uint64_t end, std::vector< digest >& out ) const;
  void subproof( std::uint64_t first,
                 std::uint64_t begin,
                 std::uint64_t end,
                 bool complete,
                 std::vector< digest >& out ) const;

  std::vector< digest > _leaves;
};

} // namespace attest::crypto
