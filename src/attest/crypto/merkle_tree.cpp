#include <attest/crypto/merkle_proof.hpp>
#include <attest/crypto/merkle_tree.hpp>

#include <bit>

namespace attest::crypto {

namespace {

// Largest power of two strictly less than n, for n > 1.
constexpr std::uint64_t split_point( std::uint64_t n ) noexcept
{
  return std::bit_floor( n - 1 );
}

} // namespace

merkle_tree::merkle_tree( std::span< const digest > values )
{
  _leaves.reserve( values.size() );

  for( const auto& value: values )
    _leaves.emplace_back( leaf_hash( value ) );
}

void merkle_tree::append( const digest& value )
{
  _leaves.emplace_back( leaf_hash( value ) );
}

std::uint64_t merkle_tree::size() const noexcept
{
  return _leaves.size();
}

digest merkle_tree::root() const noexcept
{
  if( _leaves.empty() )
    return digest{};

  return subtree_root( 0, _leaves.size() );
}

result< digest > merkle_tree::root( std::uint64_t size ) const noexcept
{
  if( size == 0 || size > _leaves.size() )
    return std::unexpected( crypto_errc::invalid_tree_size );

  return subtree_root( 0, size );
}

result< std::vector< digest > > merkle_tree::inclusion_proof( std::uint64_t index ) const
{
  return inclusion_proof( index, _leaves.size() );
}

result< std::vector< digest > > merkle_tree::inclusion_proof( std::uint64_t index, std::uint64_t size ) const
{
  if( size == 0 || size > _leaves.size() )
    return std::unexpected( crypto_errc::invalid_tree_size );

  if( index >= size )
    return std::unexpected( crypto_errc::invalid_leaf_index );

  std::vector< digest > out;
  path( index, 0, size, out );
  return out;
}

result< std::vector< digest > > merkle_tree::consistency_proof( std::uint64_t first, std::uint64_t second ) const
{
  if( first == 0 || first > second || second > _leaves.size() )
    return std::unexpected( crypto_errc::invalid_tree_size );

  std::vector< digest > out;

  if( first < second )
    subproof( first, 0, second, true, out );

  return out;
}

digest merkle_tree::subtree_root( std::uint64_t begin, std::uint64_t end ) const noexcept
{
  auto n = end - begin;

  if( n == 1 )
    return _leaves[ begin ];

  auto k = split_point( n );
  return node_hash( subtree_root( begin, begin + k ), subtree_root( begin + k, end ) );
}

void merkle_tree::path( std::uint64_t index, std::uint64_t begin, std::uint64_t end, std::vector< digest >& out ) const
{
  auto n = end - begin;

  if( n <= 1 )
    return;

  auto k = split_point( n );

  if( index < k )
  {
    path( index, begin, begin + k, out );
    out.emplace_back( subtree_root( begin + k, end ) );
  }
  else
  {
    path( index - k, begin + k, end, out );
    out.emplace_back( subtree_root( begin, begin + k ) );
  }
}

void merkle_tree::subproof( std::uint64_t first,
                            std::uint64_t begin,
                            std::uint64_t end,
                            bool complete,
                            std::vector< digest >& out ) const
{
  auto n = end - begin;

  if( first == n )
  {
    if( !complete )
      out.emplace_back( subtree_root( begin, end ) );

    return;
  }

  auto k = split_point( n );

  if( first <= k )
  {
    subproof( first, begin, begin + k, complete, out );
    out.emplace_back( subtree_root( begin + k, end ) );
  }
  else
  {
    subproof( first - k, begin + k, end, false, out );
    out.emplace_back( subtree_root( begin, begin + k ) );
  }
}

} // namespace attest::crypto
