#include <attest/crypto/merkle_proof.hpp>

#include <bit>

namespace attest::crypto {

namespace {

constexpr bool lsb( std::uint64_t n ) noexcept
{
  return ( n & 1u ) != 0;
}

} // namespace

digest leaf_hash( const digest& value ) noexcept
{
  hasher_reset();
  hasher_update( &leaf_prefix, sizeof( leaf_prefix ) );
  hasher_update( value );
  return hasher_finalize();
}

digest node_hash( const digest& left, const digest& right ) noexcept
{
  hasher_reset();
  hasher_update( &node_prefix, sizeof( node_prefix ) );
  hasher_update( left );
  hasher_update( right );
  return hasher_finalize();
}

result< bool > verify_inclusion( std::span< const digest > path,
                                 std::uint64_t index,
                                 std::uint64_t size,
                                 const digest& leaf,
                                 const digest& root ) noexcept
{
  if( size == 0 )
    return std::unexpected( crypto_errc::invalid_tree_size );

  if( index >= size )
    return std::unexpected( crypto_errc::invalid_leaf_index );

  std::uint64_t fn = index;
  std::uint64_t sn = size - 1;
  digest r         = leaf;

  for( const auto& p: path )
  {
    if( sn == 0 )
      return false;

    if( lsb( fn ) || fn == sn )
    {
      r = node_hash( p, r );

      while( !lsb( fn ) && fn != 0 )
      {
        fn >>= 1;
        sn >>= 1;
      }
    }
    else
    {
      r = node_hash( r, p );
    }

    fn >>= 1;
    sn >>= 1;
  }

  return sn == 0 && r == root;
}

result< bool > verify_consistency( std::span< const digest > path,
                                   std::uint64_t first,
                                   std::uint64_t second,
                                   const digest& first_root,
                                   const digest& second_root ) noexcept
{
  if( first == 0 || first > second )
    return std::unexpected( crypto_errc::invalid_tree_size );

  if( first == second )
    return path.empty() && first_root == second_root;

  if( path.empty() )
    return false;

  // A complete subtree is its own first proof node.
  std::size_t next = 0;
  digest seed;
  if( std::has_single_bit( first ) )
  {
    seed = first_root;
  }
  else
  {
    seed = path[ 0 ];
    next = 1;
  }

  std::uint64_t fn = first - 1;
  std::uint64_t sn = second - 1;

  while( lsb( fn ) )
  {
    fn >>= 1;
    sn >>= 1;
  }

  digest fr = seed;
  digest sr = seed;

  for( const auto& c: path.subspan( next ) )
  {
    if( sn == 0 )
      return false;

    if( lsb( fn ) || fn == sn )
    {
      fr = node_hash( c, fr );
      sr = node_hash( c, sr );

      while( !lsb( fn ) && fn != 0 )
      {
        fn >>= 1;
        sn >>= 1;
      }
    }
    else
    {
      sr = node_hash( sr, c );
    }

    fn >>= 1;
    sn >>= 1;
  }

  return fr == first_root && sr == second_root && sn == 0;
}

} // namespace attest::crypto
