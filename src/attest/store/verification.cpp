#include <attest/store/verification.hpp>

#include <attest/crypto/merkle_proof.hpp>
#include <attest/store/tx_metadata.hpp>

namespace attest::store {

namespace {

result< bool > as_store_result( const crypto::result< bool >& r ) noexcept
{
  if( !r )
    return std::unexpected( store_errc::malformed_proof );

  return *r;
}

} // namespace

result< bool > verify_inclusion( const inclusion_proof& proof,
                                 const crypto::digest& entry_digest,
                                 const crypto::digest& root ) noexcept
{
  return as_store_result(
    crypto::verify_inclusion( proof.terms, proof.leaf, proof.width, crypto::leaf_hash( entry_digest ), root ) );
}

result< bool > verify_linear_proof( const linear_proof& proof,
                                    std::uint64_t source_tx_id,
                                    std::uint64_t target_tx_id,
                                    const crypto::digest& source_alh,
                                    const crypto::digest& target_alh ) noexcept
{
  if( proof.source_tx_id != source_tx_id || proof.target_tx_id != target_tx_id )
    return false;

  if( proof.source_tx_id == 0 || proof.source_tx_id > proof.target_tx_id )
    return false;

  if( proof.terms.empty() || proof.terms.front() != source_alh )
    return false;

  if( proof.terms.size() != target_tx_id - source_tx_id + 1 )
    return false;

  auto calculated_alh = proof.terms.front();

  for( std::size_t i = 1; i < proof.terms.size(); ++i )
  {
    crypto::hasher_reset();
    crypto::hasher_update( proof.source_tx_id + i );
    crypto::hasher_update( calculated_alh );
    crypto::hasher_update( proof.terms[ i ] );
    calculated_alh = crypto::hasher_finalize();
  }

  return calculated_alh == target_alh;
}

result< bool > verify_dual_proof( const dual_proof& proof,
                                  std::uint64_t source_tx_id,
                                  std::uint64_t target_tx_id,
                                  const crypto::digest& source_alh,
                                  const crypto::digest& target_alh ) noexcept
{
  if( !proof.source_tx_metadata || !proof.target_tx_metadata )
    return std::unexpected( store_errc::missing_tx_metadata );

  const auto& source = *proof.source_tx_metadata;
  const auto& target = *proof.target_tx_metadata;

  if( source.id != source_tx_id || target.id != target_tx_id )
    return false;

  if( source.id == 0 || source.id > target.id )
    return false;

  if( source.alh() != source_alh || target.alh() != target_alh )
    return false;

  if( source_tx_id < target.bl_tx_id )
  {
    auto included = as_store_result( crypto::verify_inclusion( proof.bl_inclusion_proof,
                                                               source_tx_id - 1,
                                                               target.bl_tx_id,
                                                               crypto::leaf_hash( source_alh ),
                                                               target.bl_root ) );
    if( !included || !*included )
      return included;
  }

  if( source.bl_tx_id > 0 )
  {
    auto consistent = as_store_result( crypto::verify_consistency( proof.bl_consistency_proof,
                                                                   source.bl_tx_id,
                                                                   target.bl_tx_id,
                                                                   source.bl_root,
                                                                   target.bl_root ) );
    if( !consistent || !*consistent )
      return consistent;
  }

  if( target.bl_tx_id > 0 )
  {
    auto last_included = as_store_result( crypto::verify_inclusion( proof.bl_last_inclusion_proof,
                                                                    target.bl_tx_id - 1,
                                                                    target.bl_tx_id,
                                                                    crypto::leaf_hash( proof.target_bl_tx_alh ),
                                                                    target.bl_root ) );
    if( !last_included || !*last_included )
      return last_included;
  }

  if( source_tx_id < target.bl_tx_id )
    return verify_linear_proof( proof.linear, target.bl_tx_id, target_tx_id, proof.target_bl_tx_alh, target_alh );

  return verify_linear_proof( proof.linear, source_tx_id, target_tx_id, source_alh, target_alh );
}

} // namespace attest::store
