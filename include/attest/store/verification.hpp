#pragma once

#include <cstdint>

#include <attest/crypto/hash.hpp>
#include <attest/store/error.hpp>
#include <attest/store/proof.hpp>

namespace attest::store {

/**
 * Checks that `entry_digest` (see encoded_kv::digest) sits at proof.leaf of an
 * entries tree whose root is `root`.
 *
 * A leaf outside the tree is a malformed_proof error; every other mismatch is
 * a false result.
 */
result< bool > verify_inclusion( const inclusion_proof& proof,
                                 const crypto::digest& entry_digest,
                                 const crypto::digest& root ) noexcept;

result< bool > verify_linear_proof( const linear_proof& proof,
                                    std::uint64_t source_tx_id,
                                    std::uint64_t target_tx_id,
                                    const crypto::digest& source_alh,
                                    const crypto::digest& target_alh ) noexcept;

/**
 * Checks that the log state (source_tx_id, source_alh) is a prefix of the
 * state (target_tx_id, target_alh).
 *
 * The binary linking tree of the target must contain the source alh (or the
 * source must already be past it), be consistent with the source's own linking
 * tree and end in target_bl_tx_alh. The linear proof then chains alh values up
 * to the target.
 */
result< bool > verify_dual_proof( const dual_proof& proof,
                                  std::uint64_t source_tx_id,
                                  std::uint64_t target_tx_id,
                                  const crypto::digest& source_alh,
                                  const crypto::digest& target_alh ) noexcept;

} // namespace attest::store
