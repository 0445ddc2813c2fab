#pragma once

#include <cstdint>
#include <span>

#include <attest/crypto/error.hpp>
#include <attest/crypto/hash.hpp>

namespace attest::crypto {

constexpr std::byte leaf_prefix{ 0x00 };
constexpr std::byte node_prefix{ 0x01 };

digest leaf_hash( const digest& value ) noexcept;
digest node_hash( const digest& left, const digest& right ) noexcept;

/**
 * Walks an RFC 9162 audit path from `leaf` (a leaf node hash, see leaf_hash) at
 * position `index` of a `size` leaf tree.
 *
 * Returns invalid_leaf_index or invalid_tree_size when the position cannot
 * exist, otherwise whether the reconstructed root equals `root`. A path of the
 * wrong length yields false.
 */
result< bool > verify_inclusion( std::span< const digest > path,
                                 std::uint64_t index,
                                 std::uint64_t size,
                                 const digest& leaf,
                                 const digest& root ) noexcept;

/**
 * Verifies that the tree of `first` leaves with root `first_root` is a prefix
 * of the tree of `second` leaves with root `second_root` (RFC 9162 2.1.4.2).
 */
result< bool > verify_consistency( std::span< const digest > path,
                                   std::uint64_t first,
                                   std::uint64_t second,
                                   const digest& first_root,
                                   const digest& second_root ) noexcept;

} // namespace attest::crypto
