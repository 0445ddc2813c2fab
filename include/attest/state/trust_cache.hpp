#pragma once

#include <memory>
#include <mutex>
#include <optional>

#include <attest/crypto/public_key.hpp>
#include <attest/state/error.hpp>
#include <attest/state/state_store.hpp>
#include <attest/state/trust_state.hpp>

namespace attest::state {

/**
 * The client's root of trust, one trust_state per (server, database).
 *
 * set() only ever moves a state forward. When a verifying key is configured
 * every accepted state must carry a valid signature. The read, check and
 * write of set() happen under one lock, so concurrent callers cannot lose an
 * update or regress the stored transaction id.
 */
class trust_cache final
{
public:
  trust_cache();
  explicit trust_cache( std::shared_ptr< state_store > store );

  trust_cache( const trust_cache& )            = delete;
  trust_cache( trust_cache&& )                 = delete;
  trust_cache& operator=( const trust_cache& ) = delete;
  trust_cache& operator=( trust_cache&& )      = delete;
  ~trust_cache()                               = default;

  void set_verifying_key( std::optional< crypto::public_key > key );
  std::optional< crypto::public_key > verifying_key() const;

  result< std::optional< trust_state > > get( const state_key& key ) const;

  /**
   * Returns true when the cache advanced, false when `s` is not newer than the
   * stored state. Signature failures are errors and leave the cache untouched.
   */
  result< bool > set( const state_key& key, const trust_state& s );

  result< void > reset( const state_key& key );

private:
  result< void > check( const state_key& key, const trust_state& s ) const;

  mutable std::mutex _mutex;
  std::shared_ptr< state_store > _store;
  std::optional< crypto::public_key > _verifying_key;
};

} // namespace attest::state
