#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <attest/client.hpp>
#include <attest/crypto.hpp>
#include <attest/memory.hpp>
#include <attest/protocol.hpp>
#include <attest/state.hpp>
#include <attest/store.hpp>

struct evp_pkey_st;

namespace test {

inline attest::store::bytes to_bytes( std::string_view sv )
{
  auto b = attest::memory::as_bytes( sv );
  return attest::store::bytes( b.begin(), b.end() );
}

inline std::string to_string( std::span< const std::byte > b )
{
  return std::string( attest::memory::pointer_cast< const char* >( b.data() ), b.size() );
}

/**
 * A server signing key generated in memory. Signatures follow the scheme the
 * client checks: ECDSA over SHA-256 for EC keys, pure Ed25519 otherwise.
 */
class signing_key final
{
public:
  enum class type : std::uint8_t
  {
    ec_p256,
    ed25519
  };

  explicit signing_key( type t = type::ec_p256 );

  std::vector< std::byte > sign( std::span< const std::byte > message ) const;
  std::string public_pem() const;

private:
  std::shared_ptr< evp_pkey_st > _key;
  type _type;
};

/**
 * An in-memory append-only ledger that answers the verifiable calls with real
 * proofs. Responses pass through the tamper hooks before they are returned,
 * which is how tests play a dishonest server.
 */
class mock_ledger final: public attest::client::ledger_service
{
public:
  explicit mock_ledger( std::string database = "defaultdb", signing_key::type key_type = signing_key::type::ec_p256 );

  // Commits directly, bypassing verification. Returns the new transaction id.
  std::uint64_t commit( const std::vector< attest::store::entry >& entries );
  std::uint64_t set( std::string_view key, std::string_view value );
  std::uint64_t set_reference( std::string_view referenced_key, std::string_view key, std::uint64_t at_tx = 0 );
  std::uint64_t zadd( std::string_view set, double score, std::string_view key, std::uint64_t at_tx = 0 );

  std::uint64_t last_tx_id() const;
  attest::store::tx tx( std::uint64_t id ) const;
  attest::crypto::digest alh( std::uint64_t id ) const;
  attest::store::dual_proof dual_proof( std::uint64_t source, std::uint64_t target ) const;

  // The signed state of the ledger at transaction `id`.
  attest::state::trust_state signed_state( std::uint64_t id ) const;

  const std::string& database() const noexcept;
  std::string public_pem() const;
  void sign_states( bool enabled );

  // The next call fails with `ec` before touching the ledger.
  void fail_next( std::error_code ec );

  std::function< void( attest::protocol::verifiable_entry& ) > on_entry;
  std::function< void( attest::protocol::verifiable_tx& ) > on_tx;
  std::function< void( attest::protocol::immutable_state& ) > on_state;

  std::uint64_t calls() const;

  attest::client::result< attest::protocol::immutable_state > current_state( const std::string& database ) override;

  attest::client::result< attest::protocol::verifiable_entry >
  verifiable_get( const std::string& database, const attest::protocol::verifiable_get_request& request ) override;

  attest::client::result< attest::protocol::verifiable_tx >
  verifiable_set( const std::string& database, const attest::protocol::verifiable_set_request& request ) override;

  attest::client::result< attest::protocol::verifiable_tx >
  verifiable_set_reference( const std::string& database,
                            const attest::protocol::verifiable_reference_request& request ) override;

  attest::client::result< attest::protocol::verifiable_tx >
  verifiable_zadd( const std::string& database, const attest::protocol::verifiable_zadd_request& request ) override;

  attest::client::result< attest::protocol::verifiable_tx >
  verifiable_tx_by_id( const std::string& database, const attest::protocol::verifiable_tx_request& request ) override;

private:
  struct located
  {
    std::uint64_t tx = 0;
    attest::store::entry entry;
  };

  attest::client::result< void > begin_call( const std::string& database );
  std::uint64_t commit_locked( const std::vector< attest::store::entry >& entries );
  std::optional< located > find_locked( std::span< const std::byte > key, std::uint64_t at_tx ) const;
  attest::store::dual_proof dual_proof_locked( std::uint64_t source, std::uint64_t target ) const;
  attest::store::linear_proof linear_proof_locked( std::uint64_t source, std::uint64_t target ) const;
  attest::state::trust_state signed_state_locked( std::uint64_t id ) const;
  attest::protocol::verifiable_tx verifiable_tx_locked( std::uint64_t id, std::uint64_t prove_since_tx ) const;

  mutable std::mutex _mutex;
  std::string _database;
  signing_key _key;
  bool _sign_states = true;
  std::optional< std::error_code > _failure;
  std::uint64_t _calls = 0;

  std::vector< attest::store::tx > _txs;
  std::vector< std::vector< attest::store::entry > > _entries;
  std::vector< attest::crypto::digest > _alhs;
  attest::crypto::merkle_tree _bl_tree;
};

/**
 * A client wired to a mock ledger through an in-memory trust cache.
 */
struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  explicit fixture( const std::string& log_level = "info",
                    signing_key::type key_type   = signing_key::type::ec_p256 );
  ~fixture() = default;

  attest::state::state_key key() const;

  // The trusted transaction id, 0 when nothing is trusted yet.
  std::uint64_t trusted_tx_id() const;

  // Stores the ledger's signed state at `id` as the trusted state.
  void trust( std::uint64_t id );

  std::shared_ptr< mock_ledger > _ledger;
  std::shared_ptr< attest::state::trust_cache > _cache;
  std::unique_ptr< attest::client::client > _client;
};

} // namespace test
