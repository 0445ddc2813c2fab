#pragma once

#include <string>

#include <attest/client/error.hpp>
#include <attest/protocol/types.hpp>

namespace attest::client {

/**
 * The remote ledger as seen by the verification core. An implementation owns
 * sessions, authentication and the wire format; every call is one blocking
 * round trip and any failure it reports is passed to the caller unchanged.
 */
class ledger_service
{
public:
  ledger_service()                                   = default;
  ledger_service( const ledger_service& )            = delete;
  ledger_service( ledger_service&& )                 = delete;
  ledger_service& operator=( const ledger_service& ) = delete;
  ledger_service& operator=( ledger_service&& )      = delete;
  virtual ~ledger_service()                          = default;

  virtual result< protocol::immutable_state > current_state( const std::string& database ) = 0;

  virtual result< protocol::verifiable_entry >
  verifiable_get( const std::string& database, const protocol::verifiable_get_request& request ) = 0;

  virtual result< protocol::verifiable_tx >
  verifiable_set( const std::string& database, const protocol::verifiable_set_request& request ) = 0;

  virtual result< protocol::verifiable_tx >
  verifiable_set_reference( const std::string& database, const protocol::verifiable_reference_request& request ) = 0;

  virtual result< protocol::verifiable_tx >
  verifiable_zadd( const std::string& database, const protocol::verifiable_zadd_request& request ) = 0;

  virtual result< protocol::verifiable_tx >
  verifiable_tx_by_id( const std::string& database, const protocol::verifiable_tx_request& request ) = 0;
};

} // namespace attest::client
