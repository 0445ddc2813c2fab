#pragma once

#include <attest/client/client.hpp>
#include <attest/client/error.hpp>
#include <attest/client/ledger_service.hpp>
#include <attest/client/options.hpp>
