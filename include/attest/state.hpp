#pragma once

#include <attest/state/error.hpp>
#include <attest/state/state_store.hpp>
#include <attest/state/trust_cache.hpp>
#include <attest/state/trust_state.hpp>
