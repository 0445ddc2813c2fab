#pragma once

#include <attest/store/entry.hpp>
#include <attest/store/error.hpp>
#include <attest/store/proof.hpp>
#include <attest/store/tx.hpp>
#include <attest/store/tx_metadata.hpp>
#include <attest/store/verification.hpp>
