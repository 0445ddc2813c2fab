#pragma once

#include <attest/crypto/error.hpp>
#include <attest/crypto/hash.hpp>
#include <attest/crypto/merkle_proof.hpp>
#include <attest/crypto/merkle_tree.hpp>
#include <attest/crypto/public_key.hpp>
