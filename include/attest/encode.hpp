#pragma once

#include <attest/encode/error.hpp>
#include <attest/encode/hex.hpp>
