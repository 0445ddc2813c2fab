#pragma once

#include <attest/protocol/types.hpp>
