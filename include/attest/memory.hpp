#pragma once

#include <attest/memory/memory.hpp>
