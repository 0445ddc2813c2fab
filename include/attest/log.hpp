#pragma once

#include <attest/log/log.hpp>
