#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <attest/log/formatter.hpp>
#include <attest/log/frontend.hpp>

namespace attest::log {

void initialize() noexcept;
logger* instance() noexcept;

// Returns false when the level name is not recognised.
bool set_level( std::string_view level ) noexcept;

} // namespace attest::log
