#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>

#include <attest/encode.hpp>

namespace attest::log {

struct hex_tag
{};

// Binary data rendered as 0x-prefixed hex on the backend thread.
using hex = quill::BinaryData< hex_tag >;

} // namespace attest::log

template<>
struct fmtquill::formatter< attest::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const attest::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                attest::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< attest::log::hex >: quill::BinaryDataDeferredFormatCodec< attest::log::hex >
{};
