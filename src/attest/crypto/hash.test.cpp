// NOLINTBEGIN

#include <gtest/gtest.h>

#include <attest/crypto/hash.hpp>
#include <attest/encode.hpp>
#include <attest/memory.hpp>

TEST( hash, sha256 )
{
  auto empty = attest::crypto::hash( "" );
  EXPECT_EQ( attest::encode::to_hex( empty, attest::encode::hex_prefix::none ),
             "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855" );

  auto abc = attest::crypto::hash( "abc" );
  EXPECT_EQ( attest::encode::to_hex( abc, attest::encode::hex_prefix::none ),
             "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad" );

  auto abc_bytes = attest::crypto::hash( attest::memory::as_bytes( std::string( "abc" ) ) );
  EXPECT_EQ( abc, abc_bytes );
}

TEST( hash, streaming )
{
  attest::crypto::hasher_reset();
  attest::crypto::hasher_update( std::string_view( "a" ) );
  attest::crypto::hasher_update( std::string_view( "bc" ) );
  auto streamed = attest::crypto::hasher_finalize();

  EXPECT_EQ( streamed, attest::crypto::hash( "abc" ) );

  // Finalizing leaves the hasher ready for the next digest.
  attest::crypto::hasher_update( std::string_view( "abc" ) );
  EXPECT_EQ( attest::crypto::hasher_finalize(), streamed );
}

TEST( hash, integers_are_big_endian )
{
  std::uint64_t number = 12'345;
  std::array< std::byte, 8 > expected{ std::byte{ 0x00 },
                                       std::byte{ 0x00 },
                                       std::byte{ 0x00 },
                                       std::byte{ 0x00 },
                                       std::byte{ 0x00 },
                                       std::byte{ 0x00 },
                                       std::byte{ 0x30 },
                                       std::byte{ 0x39 } };

  EXPECT_EQ( attest::crypto::hash( number ), attest::crypto::hash( std::span< const std::byte >( expected ) ) );

  std::uint32_t small = 1;
  std::array< std::byte, 4 > small_expected{ std::byte{ 0x00 }, std::byte{ 0x00 }, std::byte{ 0x00 }, std::byte{ 0x01 } };
  EXPECT_EQ( attest::crypto::hash( small ), attest::crypto::hash( std::span< const std::byte >( small_expected ) ) );
}

// NOLINTEND
