#include <gtest/gtest.h>

#include <swapwire/encode/base58.hpp>
#include <swapwire/protocol/identifier.hpp>

#include <test/fixture.hpp>

using namespace std::string_view_literals;
using swapwire::encode::encode_errc;
namespace protocol = swapwire::protocol;

TEST( base58, leading_zero_bytes )
{
  EXPECT_EQ( swapwire::encode::to_base58( test::make_bytes( { 0, 0, 1 } ) ), "112" );
  EXPECT_EQ( swapwire::encode::to_base58( {} ), "" );

  auto decoded = swapwire::encode::from_base58( "112"sv );
  ASSERT_TRUE( decoded );
  EXPECT_EQ( *decoded, test::make_bytes( { 0, 0, 1 } ) );
}

TEST( base58, well_known_keys )
{
  auto system_program = protocol::identifier_from_base58( "11111111111111111111111111111111"sv );
  ASSERT_TRUE( system_program );
  EXPECT_EQ( *system_program, protocol::identifier{} );
  EXPECT_EQ( protocol::to_base58( *system_program ), "11111111111111111111111111111111" );

  auto token_program = protocol::identifier_from_base58( "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA"sv );
  ASSERT_TRUE( token_program );
  EXPECT_EQ( token_program->front(), std::byte{ 0x06 } );
  EXPECT_EQ( token_program->back(), std::byte{ 0xa9 } );
  EXPECT_EQ( protocol::to_base58( *token_program ), "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA" );
}

TEST( base58, identifier_text_form )
{
  for( std::uint8_t seed: { 0x00, 0x10, 0x7f, 0xf0 } )
  {
    auto id   = test::make_identifier( seed );
    auto text = protocol::to_base58( id );

    auto decoded = protocol::identifier_from_base58( text );
    ASSERT_TRUE( decoded ) << text;
    EXPECT_EQ( *decoded, id );
  }
}

TEST( base58, key_length )
{
  auto short_key = protocol::identifier_from_base58( "2g"sv );
  ASSERT_FALSE( short_key );
  EXPECT_EQ( short_key.error(), encode_errc::invalid_key_length );
  EXPECT_EQ( short_key.error().message(), "decoded key has the wrong length" );

  // 33 bytes: a valid key with one more leading zero byte
  auto long_key = protocol::identifier_from_base58( "111111111111111111111111111111111"sv );
  ASSERT_FALSE( long_key );
  EXPECT_EQ( long_key.error(), encode_errc::invalid_key_length );

  auto raw = swapwire::encode::from_base58( "2g"sv, 1 );
  ASSERT_TRUE( raw );
  EXPECT_EQ( *raw, test::make_bytes( { 0x61 } ) );
}

TEST( base58, invalid_digit )
{
  // 0, O, I and l are not in the alphabet
  for( auto text: { "0TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA"sv, "Sysvar0lock"sv, "IO"sv } )
  {
    auto decoded = protocol::identifier_from_base58( text );
    ASSERT_FALSE( decoded ) << text;
    EXPECT_EQ( decoded.error(), encode_errc::invalid_base58_digit );
  }
}
