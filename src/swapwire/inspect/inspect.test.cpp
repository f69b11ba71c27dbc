#include <gtest/gtest.h>

#include <swapwire/codec/error.hpp>
#include <swapwire/encode/hex.hpp>
#include <swapwire/farm/instruction.hpp>
#include <swapwire/inspect/inspect.hpp>
#include <swapwire/program/error.hpp>
#include <swapwire/protocol/identifier.hpp>
#include <swapwire/state/program_config.hpp>
#include <swapwire/state/versioned_pool_state.hpp>

#include <test/fixture.hpp>

using swapwire::inspect::payload_kind;
namespace inspect  = swapwire::inspect;
namespace protocol = swapwire::protocol;

TEST( inspect, parse_kind )
{
  EXPECT_EQ( inspect::parse_kind( "instruction" ), payload_kind::instruction );
  EXPECT_EQ( inspect::parse_kind( "farm-instruction" ), payload_kind::farm_instruction );
  EXPECT_EQ( inspect::parse_kind( "pool" ), payload_kind::pool );
  EXPECT_EQ( inspect::parse_kind( "config" ), payload_kind::config );

  auto unknown = inspect::parse_kind( "vault" );
  ASSERT_FALSE( unknown );
  EXPECT_EQ( unknown.error(), std::errc::invalid_argument );

  EXPECT_FALSE( inspect::parse_kind( "farm_instruction" ) );
}

TEST( inspect, instruction )
{
  auto bytes = swapwire::encode::from_hex( "01 40 42 0f 00 00 00 00 00 30 1b 0f 00 00 00 00 00" );
  ASSERT_TRUE( bytes );

  auto lines = inspect::describe( payload_kind::instruction, *bytes );
  ASSERT_TRUE( lines );
  ASSERT_EQ( lines->size(), 1 );
  EXPECT_EQ( lines->front(), "swap amount_in=1000000 minimum_amount_out=990000" );

  auto rejected = inspect::describe( payload_kind::instruction, test::make_bytes( { 0x09 } ) );
  ASSERT_FALSE( rejected );
  EXPECT_EQ( rejected.error(), swapwire::program::program_errc::invalid_instruction_data );
}

TEST( inspect, farm_instruction )
{
  auto bytes = swapwire::farm::encode( swapwire::farm::withdraw{ .amount = 42 } );

  auto lines = inspect::describe( payload_kind::farm_instruction, bytes );
  ASSERT_TRUE( lines );
  ASSERT_EQ( lines->size(), 1 );
  EXPECT_EQ( lines->front(), "withdraw amount=42" );

  bytes.push_back( std::byte{ 0x00 } );
  auto trailing = inspect::describe( payload_kind::farm_instruction, bytes );
  ASSERT_FALSE( trailing );
  EXPECT_EQ( trailing.error(), swapwire::codec::codec_errc::malformed_payload );
}

TEST( inspect, pool )
{
  swapwire::state::versioned_pool_state pool( test::make_pool_state() );

  auto lines = inspect::describe( payload_kind::pool, pool.serialize() );
  ASSERT_TRUE( lines );
  ASSERT_EQ( lines->size(), 9 );
  EXPECT_EQ( ( *lines )[ 0 ], "version          1" );
  EXPECT_EQ( ( *lines )[ 1 ], "is_initialized   true" );
  EXPECT_EQ( ( *lines )[ 2 ], "nonce            7" );
  EXPECT_EQ( ( *lines )[ 6 ], "pool_mint        " + protocol::to_base58( test::make_identifier( 0xd0 ) ) );

  auto rejected = inspect::describe( payload_kind::pool, test::make_bytes( { 0x01, 0x01 } ) );
  ASSERT_FALSE( rejected );
  EXPECT_EQ( rejected.error(), swapwire::program::program_errc::invalid_account_data );
}

TEST( inspect, config )
{
  auto lines = inspect::describe( payload_kind::config, test::make_program_config().serialize() );
  ASSERT_TRUE( lines );
  ASSERT_EQ( lines->size(), 6 );
  EXPECT_EQ( ( *lines )[ 1 ], "state_owner      " + protocol::to_base58( test::make_identifier( 0x01 ) ) );
  EXPECT_EQ( ( *lines )[ 3 ], "initial_supply   1000000000" );
  EXPECT_EQ( ( *lines )[ 4 ], "fees             fixed=25 return=5 denominator=10000" );
  EXPECT_EQ( ( *lines )[ 5 ], "curve            stable" );
}
