#include <gtest/gtest.h>

#include <swapwire/protocol/builder.hpp>

#include <test/fixture.hpp>

namespace protocol = swapwire::protocol;

namespace {

const auto program_id = test::make_identifier( 0xa0 );

protocol::identifier id( std::uint8_t n )
{
  return test::make_identifier( static_cast< std::uint8_t >( n * 8 ) );
}

void expect_accounts( const protocol::call& c,
                      const std::vector< protocol::identifier >& ids,
                      const std::vector< bool >& signers,
                      const std::vector< bool >& writables )
{
  ASSERT_EQ( c.accounts.size(), ids.size() );
  ASSERT_EQ( signers.size(), ids.size() );
  ASSERT_EQ( writables.size(), ids.size() );

  for( std::size_t i = 0; i < ids.size(); ++i )
  {
    EXPECT_EQ( c.accounts[ i ].id, ids[ i ] ) << "account " << i;
    EXPECT_EQ( c.accounts[ i ].is_signer, signers[ i ] ) << "account " << i;
    EXPECT_EQ( c.accounts[ i ].is_writable, writables[ i ] ) << "account " << i;
  }
}

} // namespace

TEST( builder, initialize )
{
  protocol::initialize_accounts accounts{ .swap          = id( 0 ),
                                          .authority     = id( 1 ),
                                          .state         = id( 2 ),
                                          .amm_id        = id( 3 ),
                                          .token_a       = id( 4 ),
                                          .token_b       = id( 5 ),
                                          .pool_mint     = id( 6 ),
                                          .destination   = id( 7 ),
                                          .market        = id( 8 ),
                                          .token_program = id( 9 ),
                                          .dex_program   = id( 10 ) };

  auto c = protocol::make_initialize_call( program_id, accounts, protocol::initialize{ .nonce = 1 } );

  EXPECT_EQ( c.program_id, program_id );
  EXPECT_EQ( c.data, test::make_bytes( { 0x00, 0x01 } ) );
  expect_accounts( c,
                   { id( 0 ), id( 1 ), id( 2 ), id( 3 ), id( 4 ), id( 5 ), id( 6 ), id( 7 ), id( 8 ), id( 9 ), id( 10 ) },
                   { true, false, false, false, false, false, false, false, false, false, false },
                   { true, false, false, false, false, false, true, true, true, false, false } );
}

TEST( builder, swap )
{
  protocol::swap_accounts accounts{ .swap                    = id( 0 ),
                                    .authority               = id( 1 ),
                                    .user_transfer_authority = id( 2 ),
                                    .state                   = id( 3 ),
                                    .source                  = id( 4 ),
                                    .swap_source             = id( 5 ),
                                    .swap_destination        = id( 6 ),
                                    .destination             = id( 7 ),
                                    .pool_mint               = id( 8 ),
                                    .fee_account             = id( 9 ),
                                    .token_program           = id( 10 ) };

  protocol::swap data{ .amount_in = 1'000'000, .minimum_amount_out = 990'000 };
  auto c = protocol::make_swap_call( program_id, accounts, data );

  EXPECT_EQ( c.data, protocol::encode( data ) );
  expect_accounts( c,
                   { id( 0 ), id( 1 ), id( 2 ), id( 3 ), id( 4 ), id( 5 ), id( 6 ), id( 7 ), id( 8 ), id( 9 ), id( 10 ) },
                   { false, false, true, true, false, false, false, false, false, false, false },
                   { false, false, false, false, true, true, true, true, true, true, false } );

  EXPECT_EQ( c.size(), 32 + 11 * ( 32 + 2 ) + 17 );
}

TEST( builder, deposit_all_token_types )
{
  protocol::deposit_all_token_types_accounts accounts{ .swap                    = id( 0 ),
                                                       .authority               = id( 1 ),
                                                       .user_transfer_authority = id( 2 ),
                                                       .state                   = id( 3 ),
                                                       .deposit_token_a         = id( 4 ),
                                                       .deposit_token_b         = id( 5 ),
                                                       .swap_token_a            = id( 6 ),
                                                       .swap_token_b            = id( 7 ),
                                                       .pool_mint               = id( 8 ),
                                                       .destination             = id( 9 ),
                                                       .token_program           = id( 10 ) };

  auto c = protocol::make_deposit_all_token_types_call( program_id, accounts, { 1, 2, 3 } );

  EXPECT_EQ( c.data.size(), 25 );
  expect_accounts( c,
                   { id( 0 ), id( 1 ), id( 2 ), id( 3 ), id( 4 ), id( 5 ), id( 6 ), id( 7 ), id( 8 ), id( 9 ), id( 10 ) },
                   { false, false, true, false, false, false, false, false, false, false, false },
                   { false, false, false, false, true, true, true, true, true, true, false } );
}

TEST( builder, withdraw_all_token_types )
{
  protocol::withdraw_all_token_types_accounts accounts{ .swap                    = id( 0 ),
                                                        .authority               = id( 1 ),
                                                        .user_transfer_authority = id( 2 ),
                                                        .state                   = id( 3 ),
                                                        .pool_mint               = id( 4 ),
                                                        .source                  = id( 5 ),
                                                        .swap_token_a            = id( 6 ),
                                                        .swap_token_b            = id( 7 ),
                                                        .destination_token_a     = id( 8 ),
                                                        .destination_token_b     = id( 9 ),
                                                        .token_program           = id( 10 ) };

  auto c = protocol::make_withdraw_all_token_types_call( program_id, accounts, { 4, 5, 6 } );

  const protocol::instruction expected = protocol::withdraw_all_token_types{ .pool_token_amount      = 4,
                                                                              .minimum_token_a_amount = 5,
                                                                              .minimum_token_b_amount = 6 };

  auto decoded = protocol::decode( c.data );
  ASSERT_TRUE( decoded );
  EXPECT_EQ( *decoded, expected );
  expect_accounts( c,
                   { id( 0 ), id( 1 ), id( 2 ), id( 3 ), id( 4 ), id( 5 ), id( 6 ), id( 7 ), id( 8 ), id( 9 ), id( 10 ) },
                   { false, false, true, false, false, false, false, false, false, false, false },
                   { false, false, false, false, true, true, true, true, true, true, false } );
}

TEST( builder, single_token_type )
{
  protocol::deposit_single_token_type_accounts deposit_accounts{ .swap                    = id( 0 ),
                                                                 .authority               = id( 1 ),
                                                                 .user_transfer_authority = id( 2 ),
                                                                 .source_token            = id( 3 ),
                                                                 .swap_token_a            = id( 4 ),
                                                                 .swap_token_b            = id( 5 ),
                                                                 .pool_mint               = id( 6 ),
                                                                 .destination             = id( 7 ),
                                                                 .token_program           = id( 8 ) };

  auto deposit = protocol::make_deposit_single_token_type_exact_amount_in_call( program_id, deposit_accounts, { 7, 8 } );

  EXPECT_EQ( deposit.data.front(), std::byte{ 0x04 } );
  expect_accounts( deposit,
                   { id( 0 ), id( 1 ), id( 2 ), id( 3 ), id( 4 ), id( 5 ), id( 6 ), id( 7 ), id( 8 ) },
                   { false, false, true, false, false, false, false, false, false },
                   { false, false, false, true, true, true, true, true, false } );

  protocol::withdraw_single_token_type_accounts withdraw_accounts{ .swap                    = id( 0 ),
                                                                   .authority               = id( 1 ),
                                                                   .user_transfer_authority = id( 2 ),
                                                                   .pool_mint               = id( 3 ),
                                                                   .pool_token_source       = id( 4 ),
                                                                   .swap_token_a            = id( 5 ),
                                                                   .swap_token_b            = id( 6 ),
                                                                   .destination             = id( 7 ),
                                                                   .token_program           = id( 8 ) };

  auto withdraw =
    protocol::make_withdraw_single_token_type_exact_amount_out_call( program_id, withdraw_accounts, { 9, 10 } );

  EXPECT_EQ( withdraw.data.front(), std::byte{ 0x05 } );
  expect_accounts( withdraw,
                   { id( 0 ), id( 1 ), id( 2 ), id( 3 ), id( 4 ), id( 5 ), id( 6 ), id( 7 ), id( 8 ) },
                   { false, false, true, false, false, false, false, false, false },
                   { false, false, false, true, true, true, true, true, false } );
}
