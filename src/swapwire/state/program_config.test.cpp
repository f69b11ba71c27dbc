#include <gtest/gtest.h>

#include <algorithm>
#include <utility>

#include <swapwire/state/layout.hpp>
#include <swapwire/state/program_config.hpp>

#include <test/fixture.hpp>

using swapwire::codec::codec_errc;
namespace state = swapwire::state;

TEST( fee_schedule, serialize )
{
  state::fee_schedule fees{ .fixed_fee_numerator = 25, .return_fee_numerator = 5, .fee_denominator = 10'000 };

  auto bytes    = fees.serialize();
  auto expected = test::le_bytes( 25 );
  for( auto value: { std::uint64_t{ 5 }, std::uint64_t{ 10'000 } } )
  {
    auto le = test::le_bytes( value );
    expected.insert( expected.end(), le.begin(), le.end() );
  }

  EXPECT_TRUE( std::ranges::equal( bytes, expected ) );

  auto decoded = state::fee_schedule::deserialize( bytes );
  ASSERT_TRUE( decoded );
  EXPECT_EQ( *decoded, fees );

  auto short_fees = state::fee_schedule::deserialize( std::span( bytes ).first( 23 ) );
  ASSERT_FALSE( short_fees );
  EXPECT_EQ( short_fees.error(), codec_errc::buffer_too_small );
}

TEST( swap_curve, every_type )
{
  const std::vector< state::swap_curve > curves{ { state::constant_product_curve{} },
                                                 { state::constant_price_curve{ .token_b_price = 1'500 } },
                                                 { state::stable_curve{ .amp = 100 } },
                                                 { state::offset_curve{ .token_b_offset = 42 } } };

  for( std::size_t i = 0; i < curves.size(); ++i )
  {
    EXPECT_EQ( std::to_underlying( curves[ i ].type() ), i );

    auto bytes = curves[ i ].serialize();
    EXPECT_EQ( std::to_integer< std::size_t >( bytes[ 0 ] ), i );
    EXPECT_TRUE( std::all_of( bytes.begin() + 9, bytes.end(), []( std::byte b ) { return b == std::byte{ 0 }; } ) );

    auto decoded = state::swap_curve::deserialize( bytes );
    ASSERT_TRUE( decoded );
    EXPECT_EQ( *decoded, curves[ i ] );
  }
}

TEST( swap_curve, parameter_position )
{
  state::swap_curve curve{ state::stable_curve{ .amp = 0x0102030405060708 } };

  auto bytes = curve.serialize();
  EXPECT_EQ( bytes[ 0 ], std::byte{ 0x02 } );
  EXPECT_TRUE( std::ranges::equal( std::span( bytes ).subspan( 1, 8 ), test::le_bytes( 0x0102030405060708 ) ) );
}

TEST( swap_curve, unknown_curve_type )
{
  std::array< std::byte, state::swap_curve::length > bytes{};
  bytes[ 0 ] = std::byte{ 0x04 };

  auto decoded = state::swap_curve::deserialize( bytes );
  ASSERT_FALSE( decoded );
  EXPECT_EQ( decoded.error(), codec_errc::unknown_curve_type );
}

TEST( swap_curve, constant_product_ignores_calculator_bytes )
{
  std::array< std::byte, state::swap_curve::length > bytes{};
  std::ranges::fill( std::span( bytes ).subspan( 1 ), std::byte{ 0xab } );

  auto decoded = state::swap_curve::deserialize( bytes );
  ASSERT_TRUE( decoded );
  EXPECT_EQ( decoded->type(), state::curve_type::constant_product );
}

TEST( program_config, serialize )
{
  auto config = test::make_program_config();
  auto bytes  = config.serialize();

  ASSERT_EQ( bytes.size(), 130 );
  EXPECT_EQ( bytes[ 0 ], std::byte{ 0x01 } );
  EXPECT_TRUE( std::ranges::equal( std::span( bytes ).subspan( 1, 32 ), config.state_owner ) );
  EXPECT_TRUE( std::ranges::equal( std::span( bytes ).subspan( 33, 32 ), config.fee_owner ) );
  EXPECT_TRUE( std::ranges::equal( std::span( bytes ).subspan( 65, 8 ), test::le_bytes( 1'000'000'000 ) ) );
  EXPECT_TRUE( std::ranges::equal( std::span( bytes ).subspan( 73, 8 ), test::le_bytes( 25 ) ) );
  EXPECT_EQ( bytes[ 97 ], std::byte{ 0x02 } );
  EXPECT_TRUE( std::ranges::equal( std::span( bytes ).subspan( 98, 8 ), test::le_bytes( 100 ) ) );

  auto decoded = state::program_config::deserialize( bytes );
  ASSERT_TRUE( decoded );
  EXPECT_EQ( *decoded, config );
}

TEST( program_config, errors )
{
  auto bytes = test::make_program_config().serialize();

  for( std::size_t n = 0; n < state::program_config::length; ++n )
  {
    auto short_config = state::program_config::deserialize( std::span( bytes ).first( n ) );
    ASSERT_FALSE( short_config ) << "length " << n;
    EXPECT_EQ( short_config.error(), codec_errc::buffer_too_small );
  }

  auto bad_flag = bytes;
  bad_flag[ 0 ] = std::byte{ 0x09 };
  auto decoded  = state::program_config::deserialize( bad_flag );
  ASSERT_FALSE( decoded );
  EXPECT_EQ( decoded.error(), codec_errc::invalid_flag_byte );

  auto bad_curve = bytes;
  bad_curve[ state::layout::program_config::curve.offset ] = std::byte{ 0x7f };
  decoded = state::program_config::deserialize( bad_curve );
  ASSERT_FALSE( decoded );
  EXPECT_EQ( decoded.error(), codec_errc::unknown_curve_type );
}
