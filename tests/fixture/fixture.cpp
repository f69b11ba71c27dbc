#include <test/fixture.hpp>

namespace test {

swapwire::protocol::identifier make_identifier( std::uint8_t seed )
{
  swapwire::protocol::identifier id{};
  for( std::size_t i = 0; i < id.size(); ++i )
    id[ i ] = static_cast< std::byte >( seed + i );
  return id;
}

std::vector< std::byte > make_bytes( std::initializer_list< std::uint8_t > values )
{
  std::vector< std::byte > bytes;
  bytes.reserve( values.size() );
  for( auto v: values )
    bytes.push_back( static_cast< std::byte >( v ) );
  return bytes;
}

std::vector< std::byte > le_bytes( std::uint64_t value )
{
  std::vector< std::byte > bytes;
  for( std::size_t i = 0; i < sizeof( value ); ++i )
  {
    bytes.push_back( static_cast< std::byte >( value & 0xff ) );
    value >>= 8;
  }
  return bytes;
}

swapwire::state::pool_state make_pool_state()
{
  return swapwire::state::pool_state{ .is_initialized   = true,
                                      .nonce            = 7,
                                      .amm_id           = make_identifier( 0x10 ),
                                      .dex_program_id   = make_identifier( 0x30 ),
                                      .market_id        = make_identifier( 0x50 ),
                                      .token_program_id = make_identifier( 0x70 ),
                                      .token_a          = make_identifier( 0x90 ),
                                      .token_b          = make_identifier( 0xb0 ),
                                      .pool_mint        = make_identifier( 0xd0 ),
                                      .token_a_mint     = make_identifier( 0xf0 ),
                                      .token_b_mint     = make_identifier( 0x05 ) };
}

swapwire::state::program_config make_program_config()
{
  return swapwire::state::program_config{
    .is_initialized = true,
    .state_owner    = make_identifier( 0x01 ),
    .fee_owner      = make_identifier( 0x41 ),
    .initial_supply = 1'000'000'000,
    .fees = swapwire::state::fee_schedule{ .fixed_fee_numerator = 25, .return_fee_numerator = 5, .fee_denominator = 10'000 },
    .curve = swapwire::state::swap_curve{ swapwire::state::stable_curve{ .amp = 100 } } };
}

} // namespace test
