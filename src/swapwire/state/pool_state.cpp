#include <swapwire/state/pool_state.hpp>

#include <utility>

namespace swapwire::state {

void pool_state::serialize( std::span< std::byte > out ) const noexcept
{
  codec::write_field( out, layout::pool_state::is_initialized, is_initialized );
  codec::write_field( out, layout::pool_state::nonce, nonce );
  codec::write_field( out, layout::pool_state::amm_id, amm_id );
  codec::write_field( out, layout::pool_state::dex_program_id, dex_program_id );
  codec::write_field( out, layout::pool_state::market_id, market_id );
  codec::write_field( out, layout::pool_state::token_program_id, token_program_id );
  codec::write_field( out, layout::pool_state::token_a, token_a );
  codec::write_field( out, layout::pool_state::token_b, token_b );
  codec::write_field( out, layout::pool_state::pool_mint, pool_mint );
  codec::write_field( out, layout::pool_state::token_a_mint, token_a_mint );
  codec::write_field( out, layout::pool_state::token_b_mint, token_b_mint );
}

std::array< std::byte, pool_state::length > pool_state::serialize() const noexcept
{
  std::array< std::byte, length > out{};
  serialize( out );
  return out;
}

codec::result< pool_state > pool_state::deserialize( std::span< const std::byte > bytes ) noexcept
{
  if( bytes.size() < length )
    return std::unexpected( codec::codec_errc::buffer_too_small );

  pool_state state;

  if( auto flag = codec::read_field< bool >( bytes, layout::pool_state::is_initialized ); flag )
    state.is_initialized = *flag;
  else
    return std::unexpected( flag.error() );

  if( auto nonce = codec::read_field< std::uint8_t >( bytes, layout::pool_state::nonce ); nonce )
    state.nonce = *nonce;
  else
    return std::unexpected( nonce.error() );

  const std::pair< const codec::field&, protocol::identifier& > identifiers[] = {
    { layout::pool_state::amm_id, state.amm_id },
    { layout::pool_state::dex_program_id, state.dex_program_id },
    { layout::pool_state::market_id, state.market_id },
    { layout::pool_state::token_program_id, state.token_program_id },
    { layout::pool_state::token_a, state.token_a },
    { layout::pool_state::token_b, state.token_b },
    { layout::pool_state::pool_mint, state.pool_mint },
    { layout::pool_state::token_a_mint, state.token_a_mint },
    { layout::pool_state::token_b_mint, state.token_b_mint } };

  for( const auto& [ f, id ]: identifiers )
  {
    auto value = codec::read_field< protocol::identifier >( bytes, f );
    if( !value )
      return std::unexpected( value.error() );

    id = *value;
  }

  return state;
}

} // namespace swapwire::state
