#include <swapwire/state/program_config.hpp>

namespace swapwire::state {

void program_config::serialize( std::span< std::byte > out ) const noexcept
{
  codec::write_field( out, layout::program_config::is_initialized, is_initialized );
  codec::write_field( out, layout::program_config::state_owner, state_owner );
  codec::write_field( out, layout::program_config::fee_owner, fee_owner );
  codec::write_field( out, layout::program_config::initial_supply, initial_supply );
  fees.serialize( codec::field_bytes( out, layout::program_config::fees ) );
  curve.serialize( codec::field_bytes( out, layout::program_config::curve ) );
}

std::array< std::byte, program_config::length > program_config::serialize() const noexcept
{
  std::array< std::byte, length > out{};
  serialize( out );
  return out;
}

codec::result< program_config > program_config::deserialize( std::span< const std::byte > bytes ) noexcept
{
  if( bytes.size() < length )
    return std::unexpected( codec::codec_errc::buffer_too_small );

  program_config config;

  if( auto flag = codec::read_field< bool >( bytes, layout::program_config::is_initialized ); flag )
    config.is_initialized = *flag;
  else
    return std::unexpected( flag.error() );

  if( auto id = codec::read_field< protocol::identifier >( bytes, layout::program_config::state_owner ); id )
    config.state_owner = *id;
  else
    return std::unexpected( id.error() );

  if( auto id = codec::read_field< protocol::identifier >( bytes, layout::program_config::fee_owner ); id )
    config.fee_owner = *id;
  else
    return std::unexpected( id.error() );

  if( auto supply = codec::read_field< std::uint64_t >( bytes, layout::program_config::initial_supply ); supply )
    config.initial_supply = *supply;
  else
    return std::unexpected( supply.error() );

  auto fees = codec::field_bytes( bytes, layout::program_config::fees ).and_then( fee_schedule::deserialize );
  if( !fees )
    return std::unexpected( fees.error() );
  config.fees = *fees;

  auto curve = codec::field_bytes( bytes, layout::program_config::curve ).and_then( swap_curve::deserialize );
  if( !curve )
    return std::unexpected( curve.error() );
  config.curve = *curve;

  return config;
}

} // namespace swapwire::state
