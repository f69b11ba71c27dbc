#include <swapwire/state/fee_schedule.hpp>

namespace swapwire::state {

void fee_schedule::serialize( std::span< std::byte > out ) const noexcept
{
  codec::write_field( out, layout::fee_schedule::fixed_fee_numerator, fixed_fee_numerator );
  codec::write_field( out, layout::fee_schedule::return_fee_numerator, return_fee_numerator );
  codec::write_field( out, layout::fee_schedule::fee_denominator, fee_denominator );
}

std::array< std::byte, fee_schedule::length > fee_schedule::serialize() const noexcept
{
  std::array< std::byte, length > out{};
  serialize( out );
  return out;
}

codec::result< fee_schedule > fee_schedule::deserialize( std::span< const std::byte > bytes ) noexcept
{
  if( bytes.size() < length )
    return std::unexpected( codec::codec_errc::buffer_too_small );

  auto fixed_fee_numerator  = codec::read_field< std::uint64_t >( bytes, layout::fee_schedule::fixed_fee_numerator );
  auto return_fee_numerator = codec::read_field< std::uint64_t >( bytes, layout::fee_schedule::return_fee_numerator );
  auto fee_denominator      = codec::read_field< std::uint64_t >( bytes, layout::fee_schedule::fee_denominator );

  for( const auto* r: { &fixed_fee_numerator, &return_fee_numerator, &fee_denominator } )
    if( !*r )
      return std::unexpected( r->error() );

  return fee_schedule{ .fixed_fee_numerator  = *fixed_fee_numerator,
                       .return_fee_numerator = *return_fee_numerator,
                       .fee_denominator      = *fee_denominator };
}

} // namespace swapwire::state
