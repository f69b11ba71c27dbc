#include <swapwire/state/swap_curve.hpp>

#include <algorithm>
#include <utility>

namespace swapwire::state {

static_assert( std::variant_size_v< curve_calculator > == std::to_underlying( curve_type::offset ) + 1 );

curve_type swap_curve::type() const noexcept
{
  return static_cast< curve_type >( calculator.index() );
}

void swap_curve::serialize( std::span< std::byte > out ) const noexcept
{
  codec::write_field( out, layout::swap_curve::curve_type, std::to_underlying( type() ) );
  std::ranges::fill( codec::field_bytes( out, layout::swap_curve::calculator ), std::byte{ 0x00 } );

  switch( type() )
  {
    case curve_type::constant_product:
      break;
    case curve_type::constant_price:
      codec::write_field( out, layout::swap_curve::parameter, std::get< constant_price_curve >( calculator ).token_b_price );
      break;
    case curve_type::stable:
      codec::write_field( out, layout::swap_curve::parameter, std::get< stable_curve >( calculator ).amp );
      break;
    case curve_type::offset:
      codec::write_field( out, layout::swap_curve::parameter, std::get< offset_curve >( calculator ).token_b_offset );
      break;
  }
}

std::array< std::byte, swap_curve::length > swap_curve::serialize() const noexcept
{
  std::array< std::byte, length > out{};
  serialize( out );
  return out;
}

codec::result< swap_curve > swap_curve::deserialize( std::span< const std::byte > bytes ) noexcept
{
  if( bytes.size() < length )
    return std::unexpected( codec::codec_errc::buffer_too_small );

  auto type = codec::read_field< std::uint8_t >( bytes, layout::swap_curve::curve_type );
  if( !type )
    return std::unexpected( type.error() );

  if( *type > std::to_underlying( curve_type::offset ) )
    return std::unexpected( codec::codec_errc::unknown_curve_type );

  auto parameter = codec::read_field< std::uint64_t >( bytes, layout::swap_curve::parameter );
  if( !parameter )
    return std::unexpected( parameter.error() );

  switch( static_cast< curve_type >( *type ) )
  {
    case curve_type::constant_product:
      return swap_curve{ constant_product_curve{} };
    case curve_type::constant_price:
      return swap_curve{ constant_price_curve{ .token_b_price = *parameter } };
    case curve_type::stable:
      return swap_curve{ stable_curve{ .amp = *parameter } };
    case curve_type::offset:
      return swap_curve{ offset_curve{ .token_b_offset = *parameter } };
  }
  std::unreachable();
}

} // namespace swapwire::state
