#include <swapwire/farm/instruction.hpp>

#include <utility>

#include <swapwire/codec/primitive.hpp>

namespace swapwire::farm {

static_assert( std::variant_size_v< instruction > == std::to_underlying( instruction_tag::pay_farm_fee ) + 1 );

template< typename... Ts >
struct overloaded: Ts...
{
  using Ts::operator()...;
};

instruction_tag tag_of( const instruction& i ) noexcept
{
  return static_cast< instruction_tag >( i.index() );
}

std::string_view name_of( instruction_tag tag ) noexcept
{
  switch( tag )
  {
    case instruction_tag::set_program_data:
      return "set_program_data";
    case instruction_tag::initialize_farm:
      return "initialize_farm";
    case instruction_tag::deposit:
      return "deposit";
    case instruction_tag::withdraw:
      return "withdraw";
    case instruction_tag::add_reward:
      return "add_reward";
    case instruction_tag::pay_farm_fee:
      return "pay_farm_fee";
  }

  std::unreachable();
}

static codec::result< instruction > decode_set_program_data( codec::reader& r ) noexcept
{
  set_program_data data;

  for( auto* id: { &data.super_owner, &data.fee_owner, &data.allowed_creator, &data.amm_program_id } )
  {
    auto value = r.read_identifier();
    if( !value )
      return std::unexpected( value.error() );

    *id = *value;
  }

  for( auto* amount: { &data.farm_fee, &data.harvest_fee_numerator, &data.harvest_fee_denominator } )
  {
    auto value = r.read_u64();
    if( !value )
      return std::unexpected( value.error() );

    *amount = *value;
  }

  return data;
}

static codec::result< instruction > decode_initialize_farm( codec::reader& r ) noexcept
{
  auto nonce           = r.read_u8();
  auto start_timestamp = nonce.and_then( [ & ]( auto ) { return r.read_u64(); } );
  auto end_timestamp   = start_timestamp.and_then( [ & ]( auto ) { return r.read_u64(); } );
  if( !end_timestamp )
    return std::unexpected( end_timestamp.error() );

  return initialize_farm{ .nonce = *nonce, .start_timestamp = *start_timestamp, .end_timestamp = *end_timestamp };
}

template< typename T >
static codec::result< instruction > decode_amount( codec::reader& r ) noexcept
{
  auto amount = r.read_u64();
  if( !amount )
    return std::unexpected( amount.error() );

  return T{ .amount = *amount };
}

codec::result< instruction > decode( std::span< const std::byte > bytes ) noexcept
{
  if( bytes.empty() )
    return std::unexpected( codec::codec_errc::missing_discriminant );

  codec::reader r( bytes.subspan( 1 ) );
  codec::result< instruction > decoded;

  switch( std::to_integer< std::uint8_t >( bytes.front() ) )
  {
    case std::to_underlying( instruction_tag::set_program_data ):
      decoded = decode_set_program_data( r );
      break;
    case std::to_underlying( instruction_tag::initialize_farm ):
      decoded = decode_initialize_farm( r );
      break;
    case std::to_underlying( instruction_tag::deposit ):
      decoded = decode_amount< deposit >( r );
      break;
    case std::to_underlying( instruction_tag::withdraw ):
      decoded = decode_amount< withdraw >( r );
      break;
    case std::to_underlying( instruction_tag::add_reward ):
      decoded = decode_amount< add_reward >( r );
      break;
    case std::to_underlying( instruction_tag::pay_farm_fee ):
      decoded = decode_amount< pay_farm_fee >( r );
      break;
    default:
      return std::unexpected( codec::codec_errc::unknown_discriminant );
  }

  if( decoded && !r.empty() )
    return std::unexpected( codec::codec_errc::malformed_payload );

  return decoded;
}

std::vector< std::byte > encode( const instruction& i )
{
  std::vector< std::byte > buf;
  codec::write_u8( buf, std::to_underlying( tag_of( i ) ) );

  const auto write_amount = [ & ]( const auto& v ) -> void
  {
    codec::write_u64( buf, v.amount );
  };

  std::visit( overloaded{ [ & ]( const set_program_data& v )
                          {
                            codec::write_identifier( buf, v.super_owner );
                            codec::write_identifier( buf, v.fee_owner );
                            codec::write_identifier( buf, v.allowed_creator );
                            codec::write_identifier( buf, v.amm_program_id );
                            codec::write_u64( buf, v.farm_fee );
                            codec::write_u64( buf, v.harvest_fee_numerator );
                            codec::write_u64( buf, v.harvest_fee_denominator );
                          },
                          [ & ]( const initialize_farm& v )
                          {
                            codec::write_u8( buf, v.nonce );
                            codec::write_u64( buf, v.start_timestamp );
                            codec::write_u64( buf, v.end_timestamp );
                          },
                          write_amount },
              i );

  return buf;
}

} // namespace swapwire::farm
