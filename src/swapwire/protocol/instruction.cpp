#include <swapwire/protocol/instruction.hpp>

#include <utility>

#include <swapwire/codec/primitive.hpp>

namespace swapwire::protocol {

static_assert( std::variant_size_v< instruction >
               == std::to_underlying( instruction_tag::withdraw_single_token_type_exact_amount_out ) + 1 );

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
    case instruction_tag::initialize:
      return "initialize";
    case instruction_tag::swap:
      return "swap";
    case instruction_tag::deposit_all_token_types:
      return "deposit_all_token_types";
    case instruction_tag::withdraw_all_token_types:
      return "withdraw_all_token_types";
    case instruction_tag::deposit_single_token_type_exact_amount_in:
      return "deposit_single_token_type_exact_amount_in";
    case instruction_tag::withdraw_single_token_type_exact_amount_out:
      return "withdraw_single_token_type_exact_amount_out";
  }

  std::unreachable();
}

codec::result< instruction > decode( std::span< const std::byte > bytes ) noexcept
{
  if( bytes.empty() )
    return std::unexpected( codec::codec_errc::missing_discriminant );

  const auto tag = std::to_integer< std::uint8_t >( bytes.front() );
  codec::reader r( bytes.subspan( 1 ) );

  switch( tag )
  {
    case std::to_underlying( instruction_tag::initialize ):
      {
        if( r.remainder().size() != sizeof( initialize::nonce ) )
          return std::unexpected( codec::codec_errc::malformed_payload );

        auto nonce = r.read_u8();
        if( !nonce )
          return std::unexpected( nonce.error() );

        return initialize{ .nonce = *nonce };
      }
    case std::to_underlying( instruction_tag::swap ):
      {
        auto amount_in          = r.read_u64();
        auto minimum_amount_out = amount_in.and_then( [ & ]( auto ) { return r.read_u64(); } );
        if( !minimum_amount_out )
          return std::unexpected( minimum_amount_out.error() );

        return swap{ .amount_in = *amount_in, .minimum_amount_out = *minimum_amount_out };
      }
    case std::to_underlying( instruction_tag::deposit_all_token_types ):
      {
        auto pool_token_amount      = r.read_u64();
        auto maximum_token_a_amount = pool_token_amount.and_then( [ & ]( auto ) { return r.read_u64(); } );
        auto maximum_token_b_amount = maximum_token_a_amount.and_then( [ & ]( auto ) { return r.read_u64(); } );
        if( !maximum_token_b_amount )
          return std::unexpected( maximum_token_b_amount.error() );

        return deposit_all_token_types{ .pool_token_amount      = *pool_token_amount,
                                        .maximum_token_a_amount = *maximum_token_a_amount,
                                        .maximum_token_b_amount = *maximum_token_b_amount };
      }
    case std::to_underlying( instruction_tag::withdraw_all_token_types ):
      {
        auto pool_token_amount      = r.read_u64();
        auto minimum_token_a_amount = pool_token_amount.and_then( [ & ]( auto ) { return r.read_u64(); } );
        auto minimum_token_b_amount = minimum_token_a_amount.and_then( [ & ]( auto ) { return r.read_u64(); } );
        if( !minimum_token_b_amount )
          return std::unexpected( minimum_token_b_amount.error() );

        return withdraw_all_token_types{ .pool_token_amount      = *pool_token_amount,
                                         .minimum_token_a_amount = *minimum_token_a_amount,
                                         .minimum_token_b_amount = *minimum_token_b_amount };
      }
    case std::to_underlying( instruction_tag::deposit_single_token_type_exact_amount_in ):
      {
        auto source_token_amount       = r.read_u64();
        auto minimum_pool_token_amount = source_token_amount.and_then( [ & ]( auto ) { return r.read_u64(); } );
        if( !minimum_pool_token_amount )
          return std::unexpected( minimum_pool_token_amount.error() );

        return deposit_single_token_type_exact_amount_in{ .source_token_amount       = *source_token_amount,
                                                          .minimum_pool_token_amount = *minimum_pool_token_amount };
      }
    case std::to_underlying( instruction_tag::withdraw_single_token_type_exact_amount_out ):
      {
        auto destination_token_amount  = r.read_u64();
        auto maximum_pool_token_amount = destination_token_amount.and_then( [ & ]( auto ) { return r.read_u64(); } );
        if( !maximum_pool_token_amount )
          return std::unexpected( maximum_pool_token_amount.error() );

        return withdraw_single_token_type_exact_amount_out{ .destination_token_amount  = *destination_token_amount,
                                                            .maximum_pool_token_amount = *maximum_pool_token_amount };
      }
    default:
      return std::unexpected( codec::codec_errc::unknown_discriminant );
  }
}

std::vector< std::byte > encode( const instruction& i )
{
  std::vector< std::byte > buf;
  buf.reserve( encoded_size( i ) );
  codec::write_u8( buf, std::to_underlying( tag_of( i ) ) );

  std::visit( overloaded{ [ & ]( const initialize& v ) { codec::write_u8( buf, v.nonce ); },
                          [ & ]( const swap& v )
                          {
                            codec::write_u64( buf, v.amount_in );
                            codec::write_u64( buf, v.minimum_amount_out );
                          },
                          [ & ]( const deposit_all_token_types& v )
                          {
                            codec::write_u64( buf, v.pool_token_amount );
                            codec::write_u64( buf, v.maximum_token_a_amount );
                            codec::write_u64( buf, v.maximum_token_b_amount );
                          },
                          [ & ]( const withdraw_all_token_types& v )
                          {
                            codec::write_u64( buf, v.pool_token_amount );
                            codec::write_u64( buf, v.minimum_token_a_amount );
                            codec::write_u64( buf, v.minimum_token_b_amount );
                          },
                          [ & ]( const deposit_single_token_type_exact_amount_in& v )
                          {
                            codec::write_u64( buf, v.source_token_amount );
                            codec::write_u64( buf, v.minimum_pool_token_amount );
                          },
                          [ & ]( const withdraw_single_token_type_exact_amount_out& v )
                          {
                            codec::write_u64( buf, v.destination_token_amount );
                            codec::write_u64( buf, v.maximum_pool_token_amount );
                          } },
              i );

  return buf;
}

std::size_t encoded_size( const instruction& i ) noexcept
{
  constexpr std::size_t tag_size = sizeof( instruction_tag );
  constexpr std::size_t u64_size = sizeof( std::uint64_t );

  switch( tag_of( i ) )
  {
    case instruction_tag::initialize:
      return tag_size + sizeof( initialize::nonce );
    case instruction_tag::swap:
    case instruction_tag::deposit_single_token_type_exact_amount_in:
    case instruction_tag::withdraw_single_token_type_exact_amount_out:
      return tag_size + 2 * u64_size;
    case instruction_tag::deposit_all_token_types:
    case instruction_tag::withdraw_all_token_types:
      return tag_size + 3 * u64_size;
  }
  std::unreachable();
}

} // namespace swapwire::protocol
