#include <swapwire/inspect/inspect.hpp>

#include <array>
#include <format>
#include <utility>
#include <variant>

#include <swapwire/farm/instruction.hpp>
#include <swapwire/program/unpack.hpp>
#include <swapwire/protocol/identifier.hpp>

namespace swapwire::inspect {

template< typename... Ts >
struct overloaded: Ts...
{
  using Ts::operator()...;
};

using protocol::to_base58;

static std::string describe_instruction( const protocol::instruction& i )
{
  const auto name = protocol::name_of( protocol::tag_of( i ) );

  return std::visit(
    overloaded{
      [ & ]( const protocol::initialize& v ) { return std::format( "{} nonce={}", name, v.nonce ); },
      [ & ]( const protocol::swap& v )
      {
        return std::format( "{} amount_in={} minimum_amount_out={}", name, v.amount_in, v.minimum_amount_out );
      },
      [ & ]( const protocol::deposit_all_token_types& v )
      {
        return std::format( "{} pool_token_amount={} maximum_token_a_amount={} maximum_token_b_amount={}",
                            name,
                            v.pool_token_amount,
                            v.maximum_token_a_amount,
                            v.maximum_token_b_amount );
      },
      [ & ]( const protocol::withdraw_all_token_types& v )
      {
        return std::format( "{} pool_token_amount={} minimum_token_a_amount={} minimum_token_b_amount={}",
                            name,
                            v.pool_token_amount,
                            v.minimum_token_a_amount,
                            v.minimum_token_b_amount );
      },
      [ & ]( const protocol::deposit_single_token_type_exact_amount_in& v )
      {
        return std::format( "{} source_token_amount={} minimum_pool_token_amount={}",
                            name,
                            v.source_token_amount,
                            v.minimum_pool_token_amount );
      },
      [ & ]( const protocol::withdraw_single_token_type_exact_amount_out& v )
      {
        return std::format( "{} destination_token_amount={} maximum_pool_token_amount={}",
                            name,
                            v.destination_token_amount,
                            v.maximum_pool_token_amount );
      } },
    i );
}

static std::string describe_farm_instruction( const farm::instruction& i )
{
  const auto name = farm::name_of( farm::tag_of( i ) );

  return std::visit( overloaded{ [ & ]( const farm::set_program_data& v )
                                 {
                                   return std::format( "{} super_owner={} fee_owner={} allowed_creator={} "
                                                       "amm_program_id={} farm_fee={} harvest_fee={}/{}",
                                                       name,
                                                       to_base58( v.super_owner ),
                                                       to_base58( v.fee_owner ),
                                                       to_base58( v.allowed_creator ),
                                                       to_base58( v.amm_program_id ),
                                                       v.farm_fee,
                                                       v.harvest_fee_numerator,
                                                       v.harvest_fee_denominator );
                                 },
                                 [ & ]( const farm::initialize_farm& v )
                                 {
                                   return std::format( "{} nonce={} start_timestamp={} end_timestamp={}",
                                                       name,
                                                       v.nonce,
                                                       v.start_timestamp,
                                                       v.end_timestamp );
                                 },
                                 [ & ]( const auto& v ) { return std::format( "{} amount={}", name, v.amount ); } },
                     i );
}

static std::vector< std::string > describe_pool( const state::versioned_pool_state& pool )
{
  return { std::format( "version          {}", pool.version() ),
           std::format( "is_initialized   {}", pool.is_initialized() ),
           std::format( "nonce            {}", pool.nonce() ),
           std::format( "token_program_id {}", to_base58( pool.token_program_id() ) ),
           std::format( "token_a_account  {}", to_base58( pool.token_a_account() ) ),
           std::format( "token_b_account  {}", to_base58( pool.token_b_account() ) ),
           std::format( "pool_mint        {}", to_base58( pool.pool_mint() ) ),
           std::format( "token_a_mint     {}", to_base58( pool.token_a_mint() ) ),
           std::format( "token_b_mint     {}", to_base58( pool.token_b_mint() ) ) };
}

static std::vector< std::string > describe_config( const state::program_config& config )
{
  static constexpr std::array< std::string_view, 4 > curve_names{ "constant_product",
                                                                  "constant_price",
                                                                  "stable",
                                                                  "offset" };

  return { std::format( "is_initialized   {}", config.is_initialized ),
           std::format( "state_owner      {}", to_base58( config.state_owner ) ),
           std::format( "fee_owner        {}", to_base58( config.fee_owner ) ),
           std::format( "initial_supply   {}", config.initial_supply ),
           std::format( "fees             fixed={} return={} denominator={}",
                        config.fees.fixed_fee_numerator,
                        config.fees.return_fee_numerator,
                        config.fees.fee_denominator ),
           std::format( "curve            {}", curve_names.at( std::to_underlying( config.curve.type() ) ) ) };
}

result< payload_kind > parse_kind( std::string_view name ) noexcept
{
  if( name == "instruction" )
    return payload_kind::instruction;
  if( name == "farm-instruction" )
    return payload_kind::farm_instruction;
  if( name == "pool" )
    return payload_kind::pool;
  if( name == "config" )
    return payload_kind::config;

  return std::unexpected( std::make_error_code( std::errc::invalid_argument ) );
}

result< std::vector< std::string > > describe( payload_kind kind, std::span< const std::byte > bytes )
{
  switch( kind )
  {
    case payload_kind::instruction:
      return program::unpack_instruction( bytes ).transform(
        []( const protocol::instruction& i ) { return std::vector< std::string >{ describe_instruction( i ) }; } );
    case payload_kind::farm_instruction:
      return farm::decode( bytes ).transform(
        []( const farm::instruction& i ) { return std::vector< std::string >{ describe_farm_instruction( i ) }; } );
    case payload_kind::pool:
      return program::unpack_pool( bytes ).transform( describe_pool );
    case payload_kind::config:
      return program::unpack_config( bytes ).transform( describe_config );
  }

  std::unreachable();
}

} // namespace swapwire::inspect
