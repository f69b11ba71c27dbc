#include <swapwire/state/versioned_pool_state.hpp>

#include <utility>

namespace swapwire::state {

versioned_pool_state::versioned_pool_state( pool_state state ) noexcept:
    _state( std::move( state ) )
{}

std::uint8_t versioned_pool_state::version() const noexcept
{
  return std::visit(
    []( const auto& s )
    {
      return s.version;
    },
    _state );
}

bool versioned_pool_state::is_initialized() const noexcept
{
  return std::visit(
    []( const auto& s )
    {
      return s.is_initialized;
    },
    _state );
}

std::uint8_t versioned_pool_state::nonce() const noexcept
{
  return std::visit(
    []( const auto& s )
    {
      return s.nonce;
    },
    _state );
}

const protocol::identifier& versioned_pool_state::token_program_id() const noexcept
{
  return std::visit(
    []( const auto& s ) -> const protocol::identifier&
    {
      return s.token_program_id;
    },
    _state );
}

const protocol::identifier& versioned_pool_state::token_a_account() const noexcept
{
  return std::visit(
    []( const auto& s ) -> const protocol::identifier&
    {
      return s.token_a;
    },
    _state );
}

const protocol::identifier& versioned_pool_state::token_b_account() const noexcept
{
  return std::visit(
    []( const auto& s ) -> const protocol::identifier&
    {
      return s.token_b;
    },
    _state );
}

const protocol::identifier& versioned_pool_state::pool_mint() const noexcept
{
  return std::visit(
    []( const auto& s ) -> const protocol::identifier&
    {
      return s.pool_mint;
    },
    _state );
}

const protocol::identifier& versioned_pool_state::token_a_mint() const noexcept
{
  return std::visit(
    []( const auto& s ) -> const protocol::identifier&
    {
      return s.token_a_mint;
    },
    _state );
}

const protocol::identifier& versioned_pool_state::token_b_mint() const noexcept
{
  return std::visit(
    []( const auto& s ) -> const protocol::identifier&
    {
      return s.token_b_mint;
    },
    _state );
}

const versioned_pool_state::variant_type& versioned_pool_state::state() const noexcept
{
  return _state;
}

void versioned_pool_state::serialize( std::span< std::byte > out ) const noexcept
{
  std::visit(
    [ & ]( const auto& s )
    {
      codec::write_field( out, layout::versioned_pool_state::version, s.version );
      s.serialize( out.subspan( layout::versioned_pool_state::version.length ) );
    },
    _state );
}

std::array< std::byte, versioned_pool_state::latest_length > versioned_pool_state::serialize() const noexcept
{
  std::array< std::byte, latest_length > out{};
  serialize( out );
  return out;
}

codec::result< versioned_pool_state > versioned_pool_state::deserialize( std::span< const std::byte > bytes ) noexcept
{
  auto version = codec::read_u8( bytes );
  if( !version )
    return std::unexpected( codec::codec_errc::buffer_too_small );

  switch( version->value )
  {
    case pool_state::version:
      {
        auto state = pool_state::deserialize( version->remainder );
        if( !state )
          return std::unexpected( state.error() );

        return versioned_pool_state( std::move( *state ) );
      }
    default:
      return std::unexpected( codec::codec_errc::unsupported_version );
  }
}

bool versioned_pool_state::is_initialized_probe( std::span< const std::byte > bytes ) noexcept
{
  auto state = deserialize( bytes );
  return state && state->is_initialized();
}

} // namespace swapwire::state
