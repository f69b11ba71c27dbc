#include <swapwire/program/unpack.hpp>

#include <swapwire/codec/error.hpp>
#include <swapwire/log.hpp>

namespace swapwire::program {

result< protocol::instruction > unpack_instruction( std::span< const std::byte > data ) noexcept
{
  auto instruction = protocol::decode( data );
  if( !instruction )
  {
    LOG_WARNING( log::instance(),
                 "Rejecting instruction data {}: {}",
                 log::payload( data.data(), data.size() ),
                 instruction.error().message() );
    return std::unexpected( program_errc::invalid_instruction_data );
  }

  LOG_DEBUG( log::instance(), "Unpacked {} instruction", protocol::tag_of( *instruction ) );
  return instruction;
}

result< state::versioned_pool_state > unpack_pool( std::span< const std::byte > data ) noexcept
{
  auto pool = state::versioned_pool_state::deserialize( data );
  if( !pool )
  {
    LOG_WARNING( log::instance(), "Rejecting pool account of {} bytes: {}", data.size(), pool.error().message() );

    if( pool.error() == codec::codec_errc::unsupported_version )
      return std::unexpected( program_errc::uninitialized_account );

    return std::unexpected( program_errc::invalid_account_data );
  }

  LOG_DEBUG( log::instance(),
             "Unpacked pool v{} with mint {}",
             pool->version(),
             log::key{ pool->pool_mint() } );
  return pool;
}

result< state::program_config > unpack_config( std::span< const std::byte > data ) noexcept
{
  auto config = state::program_config::deserialize( data );
  if( !config )
  {
    LOG_WARNING( log::instance(), "Rejecting program config of {} bytes: {}", data.size(), config.error().message() );
    return std::unexpected( program_errc::invalid_account_data );
  }

  LOG_DEBUG( log::instance(),
             "Unpacked program config owned by {}",
             log::key{ config->state_owner } );
  return config;
}

} // namespace swapwire::program
