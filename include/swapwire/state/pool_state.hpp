#pragma once

#include <array>
#include <cstdint>
#include <span>

#include <swapwire/codec/error.hpp>
#include <swapwire/protocol/identifier.hpp>
#include <swapwire/state/layout.hpp>

namespace swapwire::state {

/**
 * Version 1 layout of a liquidity pool account.
 */
struct pool_state
{
  static constexpr std::uint8_t version = 1;
  static constexpr std::size_t length   = layout::pool_state::length;

  bool is_initialized = false;
  // Bump seed of the pool's program-derived authority. The authority owns
  // both reserve accounts and the pool mint.
  std::uint8_t nonce = 0;
  protocol::identifier amm_id{};
  protocol::identifier dex_program_id{};
  protocol::identifier market_id{};
  protocol::identifier token_program_id{};
  protocol::identifier token_a{};
  protocol::identifier token_b{};
  protocol::identifier pool_mint{};
  protocol::identifier token_a_mint{};
  protocol::identifier token_b_mint{};

  bool operator==( const pool_state& ) const = default;

  void serialize( std::span< std::byte > out ) const noexcept;
  std::array< std::byte, length > serialize() const noexcept;

  static codec::result< pool_state > deserialize( std::span< const std::byte > bytes ) noexcept;
};

} // namespace swapwire::state
