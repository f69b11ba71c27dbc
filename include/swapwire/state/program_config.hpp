#pragma once

#include <array>
#include <cstdint>
#include <span>

#include <swapwire/codec/error.hpp>
#include <swapwire/protocol/identifier.hpp>
#include <swapwire/state/fee_schedule.hpp>
#include <swapwire/state/layout.hpp>
#include <swapwire/state/swap_curve.hpp>

namespace swapwire::state {

/**
 * Global configuration of a deployment.
 *
 * Written once by the initializer and afterwards only by the state owner.
 * Callers own the record and pass it to whatever needs it.
 */
struct program_config
{
  static constexpr std::size_t length = layout::program_config::length;

  bool is_initialized = false;
  protocol::identifier state_owner{};
  protocol::identifier fee_owner{};
  std::uint64_t initial_supply = 0;
  fee_schedule fees;
  swap_curve curve;

  bool operator==( const program_config& ) const = default;

  void serialize( std::span< std::byte > out ) const noexcept;
  std::array< std::byte, length > serialize() const noexcept;

  static codec::result< program_config > deserialize( std::span< const std::byte > bytes ) noexcept;
};

} // namespace swapwire::state
