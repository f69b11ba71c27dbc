#pragma once

#include <array>
#include <cstdint>
#include <span>

#include <swapwire/codec/error.hpp>
#include <swapwire/state/layout.hpp>

namespace swapwire::state {

/**
 * Fee ratios applied by the pool on swaps and redistributed to the fee owner.
 */
struct fee_schedule
{
  static constexpr std::size_t length = layout::fee_schedule::length;

  std::uint64_t fixed_fee_numerator  = 0;
  std::uint64_t return_fee_numerator = 0;
  std::uint64_t fee_denominator      = 0;

  bool operator==( const fee_schedule& ) const = default;

  void serialize( std::span< std::byte > out ) const noexcept;
  std::array< std::byte, length > serialize() const noexcept;

  static codec::result< fee_schedule > deserialize( std::span< const std::byte > bytes ) noexcept;
};

} // namespace swapwire::state
