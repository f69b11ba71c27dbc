#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <variant>

#include <swapwire/codec/error.hpp>
#include <swapwire/state/layout.hpp>

namespace swapwire::state {

enum class curve_type : std::uint8_t
{
  constant_product,
  constant_price,
  stable,
  offset
};

struct constant_product_curve
{
  bool operator==( const constant_product_curve& ) const = default;
};

struct constant_price_curve
{
  std::uint64_t token_b_price = 0;

  bool operator==( const constant_price_curve& ) const = default;
};

struct stable_curve
{
  std::uint64_t amp = 0;

  bool operator==( const stable_curve& ) const = default;
};

struct offset_curve
{
  std::uint64_t token_b_offset = 0;

  bool operator==( const offset_curve& ) const = default;
};

// Alternative index matches curve_type
using curve_calculator = std::variant< constant_product_curve, constant_price_curve, stable_curve, offset_curve >;

/**
 * Curve selector stored in the program configuration. The pricing math
 * behind each calculator lives outside this library; only the parameters are
 * carried here.
 */
struct swap_curve
{
  static constexpr std::size_t length = layout::swap_curve::length;

  curve_calculator calculator;

  curve_type type() const noexcept;

  bool operator==( const swap_curve& ) const = default;

  void serialize( std::span< std::byte > out ) const noexcept;
  std::array< std::byte, length > serialize() const noexcept;

  static codec::result< swap_curve > deserialize( std::span< const std::byte > bytes ) noexcept;
};

} // namespace swapwire::state
