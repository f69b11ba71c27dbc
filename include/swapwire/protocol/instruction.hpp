#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

#include <swapwire/codec/error.hpp>

namespace swapwire::protocol {

struct initialize
{
  // Bump seed used to derive the pool authority address
  std::uint8_t nonce = 0;

  bool operator==( const initialize& ) const = default;
};

struct swap
{
  std::uint64_t amount_in          = 0;
  std::uint64_t minimum_amount_out = 0;

  bool operator==( const swap& ) const = default;
};

struct deposit_all_token_types
{
  std::uint64_t pool_token_amount      = 0;
  std::uint64_t maximum_token_a_amount = 0;
  std::uint64_t maximum_token_b_amount = 0;

  bool operator==( const deposit_all_token_types& ) const = default;
};

struct withdraw_all_token_types
{
  std::uint64_t pool_token_amount      = 0;
  std::uint64_t minimum_token_a_amount = 0;
  std::uint64_t minimum_token_b_amount = 0;

  bool operator==( const withdraw_all_token_types& ) const = default;
};

struct deposit_single_token_type_exact_amount_in
{
  std::uint64_t source_token_amount       = 0;
  std::uint64_t minimum_pool_token_amount = 0;

  bool operator==( const deposit_single_token_type_exact_amount_in& ) const = default;
};

struct withdraw_single_token_type_exact_amount_out
{
  std::uint64_t destination_token_amount  = 0;
  std::uint64_t maximum_pool_token_amount = 0;

  bool operator==( const withdraw_single_token_type_exact_amount_out& ) const = default;
};

/**
 * The variant index is the wire discriminant.
 */
using instruction = std::variant< initialize,
                                  swap,
                                  deposit_all_token_types,
                                  withdraw_all_token_types,
                                  deposit_single_token_type_exact_amount_in,
                                  withdraw_single_token_type_exact_amount_out >;

enum class instruction_tag : std::uint8_t
{
  initialize,
  swap,
  deposit_all_token_types,
  withdraw_all_token_types,
  deposit_single_token_type_exact_amount_in,
  withdraw_single_token_type_exact_amount_out
};

instruction_tag tag_of( const instruction& i ) noexcept;
std::string_view name_of( instruction_tag tag ) noexcept;

/**
 * Decodes an instruction payload.
 *
 * Initialize must carry exactly one byte after the tag. The remaining
 * variants ignore any bytes after their last field; deployed callers may
 * depend on this.
 */
codec::result< instruction > decode( std::span< const std::byte > bytes ) noexcept;

std::vector< std::byte > encode( const instruction& i );
std::size_t encoded_size( const instruction& i ) noexcept;

} // namespace swapwire::protocol
