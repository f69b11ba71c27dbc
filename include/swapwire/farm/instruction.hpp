#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

#include <swapwire/codec/error.hpp>
#include <swapwire/protocol/identifier.hpp>

namespace swapwire::farm {

struct set_program_data
{
  protocol::identifier super_owner{};
  protocol::identifier fee_owner{};
  protocol::identifier allowed_creator{};
  protocol::identifier amm_program_id{};
  std::uint64_t farm_fee                = 0;
  std::uint64_t harvest_fee_numerator   = 0;
  std::uint64_t harvest_fee_denominator = 0;

  bool operator==( const set_program_data& ) const = default;
};

struct initialize_farm
{
  std::uint8_t nonce            = 0;
  std::uint64_t start_timestamp = 0;
  std::uint64_t end_timestamp   = 0;

  bool operator==( const initialize_farm& ) const = default;
};

// Stake LP tokens. A zero amount only harvests pending rewards.
struct deposit
{
  std::uint64_t amount = 0;

  bool operator==( const deposit& ) const = default;
};

struct withdraw
{
  std::uint64_t amount = 0;

  bool operator==( const withdraw& ) const = default;
};

struct add_reward
{
  std::uint64_t amount = 0;

  bool operator==( const add_reward& ) const = default;
};

struct pay_farm_fee
{
  std::uint64_t amount = 0;

  bool operator==( const pay_farm_fee& ) const = default;
};

using instruction = std::variant< set_program_data, initialize_farm, deposit, withdraw, add_reward, pay_farm_fee >;

enum class instruction_tag : std::uint8_t
{
  set_program_data,
  initialize_farm,
  deposit,
  withdraw,
  add_reward,
  pay_farm_fee
};

instruction_tag tag_of( const instruction& i ) noexcept;
std::string_view name_of( instruction_tag tag ) noexcept;

/**
 * Decodes a farm instruction payload. Unlike the AMM instructions every
 * farm variant must be consumed exactly; leftover bytes are rejected.
 */
codec::result< instruction > decode( std::span< const std::byte > bytes ) noexcept;

std::vector< std::byte > encode( const instruction& i );

} // namespace swapwire::farm
