#pragma once

#include <array>
#include <cstdint>

#include <swapwire/farm/instruction.hpp>
#include <swapwire/protocol/call.hpp>
#include <swapwire/protocol/identifier.hpp>

// Call builders for the yield farm program. Account structs list their members
// in dispatch order.

namespace swapwire::farm {

// SysvarC1ock11111111111111111111111111111111
inline constexpr protocol::identifier clock_sysvar = []()
{
  constexpr std::array< std::uint8_t, protocol::identifier_length > raw{
    0x06, 0xa7, 0xd5, 0x17, 0x18, 0xc7, 0x74, 0xc9,
    0x28, 0x56, 0x63, 0x98, 0x69, 0x1d, 0x5e, 0xb6,
    0x8b, 0x5e, 0xb8, 0xa3, 0x9b, 0x4b, 0x6d, 0x5c,
    0x73, 0x55, 0x5b, 0x21, 0x00, 0x00, 0x00, 0x00 };

  protocol::identifier id{};
  for( std::size_t i = 0; i < raw.size(); ++i )
    id[ i ] = std::byte{ raw[ i ] };
  return id;
}();

struct set_program_data_accounts
{
  protocol::identifier program_data{}; // writable
  protocol::identifier super_owner{};  // writable, signer
};

struct initialize_farm_accounts
{
  protocol::identifier farm{};                // writable
  protocol::identifier authority{};           // writable
  protocol::identifier owner{};               // signer
  protocol::identifier pool_lp_token{};       // writable
  protocol::identifier pool_reward_token{};   // writable
  protocol::identifier pool_mint{};
  protocol::identifier reward_mint{};
  protocol::identifier amm_id{};
  protocol::identifier program_data{};
};

// Shared by deposit and withdraw. The clock sysvar is appended by the builder.
struct stake_accounts
{
  protocol::identifier farm{};              // writable
  protocol::identifier authority{};
  protocol::identifier owner{};             // signer, writable on withdraw
  protocol::identifier user_info{};         // writable
  protocol::identifier user_lp_token{};     // writable
  protocol::identifier pool_lp_token{};     // writable
  protocol::identifier user_reward_token{}; // writable
  protocol::identifier pool_reward_token{}; // writable
  protocol::identifier pool_lp_mint{};      // writable
  protocol::identifier fee_reward_ata{};    // writable
  protocol::identifier program_data{};      // writable
  protocol::identifier token_program{};     // writable
};

struct add_reward_accounts
{
  protocol::identifier farm{};              // writable
  protocol::identifier authority{};
  protocol::identifier owner{};             // signer
  protocol::identifier user_reward_token{}; // writable
  protocol::identifier pool_reward_token{}; // writable
  protocol::identifier pool_lp_token{};     // writable
  protocol::identifier pool_lp_mint{};      // writable
  protocol::identifier program_data{};      // writable
  protocol::identifier token_program{};     // writable
};

struct pay_farm_fee_accounts
{
  protocol::identifier farm{};            // writable
  protocol::identifier authority{};
  protocol::identifier owner{};           // signer
  protocol::identifier user_usdc_token{}; // writable
  protocol::identifier fee_usdc_ata{};    // writable
  protocol::identifier program_data{};    // writable
  protocol::identifier token_program{};   // writable
};

protocol::call make_set_program_data_call( const protocol::identifier& program_id,
                                           const set_program_data_accounts& accounts,
                                           const set_program_data& data );

protocol::call make_initialize_farm_call( const protocol::identifier& program_id,
                                          const initialize_farm_accounts& accounts,
                                          const initialize_farm& data );

protocol::call
make_deposit_call( const protocol::identifier& program_id, const stake_accounts& accounts, const deposit& data );

protocol::call
make_withdraw_call( const protocol::identifier& program_id, const stake_accounts& accounts, const withdraw& data );

protocol::call
make_add_reward_call( const protocol::identifier& program_id, const add_reward_accounts& accounts, const add_reward& data );

protocol::call make_pay_farm_fee_call( const protocol::identifier& program_id,
                                       const pay_farm_fee_accounts& accounts,
                                       const pay_farm_fee& data );

} // namespace swapwire::farm
