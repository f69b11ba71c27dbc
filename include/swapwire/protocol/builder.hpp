#pragma once

#include <swapwire/protocol/call.hpp>
#include <swapwire/protocol/identifier.hpp>
#include <swapwire/protocol/instruction.hpp>

// Call builders for the AMM program. Each accounts struct lists its members
// in the order the dispatcher expects them. The builders do not check the
// identifiers; ownership and existence are verified at execution time.

namespace swapwire::protocol {

struct initialize_accounts
{
  identifier swap{};          // writable, signer
  identifier authority{};
  identifier state{};
  identifier amm_id{};
  identifier token_a{};
  identifier token_b{};
  identifier pool_mint{};     // writable
  identifier destination{};   // writable, receives the initial pool token supply
  identifier market{};        // writable
  identifier token_program{};
  identifier dex_program{};
};

struct swap_accounts
{
  identifier swap{};
  identifier authority{};
  identifier user_transfer_authority{}; // signer
  identifier state{};                   // signer
  identifier source{};                  // writable
  identifier swap_source{};             // writable
  identifier swap_destination{};        // writable
  identifier destination{};             // writable
  identifier pool_mint{};               // writable
  identifier fee_account{};             // writable
  identifier token_program{};
};

struct deposit_all_token_types_accounts
{
  identifier swap{};
  identifier authority{};
  identifier user_transfer_authority{}; // signer
  identifier state{};
  identifier deposit_token_a{};         // writable
  identifier deposit_token_b{};         // writable
  identifier swap_token_a{};            // writable
  identifier swap_token_b{};            // writable
  identifier pool_mint{};               // writable
  identifier destination{};             // writable
  identifier token_program{};
};

struct withdraw_all_token_types_accounts
{
  identifier swap{};
  identifier authority{};
  identifier user_transfer_authority{}; // signer
  identifier state{};
  identifier pool_mint{};               // writable
  identifier source{};                  // writable
  identifier swap_token_a{};            // writable
  identifier swap_token_b{};            // writable
  identifier destination_token_a{};     // writable
  identifier destination_token_b{};     // writable
  identifier token_program{};
};

struct deposit_single_token_type_accounts
{
  identifier swap{};
  identifier authority{};
  identifier user_transfer_authority{}; // signer
  identifier source_token{};            // writable, token A or B
  identifier swap_token_a{};            // writable
  identifier swap_token_b{};            // writable
  identifier pool_mint{};               // writable
  identifier destination{};             // writable
  identifier token_program{};
};

struct withdraw_single_token_type_accounts
{
  identifier swap{};
  identifier authority{};
  identifier user_transfer_authority{}; // signer
  identifier pool_mint{};               // writable
  identifier pool_token_source{};       // writable
  identifier swap_token_a{};            // writable
  identifier swap_token_b{};            // writable
  identifier destination{};             // writable, token A or B
  identifier token_program{};
};

call make_initialize_call( const identifier& program_id, const initialize_accounts& accounts, const initialize& data );

call make_swap_call( const identifier& program_id, const swap_accounts& accounts, const swap& data );

call make_deposit_all_token_types_call( const identifier& program_id,
                                        const deposit_all_token_types_accounts& accounts,
                                        const deposit_all_token_types& data );

call make_withdraw_all_token_types_call( const identifier& program_id,
                                         const withdraw_all_token_types_accounts& accounts,
                                         const withdraw_all_token_types& data );

call make_deposit_single_token_type_exact_amount_in_call( const identifier& program_id,
                                                          const deposit_single_token_type_accounts& accounts,
                                                          const deposit_single_token_type_exact_amount_in& data );

call make_withdraw_single_token_type_exact_amount_out_call( const identifier& program_id,
                                                            const withdraw_single_token_type_accounts& accounts,
                                                            const withdraw_single_token_type_exact_amount_out& data );

} // namespace swapwire::protocol
