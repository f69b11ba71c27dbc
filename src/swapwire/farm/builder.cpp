#include <swapwire/farm/builder.hpp>

namespace swapwire::farm {

using protocol::readonly;
using protocol::writable;

protocol::call make_set_program_data_call( const protocol::identifier& program_id,
                                           const set_program_data_accounts& accounts,
                                           const set_program_data& data )
{
  return protocol::call{ .program_id = program_id,
                         .accounts   = { writable( accounts.program_data ), writable( accounts.super_owner, true ) },
                         .data       = encode( data ) };
}

protocol::call make_initialize_farm_call( const protocol::identifier& program_id,
                                          const initialize_farm_accounts& accounts,
                                          const initialize_farm& data )
{
  return protocol::call{ .program_id = program_id,
                         .accounts   = { writable( accounts.farm ),
                                         writable( accounts.authority ),
                                         readonly( accounts.owner, true ),
                                         writable( accounts.pool_lp_token ),
                                         writable( accounts.pool_reward_token ),
                                         readonly( accounts.pool_mint ),
                                         readonly( accounts.reward_mint ),
                                         readonly( accounts.amm_id ),
                                         readonly( accounts.program_data ) },
                         .data       = encode( data ) };
}

static std::vector< protocol::account_meta > stake_account_list( const stake_accounts& accounts, bool owner_writable )
{
  return { writable( accounts.farm ),
           readonly( accounts.authority ),
           protocol::account_meta{ .id = accounts.owner, .is_signer = true, .is_writable = owner_writable },
           writable( accounts.user_info ),
           writable( accounts.user_lp_token ),
           writable( accounts.pool_lp_token ),
           writable( accounts.user_reward_token ),
           writable( accounts.pool_reward_token ),
           writable( accounts.pool_lp_mint ),
           writable( accounts.fee_reward_ata ),
           writable( accounts.program_data ),
           writable( accounts.token_program ),
           readonly( clock_sysvar ) };
}

protocol::call
make_deposit_call( const protocol::identifier& program_id, const stake_accounts& accounts, const deposit& data )
{
  return protocol::call{ .program_id = program_id,
                         .accounts   = stake_account_list( accounts, false ),
                         .data       = encode( data ) };
}

protocol::call
make_withdraw_call( const protocol::identifier& program_id, const stake_accounts& accounts, const withdraw& data )
{
  return protocol::call{ .program_id = program_id,
                         .accounts   = stake_account_list( accounts, true ),
                         .data       = encode( data ) };
}

protocol::call
make_add_reward_call( const protocol::identifier& program_id, const add_reward_accounts& accounts, const add_reward& data )
{
  return protocol::call{ .program_id = program_id,
                         .accounts   = { writable( accounts.farm ),
                                         readonly( accounts.authority ),
                                         readonly( accounts.owner, true ),
                                         writable( accounts.user_reward_token ),
                                         writable( accounts.pool_reward_token ),
                                         writable( accounts.pool_lp_token ),
                                         writable( accounts.pool_lp_mint ),
                                         writable( accounts.program_data ),
                                         writable( accounts.token_program ),
                                         readonly( clock_sysvar ) },
                         .data       = encode( data ) };
}

protocol::call make_pay_farm_fee_call( const protocol::identifier& program_id,
                                       const pay_farm_fee_accounts& accounts,
                                       const pay_farm_fee& data )
{
  return protocol::call{ .program_id = program_id,
                         .accounts   = { writable( accounts.farm ),
                                         readonly( accounts.authority ),
                                         readonly( accounts.owner, true ),
                                         writable( accounts.user_usdc_token ),
                                         writable( accounts.fee_usdc_ata ),
                                         writable( accounts.program_data ),
                                         writable( accounts.token_program ) },
                         .data       = encode( data ) };
}

} // namespace swapwire::farm
