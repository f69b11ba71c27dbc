#include <swapwire/protocol/builder.hpp>

namespace swapwire::protocol {

call make_initialize_call( const identifier& program_id, const initialize_accounts& accounts, const initialize& data )
{
  return call{ .program_id = program_id,
               .accounts   = { writable( accounts.swap, true ),
                               readonly( accounts.authority ),
                               readonly( accounts.state ),
                               readonly( accounts.amm_id ),
                               readonly( accounts.token_a ),
                               readonly( accounts.token_b ),
                               writable( accounts.pool_mint ),
                               writable( accounts.destination ),
                               writable( accounts.market ),
                               readonly( accounts.token_program ),
                               readonly( accounts.dex_program ) },
               .data       = encode( data ) };
}

call make_swap_call( const identifier& program_id, const swap_accounts& accounts, const swap& data )
{
  return call{ .program_id = program_id,
               .accounts   = { readonly( accounts.swap ),
                               readonly( accounts.authority ),
                               readonly( accounts.user_transfer_authority, true ),
                               readonly( accounts.state, true ),
                               writable( accounts.source ),
                               writable( accounts.swap_source ),
                               writable( accounts.swap_destination ),
                               writable( accounts.destination ),
                               writable( accounts.pool_mint ),
                               writable( accounts.fee_account ),
                               readonly( accounts.token_program ) },
               .data       = encode( data ) };
}

call make_deposit_all_token_types_call( const identifier& program_id,
                                        const deposit_all_token_types_accounts& accounts,
                                        const deposit_all_token_types& data )
{
  return call{ .program_id = program_id,
               .accounts   = { readonly( accounts.swap ),
                               readonly( accounts.authority ),
                               readonly( accounts.user_transfer_authority, true ),
                               readonly( accounts.state ),
                               writable( accounts.deposit_token_a ),
                               writable( accounts.deposit_token_b ),
                               writable( accounts.swap_token_a ),
                               writable( accounts.swap_token_b ),
                               writable( accounts.pool_mint ),
                               writable( accounts.destination ),
                               readonly( accounts.token_program ) },
               .data       = encode( data ) };
}

call make_withdraw_all_token_types_call( const identifier& program_id,
                                         const withdraw_all_token_types_accounts& accounts,
                                         const withdraw_all_token_types& data )
{
  return call{ .program_id = program_id,
               .accounts   = { readonly( accounts.swap ),
                               readonly( accounts.authority ),
                               readonly( accounts.user_transfer_authority, true ),
                               readonly( accounts.state ),
                               writable( accounts.pool_mint ),
                               writable( accounts.source ),
                               writable( accounts.swap_token_a ),
                               writable( accounts.swap_token_b ),
                               writable( accounts.destination_token_a ),
                               writable( accounts.destination_token_b ),
                               readonly( accounts.token_program ) },
               .data       = encode( data ) };
}

call make_deposit_single_token_type_exact_amount_in_call( const identifier& program_id,
                                                          const deposit_single_token_type_accounts& accounts,
                                                          const deposit_single_token_type_exact_amount_in& data )
{
  return call{ .program_id = program_id,
               .accounts   = { readonly( accounts.swap ),
                               readonly( accounts.authority ),
                               readonly( accounts.user_transfer_authority, true ),
                               writable( accounts.source_token ),
                               writable( accounts.swap_token_a ),
                               writable( accounts.swap_token_b ),
                               writable( accounts.pool_mint ),
                               writable( accounts.destination ),
                               readonly( accounts.token_program ) },
               .data       = encode( data ) };
}

call make_withdraw_single_token_type_exact_amount_out_call( const identifier& program_id,
                                                            const withdraw_single_token_type_accounts& accounts,
                                                            const withdraw_single_token_type_exact_amount_out& data )
{
  return call{ .program_id = program_id,
               .accounts   = { readonly( accounts.swap ),
                               readonly( accounts.authority ),
                               readonly( accounts.user_transfer_authority, true ),
                               writable( accounts.pool_mint ),
                               writable( accounts.pool_token_source ),
                               writable( accounts.swap_token_a ),
                               writable( accounts.swap_token_b ),
                               writable( accounts.destination ),
                               readonly( accounts.token_program ) },
               .data       = encode( data ) };
}

} // namespace swapwire::protocol
