#pragma once

#include <cstddef>

#include <swapwire/codec/primitive.hpp>

// Byte layouts of the persisted account records. Every table must tile its
// record exactly; the static_asserts below keep packing and unpacking honest.

namespace swapwire::state::layout {

constexpr std::size_t flag_length = 1;
constexpr std::size_t u8_length   = 1;
constexpr std::size_t u64_length  = 8;
constexpr std::size_t id_length   = protocol::identifier_length;

namespace fee_schedule {

inline constexpr codec::field fixed_fee_numerator{ "fixed_fee_numerator", 0, u64_length };
inline constexpr codec::field return_fee_numerator{ "return_fee_numerator", 8, u64_length };
inline constexpr codec::field fee_denominator{ "fee_denominator", 16, u64_length };

inline constexpr codec::layout< 3 > fields{ fixed_fee_numerator, return_fee_numerator, fee_denominator };
inline constexpr std::size_t length = 24;

static_assert( codec::contiguous( fields, length ) );

} // namespace fee_schedule

namespace swap_curve {

inline constexpr codec::field curve_type{ "curve_type", 0, u8_length };
inline constexpr codec::field calculator{ "calculator", 1, 32 };

inline constexpr codec::layout< 2 > fields{ curve_type, calculator };
inline constexpr std::size_t length = 33;

static_assert( codec::contiguous( fields, length ) );

// Single numeric parameter at the head of the calculator area
inline constexpr codec::field parameter{ "parameter", 1, u64_length };

static_assert( parameter.offset == calculator.offset && parameter.length <= calculator.length );

} // namespace swap_curve

namespace program_config {

inline constexpr codec::field is_initialized{ "is_initialized", 0, flag_length };
inline constexpr codec::field state_owner{ "state_owner", 1, id_length };
inline constexpr codec::field fee_owner{ "fee_owner", 33, id_length };
inline constexpr codec::field initial_supply{ "initial_supply", 65, u64_length };
inline constexpr codec::field fees{ "fees", 73, fee_schedule::length };
inline constexpr codec::field curve{ "curve", 97, swap_curve::length };

inline constexpr codec::layout< 6 > fields{ is_initialized, state_owner, fee_owner, initial_supply, fees, curve };
inline constexpr std::size_t length = 130;

static_assert( codec::contiguous( fields, length ) );

} // namespace program_config

namespace pool_state {

inline constexpr codec::field is_initialized{ "is_initialized", 0, flag_length };
inline constexpr codec::field nonce{ "nonce", 1, u8_length };
inline constexpr codec::field amm_id{ "amm_id", 2, id_length };
inline constexpr codec::field dex_program_id{ "dex_program_id", 34, id_length };
inline constexpr codec::field market_id{ "market_id", 66, id_length };
inline constexpr codec::field token_program_id{ "token_program_id", 98, id_length };
inline constexpr codec::field token_a{ "token_a", 130, id_length };
inline constexpr codec::field token_b{ "token_b", 162, id_length };
inline constexpr codec::field pool_mint{ "pool_mint", 194, id_length };
inline constexpr codec::field token_a_mint{ "token_a_mint", 226, id_length };
inline constexpr codec::field token_b_mint{ "token_b_mint", 258, id_length };

inline constexpr codec::layout< 11 > fields{ is_initialized,
                                             nonce,
                                             amm_id,
                                             dex_program_id,
                                             market_id,
                                             token_program_id,
                                             token_a,
                                             token_b,
                                             pool_mint,
                                             token_a_mint,
                                             token_b_mint };
inline constexpr std::size_t length = 290;

static_assert( codec::contiguous( fields, length ) );

} // namespace pool_state

namespace versioned_pool_state {

inline constexpr codec::field version{ "version", 0, u8_length };
inline constexpr codec::field body{ "body", 1, pool_state::length };

inline constexpr codec::layout< 2 > fields{ version, body };
inline constexpr std::size_t length = 291;

static_assert( codec::contiguous( fields, length ) );

} // namespace versioned_pool_state

} // namespace swapwire::state::layout
