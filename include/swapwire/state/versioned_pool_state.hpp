#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <variant>

#include <swapwire/codec/error.hpp>
#include <swapwire/protocol/identifier.hpp>
#include <swapwire/state/layout.hpp>
#include <swapwire/state/pool_state.hpp>

namespace swapwire::state {

/**
 * A pool account prefixed by its layout version.
 *
 * Accounts keep the layout they were written with. A new layout is added as
 * a new alternative with its own version byte; the accessors below read any
 * of them without the caller knowing which one it holds.
 */
class versioned_pool_state final
{
public:
  using variant_type = std::variant< pool_state >;

  static constexpr std::uint8_t latest_version = pool_state::version;
  static constexpr std::size_t latest_length   = layout::versioned_pool_state::length;

  explicit versioned_pool_state( pool_state state ) noexcept;

  std::uint8_t version() const noexcept;

  bool is_initialized() const noexcept;
  std::uint8_t nonce() const noexcept;
  const protocol::identifier& token_program_id() const noexcept;
  const protocol::identifier& token_a_account() const noexcept;
  const protocol::identifier& token_b_account() const noexcept;
  const protocol::identifier& pool_mint() const noexcept;
  const protocol::identifier& token_a_mint() const noexcept;
  const protocol::identifier& token_b_mint() const noexcept;

  const variant_type& state() const noexcept;

  void serialize( std::span< std::byte > out ) const noexcept;
  std::array< std::byte, latest_length > serialize() const noexcept;

  static codec::result< versioned_pool_state > deserialize( std::span< const std::byte > bytes ) noexcept;

  /**
   * Cheap gate used before full account validation. Any decode failure is
   * reported as not initialized.
   */
  static bool is_initialized_probe( std::span< const std::byte > bytes ) noexcept;

private:
  variant_type _state;
};

} // namespace swapwire::state
