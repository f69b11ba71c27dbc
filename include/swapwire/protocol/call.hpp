#pragma once

#include <cstddef>
#include <vector>

#include <swapwire/protocol/identifier.hpp>

namespace swapwire::protocol {

/**
 * An account reference in a call's account list. The on-chain dispatcher
 * addresses accounts by position, so list order is part of the wire
 * contract.
 */
struct account_meta
{
  identifier id{};
  bool is_signer   = false;
  bool is_writable = false;

  bool operator==( const account_meta& ) const = default;
};

account_meta writable( const identifier& id, bool is_signer = false ) noexcept;
account_meta readonly( const identifier& id, bool is_signer = false ) noexcept;

/**
 * A dispatchable program invocation.
 */
struct call
{
  identifier program_id{};
  std::vector< account_meta > accounts;
  std::vector< std::byte > data;

  bool operator==( const call& ) const = default;

  std::size_t size() const noexcept;
};

} // namespace swapwire::protocol
