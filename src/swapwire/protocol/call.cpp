#include <swapwire/protocol/call.hpp>

namespace swapwire::protocol {

account_meta writable( const identifier& id, bool is_signer ) noexcept
{
  return account_meta{ .id = id, .is_signer = is_signer, .is_writable = true };
}

account_meta readonly( const identifier& id, bool is_signer ) noexcept
{
  return account_meta{ .id = id, .is_signer = is_signer, .is_writable = false };
}

std::size_t call::size() const noexcept
{
  std::size_t bytes = 0;

  bytes += program_id.size();

  for( const auto& account: accounts )
  {
    bytes += account.id.size();
    bytes += sizeof( account.is_signer );
    bytes += sizeof( account.is_writable );
  }

  bytes += data.size();

  return bytes;
}

} // namespace swapwire::protocol
