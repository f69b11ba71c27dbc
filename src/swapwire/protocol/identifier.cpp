#include <swapwire/protocol/identifier.hpp>

#include <algorithm>

#include <swapwire/encode/base58.hpp>

namespace swapwire::protocol {

std::string to_base58( const identifier& id )
{
  return encode::to_base58( id );
}

encode::result< identifier > identifier_from_base58( std::string_view sv ) noexcept
{
  auto bytes = encode::from_base58( sv, identifier_length );
  if( !bytes )
    return std::unexpected( bytes.error() );

  identifier id{};
  std::ranges::copy( *bytes, id.begin() );
  return id;
}

} // namespace swapwire::protocol
