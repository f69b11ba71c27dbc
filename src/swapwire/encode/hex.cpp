#include <swapwire/encode/hex.hpp>

#include <cstdint>

namespace swapwire::encode {

static constexpr std::string_view digits = "0123456789abcdef";

std::string to_hex( std::span< const std::byte > s )
{
  std::string str;
  str.reserve( 2 + s.size() * 2 );
  str.append( "0x" );

  for( auto b: s )
  {
    auto value = std::to_integer< std::uint8_t >( b );
    str.push_back( digits[ value >> 4 ] );
    str.push_back( digits[ value & 0x0f ] );
  }

  return str;
}

static result< std::uint8_t > nibble( char c ) noexcept
{
  if( c >= '0' && c <= '9' )
    return static_cast< std::uint8_t >( c - '0' );
  if( c >= 'a' && c <= 'f' )
    return static_cast< std::uint8_t >( c - 'a' + 10 );
  if( c >= 'A' && c <= 'F' )
    return static_cast< std::uint8_t >( c - 'A' + 10 );

  return std::unexpected( encode_errc::invalid_hex_digit );
}

static bool is_space( char c ) noexcept
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept
{
  if( sv.starts_with( "0x" ) || sv.starts_with( "0X" ) )
    sv.remove_prefix( 2 );

  std::vector< std::byte > bytes;
  bytes.reserve( sv.size() / 2 );

  std::size_t i = 0;
  while( i < sv.size() )
  {
    if( is_space( sv[ i ] ) )
    {
      ++i;
      continue;
    }

    if( i + 1 == sv.size() )
      return std::unexpected( encode_errc::odd_hex_length );

    auto high = nibble( sv[ i ] );
    if( !high )
      return std::unexpected( high.error() );

    auto low = nibble( sv[ i + 1 ] );
    if( !low )
      return std::unexpected( low.error() );

    bytes.push_back( static_cast< std::byte >( *high << 4 | *low ) );
    i += 2;
  }

  return bytes;
}

} // namespace swapwire::encode
