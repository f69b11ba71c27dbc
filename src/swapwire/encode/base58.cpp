#include <swapwire/encode/base58.hpp>

#include <algorithm>
#include <array>
#include <cstdint>

namespace swapwire::encode {

static constexpr std::string_view alphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
static constexpr std::uint32_t radix       = 58;
static constexpr std::uint32_t byte_radix  = 256;

static constexpr auto reverse_alphabet = []()
{
  std::array< std::int8_t, byte_radix > table{};
  table.fill( -1 );
  for( std::size_t i = 0; i < alphabet.size(); ++i )
    table[ static_cast< unsigned char >( alphabet[ i ] ) ] = static_cast< std::int8_t >( i );
  return table;
}();

std::string to_base58( std::span< const std::byte > s )
{
  auto zeroes = std::ranges::distance( s.begin(), std::ranges::find_if_not( s, []( std::byte b ) {
                                         return b == std::byte{ 0x00 };
                                       } ) );

  // Upper bound of log(256) / log(58)
  std::vector< std::uint8_t > digits( ( s.size() - zeroes ) * 138 / 100 + 1 );
  std::size_t length = 0;

  for( auto b: s.subspan( zeroes ) )
  {
    std::uint32_t carry = std::to_integer< std::uint32_t >( b );
    std::size_t i       = 0;
    for( auto it = digits.rbegin(); ( carry != 0 || i < length ) && it != digits.rend(); ++it, ++i )
    {
      carry += byte_radix * *it;
      *it    = static_cast< std::uint8_t >( carry % radix );
      carry /= radix;
    }
    length = i;
  }

  auto it = digits.begin() + static_cast< std::ptrdiff_t >( digits.size() - length );
  while( it != digits.end() && *it == 0 )
    ++it;

  std::string str( static_cast< std::size_t >( zeroes ), alphabet[ 0 ] );
  str.reserve( str.size() + static_cast< std::size_t >( digits.end() - it ) );
  for( ; it != digits.end(); ++it )
    str.push_back( alphabet[ *it ] );

  return str;
}

result< std::vector< std::byte > > from_base58( std::string_view sv ) noexcept
{
  auto ones = std::ranges::distance( sv.begin(), std::ranges::find_if_not( sv, []( char c ) {
                                       return c == alphabet[ 0 ];
                                     } ) );

  // Upper bound of log(58) / log(256)
  std::vector< std::uint8_t > b256( ( sv.size() - ones ) * 733 / 1'000 + 1 );
  std::size_t length = 0;

  for( char c: sv.substr( ones ) )
  {
    auto value = reverse_alphabet[ static_cast< unsigned char >( c ) ];
    if( value < 0 )
      return std::unexpected( encode_errc::invalid_base58_digit );

    auto carry    = static_cast< std::uint32_t >( value );
    std::size_t i = 0;
    for( auto it = b256.rbegin(); ( carry != 0 || i < length ) && it != b256.rend(); ++it, ++i )
    {
      carry += radix * *it;
      *it    = static_cast< std::uint8_t >( carry % byte_radix );
      carry /= byte_radix;
    }
    length = i;
  }

  auto it = b256.begin() + static_cast< std::ptrdiff_t >( b256.size() - length );
  while( it != b256.end() && *it == 0 )
    ++it;

  std::vector< std::byte > bytes( static_cast< std::size_t >( ones ), std::byte{ 0x00 } );
  bytes.reserve( bytes.size() + static_cast< std::size_t >( b256.end() - it ) );
  for( ; it != b256.end(); ++it )
    bytes.push_back( static_cast< std::byte >( *it ) );

  return bytes;
}

result< std::vector< std::byte > > from_base58( std::string_view sv, std::size_t key_length ) noexcept
{
  auto bytes = from_base58( sv );
  if( bytes && bytes->size() != key_length )
    return std::unexpected( encode_errc::invalid_key_length );

  return bytes;
}

} // namespace swapwire::encode
