#pragma once

#include <algorithm>
#include <array>
#include <concepts>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <swapwire/codec/error.hpp>
#include <swapwire/protocol/identifier.hpp>

namespace swapwire::codec {

template< typename T >
struct decoded
{
  T value;
  std::span< const std::byte > remainder;
};

/**
 * Splits exactly n bytes off the front of the buffer.
 *
 * Every read in the codec goes through this function, so no read can pass
 * the end of the caller's buffer.
 */
result< decoded< std::span< const std::byte > > > read_exact( std::span< const std::byte > buffer,
                                                              std::size_t n ) noexcept;

result< decoded< std::uint8_t > > read_u8( std::span< const std::byte > buffer ) noexcept;
result< decoded< std::uint64_t > > read_u64( std::span< const std::byte > buffer ) noexcept;
result< decoded< protocol::identifier > > read_identifier( std::span< const std::byte > buffer ) noexcept;

void write_u8( std::vector< std::byte >& out, std::uint8_t value );
void write_u64( std::vector< std::byte >& out, std::uint64_t value );
void write_identifier( std::vector< std::byte >& out, const protocol::identifier& id );

/**
 * Sequential cursor over a byte buffer.
 */
class reader final
{
public:
  explicit reader( std::span< const std::byte > buffer ) noexcept;

  result< std::uint8_t > read_u8() noexcept;
  result< std::uint64_t > read_u64() noexcept;
  result< protocol::identifier > read_identifier() noexcept;

  std::span< const std::byte > remainder() const noexcept;
  bool empty() const noexcept;

private:
  template< typename T >
  result< T > advance( result< decoded< T > >&& r ) noexcept
  {
    if( !r )
      return std::unexpected( r.error() );

    _buffer = r->remainder;
    return std::move( r->value );
  }

  std::span< const std::byte > _buffer;
};

/**
 * A named byte range inside a fixed-length record.
 */
struct field
{
  std::string_view name;
  std::size_t offset = 0;
  std::size_t length = 0;

  constexpr std::size_t end() const noexcept
  {
    return offset + length;
  }
};

template< std::size_t N >
using layout = std::array< field, N >;

/**
 * True when the fields cover [0, length) in order, without gaps or overlap.
 */
template< std::size_t N >
constexpr bool contiguous( const layout< N >& fields, std::size_t length ) noexcept
{
  std::size_t next = 0;
  for( const auto& f: fields )
  {
    if( f.offset != next || f.length == 0 )
      return false;

    next = f.end();
  }

  return next == length;
}

template< std::size_t N >
constexpr std::size_t length_of( const layout< N >& fields ) noexcept
{
  return fields.empty() ? 0 : fields.back().end();
}

result< std::span< const std::byte > > field_bytes( std::span< const std::byte > record, const field& f ) noexcept;
std::span< std::byte > field_bytes( std::span< std::byte > record, const field& f ) noexcept;

template< typename T >
  requires( std::same_as< T, bool > || std::same_as< T, std::uint8_t > || std::same_as< T, std::uint64_t >
            || std::same_as< T, protocol::identifier > )
result< T > read_field( std::span< const std::byte > record, const field& f ) noexcept
{
  auto bytes = field_bytes( record, f );
  if( !bytes )
    return std::unexpected( bytes.error() );

  if constexpr( std::same_as< T, bool > )
  {
    auto flag = read_u8( *bytes );
    if( !flag )
      return std::unexpected( flag.error() );

    switch( flag->value )
    {
      case 0:
        return false;
      case 1:
        return true;
      default:
        return std::unexpected( codec_errc::invalid_flag_byte );
    }
  }
  else if constexpr( std::same_as< T, std::uint8_t > )
  {
    auto value = read_u8( *bytes );
    if( !value )
      return std::unexpected( value.error() );
    return value->value;
  }
  else if constexpr( std::same_as< T, std::uint64_t > )
  {
    auto value = read_u64( *bytes );
    if( !value )
      return std::unexpected( value.error() );
    return value->value;
  }
  else
  {
    auto value = read_identifier( *bytes );
    if( !value )
      return std::unexpected( value.error() );
    return value->value;
  }
}

void write_field( std::span< std::byte > record, const field& f, bool value ) noexcept;
void write_field( std::span< std::byte > record, const field& f, std::uint8_t value ) noexcept;
void write_field( std::span< std::byte > record, const field& f, std::uint64_t value ) noexcept;
void write_field( std::span< std::byte > record, const field& f, const protocol::identifier& value ) noexcept;

} // namespace swapwire::codec
