#include <swapwire/codec/primitive.hpp>

#include <cassert>

#include <boost/endian.hpp>

namespace swapwire::codec {

result< decoded< std::span< const std::byte > > > read_exact( std::span< const std::byte > buffer,
                                                              std::size_t n ) noexcept
{
  if( buffer.size() < n )
    return std::unexpected( codec_errc::truncated_input );

  return decoded< std::span< const std::byte > >{ buffer.first( n ), buffer.subspan( n ) };
}

result< decoded< std::uint8_t > > read_u8( std::span< const std::byte > buffer ) noexcept
{
  auto bytes = read_exact( buffer, sizeof( std::uint8_t ) );
  if( !bytes )
    return std::unexpected( bytes.error() );

  return decoded< std::uint8_t >{ std::to_integer< std::uint8_t >( bytes->value.front() ), bytes->remainder };
}

result< decoded< std::uint64_t > > read_u64( std::span< const std::byte > buffer ) noexcept
{
  auto bytes = read_exact( buffer, sizeof( std::uint64_t ) );
  if( !bytes )
    return std::unexpected( bytes.error() );

  auto value = boost::endian::load_little_u64( reinterpret_cast< const unsigned char* >( bytes->value.data() ) );
  return decoded< std::uint64_t >{ value, bytes->remainder };
}

result< decoded< protocol::identifier > > read_identifier( std::span< const std::byte > buffer ) noexcept
{
  auto bytes = read_exact( buffer, protocol::identifier_length );
  if( !bytes )
    return std::unexpected( bytes.error() );

  decoded< protocol::identifier > id{ {}, bytes->remainder };
  std::ranges::copy( bytes->value, id.value.begin() );
  return id;
}

void write_u8( std::vector< std::byte >& out, std::uint8_t value )
{
  out.push_back( static_cast< std::byte >( value ) );
}

void write_u64( std::vector< std::byte >& out, std::uint64_t value )
{
  std::array< unsigned char, sizeof( std::uint64_t ) > bytes;
  boost::endian::store_little_u64( bytes.data(), value );
  for( auto b: bytes )
    out.push_back( static_cast< std::byte >( b ) );
}

void write_identifier( std::vector< std::byte >& out, const protocol::identifier& id )
{
  out.insert( out.end(), id.begin(), id.end() );
}

reader::reader( std::span< const std::byte > buffer ) noexcept:
    _buffer( buffer )
{}

result< std::uint8_t > reader::read_u8() noexcept
{
  return advance( codec::read_u8( _buffer ) );
}

result< std::uint64_t > reader::read_u64() noexcept
{
  return advance( codec::read_u64( _buffer ) );
}

result< protocol::identifier > reader::read_identifier() noexcept
{
  return advance( codec::read_identifier( _buffer ) );
}

std::span< const std::byte > reader::remainder() const noexcept
{
  return _buffer;
}

bool reader::empty() const noexcept
{
  return _buffer.empty();
}

result< std::span< const std::byte > > field_bytes( std::span< const std::byte > record, const field& f ) noexcept
{
  if( record.size() < f.end() )
    return std::unexpected( codec_errc::buffer_too_small );

  auto bytes = read_exact( record.subspan( f.offset ), f.length );
  if( !bytes )
    return std::unexpected( bytes.error() );

  return bytes->value;
}

std::span< std::byte > field_bytes( std::span< std::byte > record, const field& f ) noexcept
{
  assert( record.size() >= f.end() );
  return record.subspan( f.offset, f.length );
}

void write_field( std::span< std::byte > record, const field& f, bool value ) noexcept
{
  write_field( record, f, static_cast< std::uint8_t >( value ? 1 : 0 ) );
}

void write_field( std::span< std::byte > record, const field& f, std::uint8_t value ) noexcept
{
  auto bytes = field_bytes( record, f );
  assert( bytes.size() == sizeof( std::uint8_t ) );
  bytes.front() = static_cast< std::byte >( value );
}

void write_field( std::span< std::byte > record, const field& f, std::uint64_t value ) noexcept
{
  auto bytes = field_bytes( record, f );
  assert( bytes.size() == sizeof( std::uint64_t ) );
  boost::endian::store_little_u64( reinterpret_cast< unsigned char* >( bytes.data() ), value );
}

void write_field( std::span< std::byte > record, const field& f, const protocol::identifier& value ) noexcept
{
  auto bytes = field_bytes( record, f );
  assert( bytes.size() == protocol::identifier_length );
  std::ranges::copy( value, bytes.begin() );
}

} // namespace swapwire::codec
