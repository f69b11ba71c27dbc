#include <swapwire/encode/error.hpp>

#include <utility>

namespace swapwire::encode {

struct _encode_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _encode_category::name() const noexcept
{
  return "encode";
}

std::string _encode_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< encode_errc >( condition ) )
  {
    case encode_errc::ok:
      return "ok"s;
    case encode_errc::invalid_hex_digit:
      return "invalid hex digit"s;
    case encode_errc::odd_hex_length:
      return "odd number of hex digits"s;
    case encode_errc::invalid_base58_digit:
      return "invalid base58 digit"s;
    case encode_errc::invalid_key_length:
      return "decoded key has the wrong length"s;
  }
  std::unreachable();
}

const std::error_category& encode_category() noexcept
{
  static _encode_category category;
  return category;
}

std::error_code make_error_code( encode_errc e )
{
  return std::error_code( static_cast< int >( e ), encode_category() );
}

} // namespace swapwire::encode
