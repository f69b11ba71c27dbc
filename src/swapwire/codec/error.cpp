#include <swapwire/codec/error.hpp>

#include <utility>

namespace swapwire::codec {

struct _codec_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _codec_category::name() const noexcept
{
  return "codec";
}

std::string _codec_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< codec_errc >( condition ) )
  {
    case codec_errc::ok:
      return "ok"s;
    case codec_errc::missing_discriminant:
      return "missing discriminant"s;
    case codec_errc::unknown_discriminant:
      return "unknown discriminant"s;
    case codec_errc::truncated_input:
      return "truncated input"s;
    case codec_errc::malformed_payload:
      return "malformed payload"s;
    case codec_errc::buffer_too_small:
      return "buffer too small"s;
    case codec_errc::invalid_flag_byte:
      return "invalid flag byte"s;
    case codec_errc::unsupported_version:
      return "unsupported version"s;
    case codec_errc::unknown_curve_type:
      return "unknown curve type"s;
  }
  std::unreachable();
}

const std::error_category& codec_category() noexcept
{
  static _codec_category category;
  return category;
}

std::error_code make_error_code( codec_errc e )
{
  return std::error_code( static_cast< int >( e ), codec_category() );
}

} // namespace swapwire::codec
