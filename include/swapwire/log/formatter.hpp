#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <swapwire/encode.hpp>
#include <swapwire/farm/instruction.hpp>
#include <swapwire/protocol/identifier.hpp>
#include <swapwire/protocol/instruction.hpp>

namespace swapwire::log {

struct payload_tag
{};

// Raw instruction or account bytes, printed as hex
using payload = quill::BinaryData< payload_tag >;

// An account address or public key, printed as base58
struct key
{
  protocol::identifier id;
};

} // namespace swapwire::log

template<>
struct fmtquill::formatter< swapwire::log::payload >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const swapwire::log::payload& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                swapwire::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< swapwire::log::payload >: quill::BinaryDataDeferredFormatCodec< swapwire::log::payload >
{};

template<>
struct fmtquill::formatter< swapwire::log::key >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const swapwire::log::key& k, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", swapwire::protocol::to_base58( k.id ) );
  }
};

template<>
struct quill::Codec< swapwire::log::key >: quill::DeferredFormatCodec< swapwire::log::key >
{};

template<>
struct fmtquill::formatter< swapwire::protocol::instruction_tag >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( swapwire::protocol::instruction_tag tag, format_context& ctx ) const
  {
    auto name = swapwire::protocol::name_of( tag );
    return fmtquill::format_to( ctx.out(), "{}", fmtquill::string_view( name.data(), name.size() ) );
  }
};

template<>
struct quill::Codec< swapwire::protocol::instruction_tag >: quill::DeferredFormatCodec< swapwire::protocol::instruction_tag >
{};

template<>
struct fmtquill::formatter< swapwire::farm::instruction_tag >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( swapwire::farm::instruction_tag tag, format_context& ctx ) const
  {
    auto name = swapwire::farm::name_of( tag );
    return fmtquill::format_to( ctx.out(), "{}", fmtquill::string_view( name.data(), name.size() ) );
  }
};

template<>
struct quill::Codec< swapwire::farm::instruction_tag >: quill::DeferredFormatCodec< swapwire::farm::instruction_tag >
{};
