#pragma once

#include <quill/DeferredFormatCodec.h>

#include <gatekeeper/quota/scope.hpp>
#include <gatekeeper/quota/tag.hpp>

template<>
struct fmtquill::formatter< gatekeeper::quota::tag >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const gatekeeper::quota::tag& t, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", t.str() );
  }
};

template<>
struct quill::Codec< gatekeeper::quota::tag >: quill::DeferredFormatCodec< gatekeeper::quota::tag >
{};

template<>
struct fmtquill::formatter< gatekeeper::quota::scope >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( gatekeeper::quota::scope s, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", gatekeeper::quota::to_string( s ) );
  }
};

template<>
struct quill::Codec< gatekeeper::quota::scope >: quill::DeferredFormatCodec< gatekeeper::quota::scope >
{};
