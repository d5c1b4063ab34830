////////////////////////////////////////////////////////////////////////////////
/// Positional helpers shared by the sequence-like containers: signed index
/// normalization (negative indices count from the end) and start/stop/step
/// slices with clamping.
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include "errors.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
//------------------------------------------------------------------------------
namespace psi::collections
{
//------------------------------------------------------------------------------

struct slice
{
    using index_type = std::ptrdiff_t;

    std::optional<index_type> start{};
    std::optional<index_type> stop {};
    index_type                step { 1 };

    struct resolved
    {
        index_type  start;
        index_type  stop;
        index_type  step;
        std::size_t length;
    }; // struct resolved

    // Clamps the bounds against a sequence of the given size.
    // A zero step is rejected with std::invalid_argument.
    [[ nodiscard ]] constexpr resolved indices( std::size_t const size ) const
    {
        if ( step == 0 )
            detail::throw_invalid_argument( "psi::collections::slice: step cannot be zero" );

        auto const  sz  { static_cast<index_type>( size ) };
        bool const  back{ step < 0 };
        index_type const lower{ back ? -1     : 0  };
        index_type const upper{ back ? sz - 1 : sz };

        auto const clamp_bound{ [=]( std::optional<index_type> const bound, index_type const fallback ) noexcept {
            if ( !bound )
                return fallback;
            auto value{ *bound };
            if ( value < 0 )
                value = std::max( value + sz, lower );
            else
                value = std::min( value, upper );
            return value;
        } };

        auto const first{ clamp_bound( start, back ? upper : lower ) };
        auto const last { clamp_bound( stop , back ? lower : upper ) };

        std::size_t length{ 0 };
        if ( back ? ( last < first ) : ( first < last ) )
        {
            auto const span{ back ? first - last : last - first };
            auto const abs_step{ back ? -step : step };
            length = static_cast<std::size_t>( ( span - 1 ) / abs_step + 1 );
        }
        return { first, last, step, length };
    }
}; // struct slice


namespace detail
{
    // Resolves a possibly negative position against size, nullopt if it
    // falls outside [0, size).
    [[ nodiscard, gnu::pure ]] constexpr std::optional<std::size_t>
    normalize_index( std::ptrdiff_t index, std::size_t const size ) noexcept
    {
        auto const sz{ static_cast<std::ptrdiff_t>( size ) };
        if ( index < 0 )
            index += sz;
        if ( index < 0 || index >= sz )
            return std::nullopt;
        return static_cast<std::size_t>( index );
    }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::collections
//------------------------------------------------------------------------------
