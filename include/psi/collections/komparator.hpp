////////////////////////////////////////////////////////////////////////////////
/// Comparator traits, utilities and the Komparator wrapper for psi::collections
/// sorted containers.
///
/// Contents:
///   - total_less<T>              : strict order that refuses unordered pairs
///   - is_simple_comparator<T>    : trait: can == replace double-negation test?
///   - comp_eq(comp, a, b)        : optimised equality from strict-weak comparator
///   - Komparator<Comparator>     : EBO wrapper with le/ge/eq/leq/geq + sort
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

#include <boost/sort/pdqsort/pdqsort.hpp>

#include <compare>
#include <concepts>
#include <functional>
#include <iterator>
#include <type_traits>
//------------------------------------------------------------------------------
namespace psi::collections
{
//------------------------------------------------------------------------------

//==============================================================================
// total_less: the default sorted_dict comparator
//==============================================================================

/// Behaves as std::less but, for three-way comparable types, inspects the
/// full comparison result: a pair that is neither less, equivalent nor
/// greater (e.g. a NaN against anything) throws ordering_error at the point
/// of comparison instead of silently corrupting the sort order.
template <typename T = void>
struct total_less
{
    constexpr bool operator()( T const & left, T const & right ) const
    {
        if constexpr ( std::three_way_comparable<T> )
        {
            std::partial_ordering const order{ left <=> right };
            if ( order == std::partial_ordering::unordered ) [[ unlikely ]]
                detail::throw_ordering_error( "psi::collections::total_less: keys are not mutually comparable" );
            return order < 0;
        }
        else
        {
            return left < right;
        }
    }
}; // struct total_less

template <>
struct total_less<void>
{
    using is_transparent = void;

    template <typename L, typename R>
    constexpr bool operator()( L const & left, R const & right ) const
    {
        if constexpr ( std::three_way_comparable_with<L, R> )
        {
            std::partial_ordering const order{ left <=> right };
            if ( order == std::partial_ordering::unordered ) [[ unlikely ]]
                detail::throw_ordering_error( "psi::collections::total_less: keys are not mutually comparable" );
            return order < 0;
        }
        else
        {
            return left < right;
        }
    }
}; // struct total_less<void>


//==============================================================================
// Comparator traits
//==============================================================================

/// Is this a "simple" comparator where operator== can be used instead of
/// the two-comparison equivalence test?  User specializations are intended.
template <typename T> constexpr bool is_simple_comparator{ false };
template <typename T> constexpr bool is_simple_comparator<std::less   <T>>{ std::is_integral_v<T> };
template <typename T> constexpr bool is_simple_comparator<std::greater<T>>{ std::is_integral_v<T> };
// total_less on integral keys can never observe an unordered pair
template <typename T> constexpr bool is_simple_comparator<total_less  <T>>{ std::is_integral_v<T> };


//==============================================================================
// comp_eq: optimised equality from a strict-weak comparator (free function)
//==============================================================================

/// Three-tier dispatch:
///   1. Custom comp.eq() if available
///   2. Direct == for simple comparators
///   3. Standard two-comparison equivalence (!comp(a,b) && !comp(b,a))
template <typename Comp>
constexpr bool comp_eq( Comp const & comp, auto const & left, auto const & right )
{
    if constexpr ( requires{ comp.eq( left, right ); } )
        return comp.eq( left, right );
    else if constexpr ( is_simple_comparator<Comp> && requires{ left == right; } )
        return left == right;
    else
        return !comp( left, right ) && !comp( right, left );
}


//==============================================================================
// Komparator: comparator wrapper (EBO via public inheritance)
//==============================================================================

/// Aggregate wrapper: Komparator<C>{ c } or Komparator<C>{}.
///
/// Provides the derived comparison operations the sorted containers use
/// (le, eq, geq) and an indirect pdqsort.
/// Unlike for plain std::less, none of these are noexcept: total_less (and
/// user comparators) are allowed to report unordered keys by throwing.
template <typename Comparator>
struct Komparator : Comparator
{
    /// True if Comparator supports heterogeneous lookup (has is_transparent tag)
    static constexpr bool transparent_comparator{ requires{ typename Comparator::is_transparent; } };

    [[ nodiscard ]] constexpr Comparator const & comp() const noexcept { return *this; }
    [[ nodiscard ]] constexpr Comparator       & comp()       noexcept { return *this; }

    constexpr bool le ( auto const & left, auto const & right ) const { return comp()( left, right ); }
    constexpr bool eq ( auto const & left, auto const & right ) const { return comp_eq( comp(), left, right ); }
    constexpr bool geq( auto const & left, auto const & right ) const { return !comp()( left, right ); }

    /// pdqsort with an explicit predicate built on top of comp() (used for
    /// indirect sorts over positions).
    template <std::random_access_iterator It, typename Pred>
    static void sort_by( It const first, It const last, Pred const & pred )
    {
        boost::sort::pdqsort( first, last, std::cref( pred ) );
    }
}; // struct Komparator

//------------------------------------------------------------------------------
} // namespace psi::collections
//------------------------------------------------------------------------------
