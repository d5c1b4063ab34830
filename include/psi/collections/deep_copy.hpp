////////////////////////////////////////////////////////////////////////////////
/// deep_copy: recursive cloning customization point.
///
///   1. x.deep_copy() member, if present (the containers of this library)
///   2. std::shared_ptr / std::unique_ptr: a new object cloned from the
///      (recursively deep-copied) pointee; null stays null
///   3. std::pair: element-wise
///   4. containers constructible from an iterator pair of their value_type:
///      rebuilt from deep-copied elements
///   5. anything else: copy construction
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

#include <memory>
#include <ranges>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::collections
{
//------------------------------------------------------------------------------

template <typename T> struct is_shared_ptr                     : std::false_type {};
template <typename T> struct is_shared_ptr<std::shared_ptr<T>> : std::true_type  {};
template <typename T> struct is_unique_ptr                                 : std::false_type {};
template <typename T, typename D> struct is_unique_ptr<std::unique_ptr<T, D>> : std::true_type  {};
template <typename T> struct is_pair                           : std::false_type {};
template <typename A, typename B> struct is_pair<std::pair<A, B>> : std::true_type {};

template <typename T> struct is_basic_string : std::false_type {};
template <typename C, typename Tr, typename A> struct is_basic_string<std::basic_string<C, Tr, A>> : std::true_type {};

template <typename T>
[[ nodiscard ]] T deep_copy( T const & source )
{
    if constexpr ( requires { { source.deep_copy() } -> std::convertible_to<T>; } )
    {
        return source.deep_copy();
    }
    else if constexpr ( is_shared_ptr<T>::value )
    {
        using pointee = typename T::element_type;
        if ( !source )
            return nullptr;
        return std::make_shared<std::remove_cv_t<pointee>>( deep_copy<std::remove_cv_t<pointee>>( *source ) );
    }
    else if constexpr ( is_unique_ptr<T>::value )
    {
        using pointee = typename T::element_type;
        if ( !source )
            return nullptr;
        return T{ new pointee( deep_copy<std::remove_cv_t<pointee>>( *source ) ) };
    }
    else if constexpr ( is_pair<T>::value )
    {
        using first_type  = std::remove_const_t<typename T::first_type >;
        using second_type = std::remove_const_t<typename T::second_type>;
        return T{ deep_copy<first_type>( source.first ), deep_copy<second_type>( source.second ) };
    }
    else if constexpr
    (
        !is_basic_string<T>::value &&
        std::ranges::input_range<T const> &&
        requires
        {
            typename T::value_type;
            requires std::is_constructible_v<T, typename std::vector<typename T::value_type>::iterator, typename std::vector<typename T::value_type>::iterator>;
        }
    )
    {
        using element = std::remove_const_t<typename T::value_type>;
        std::vector<element> elements;
        for ( auto const & item : source )
            elements.push_back( deep_copy<element>( item ) );
        return T( std::make_move_iterator( elements.begin() ), std::make_move_iterator( elements.end() ) );
    }
    else
    {
        return source;
    }
}

//------------------------------------------------------------------------------
} // namespace psi::collections
//------------------------------------------------------------------------------
