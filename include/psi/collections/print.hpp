////////////////////////////////////////////////////////////////////////////////
/// Debug rendering of the psi::collections containers to std::ostreams
/// (used for dumps and for readable GoogleTest failure messages):
///   ordered_set([1, 2, 3])
///   sorted_dict({1: a, 3: c})
///   chain_map_proxy({a: 1}, {b: 2})
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

#include "chain_map_proxy.hpp"
#include "ordered_set.hpp"
#include "ordered_weak_set.hpp"
#include "sorted_dict.hpp"
#include "weak_default_dict.hpp"

#include <functional>
#include <memory>
#include <ostream>
//------------------------------------------------------------------------------
namespace psi::collections
{
//------------------------------------------------------------------------------

namespace detail
{
    template <typename T>
    void print_value( std::ostream & os, T const & value )
    {
        if constexpr ( requires { value.get(); *value; value.use_count(); } )
        {
            // shared pointers: the pointee if it is printable, else its address
            if ( !value )
                os << "null";
            else if constexpr ( requires { os << *value; } )
                os << *value;
            else
                os << static_cast<void const *>( value.get() );
        }
        else if constexpr ( requires { os << value; } )
            os << value;
        else
            os << "<?>";
    }

    template <typename Range>
    void print_sequence( std::ostream & os, Range const & items )
    {
        os << '[';
        bool first{ true };
        for ( auto const & item : items )
        {
            if ( !first )
                os << ", ";
            print_value( os, item );
            first = false;
        }
        os << ']';
    }

    class entry_printer
    {
    public:
        explicit entry_printer( std::ostream & os ) noexcept : os_{ os } {}

        template <typename K, typename V>
        void operator()( K const & key, V const & value )
        {
            if ( !first_ )
                os_ << ", ";
            print_value( os_, key );
            os_ << ": ";
            print_value( os_, value );
            first_ = false;
        }

    private:
        std::ostream & os_;
        bool           first_{ true };
    }; // class entry_printer
} // namespace detail


template <typename T, typename H, typename E>
std::ostream & operator<<( std::ostream & os, ordered_set<T, H, E> const & set )
{
    os << "ordered_set(";
    detail::print_sequence( os, set );
    return os << ')';
}

template <typename T>
std::ostream & operator<<( std::ostream & os, ordered_weak_set<T> const & set )
{
    os << "ordered_weak_set(";
    detail::print_sequence( os, set );
    return os << ')';
}

template <typename K, typename V, typename C, typename KC, typename MC>
std::ostream & operator<<( std::ostream & os, sorted_dict<K, V, C, KC, MC> const & dict )
{
    os << "sorted_dict({";
    detail::entry_printer print{ os };
    for ( auto const & [key, value] : dict )
        print( key, value );
    return os << "})";
}

template <typename K, typename V, typename H, typename E>
std::ostream & operator<<( std::ostream & os, chain_map_proxy<K, V, H, E> const & proxy )
{
    os << "chain_map_proxy(";
    bool first{ true };
    for ( auto const & layer : proxy.maps() )
    {
        if ( !first )
            os << ", ";
        os << '{';
        detail::entry_printer print{ os };
        layer->for_each( std::ref( print ) );
        os << '}';
        first = false;
    }
    return os << ')';
}

template <typename K, typename V>
std::ostream & operator<<( std::ostream & os, weak_key_default_dictionary<K, V> const & dict )
{
    os << "weak_key_default_dictionary({";
    detail::entry_printer print{ os };
    dict.for_each( std::ref( print ) );
    return os << "})";
}

template <typename K, typename V, typename H, typename E>
std::ostream & operator<<( std::ostream & os, weak_value_default_dictionary<K, V, H, E> const & dict )
{
    os << "weak_value_default_dictionary({";
    detail::entry_printer print{ os };
    dict.for_each( std::ref( print ) );
    return os << "})";
}

//------------------------------------------------------------------------------
} // namespace psi::collections
//------------------------------------------------------------------------------
