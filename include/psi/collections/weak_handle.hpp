////////////////////////////////////////////////////////////////////////////////
/// Hashable weak reference with identity semantics, shared by the weak
/// containers.
///
/// Two handles are equal iff they were made from pointers to the same object
/// under the same owner (control block). The hash is computed from the
/// address captured at construction so it stays stable after the referent
/// is gone, and the retained control block keeps a recycled address from
/// aliasing a reclaimed entry.
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

#include <cstddef>
#include <functional>
#include <memory>
//------------------------------------------------------------------------------
namespace psi::collections
{
//------------------------------------------------------------------------------

template <typename T>
class weak_handle
{
public:
    weak_handle() noexcept = default;

    explicit weak_handle( std::shared_ptr<T> const & strong )
        : ref_{ strong }, address_{ strong.get() }
    {
        if ( !strong )
            detail::throw_invalid_argument( "psi::collections::weak_handle: null reference" );
    }

    [[ nodiscard ]] bool               expired() const noexcept { return ref_.expired(); }
    [[ nodiscard ]] std::shared_ptr<T> lock   () const noexcept { return ref_.lock   (); }

    [[ nodiscard ]] T const * address() const noexcept { return address_; }

    [[ nodiscard ]] bool same_owner( weak_handle const & other ) const noexcept
    {
        return !ref_.owner_before( other.ref_ ) && !other.ref_.owner_before( ref_ );
    }

    friend bool operator==( weak_handle const & a, weak_handle const & b ) noexcept
    {
        return a.address_ == b.address_ && a.same_owner( b );
    }

    struct hash
    {
        std::size_t operator()( weak_handle const & handle ) const noexcept { return std::hash<T const *>{}( handle.address_ ); }
    }; // struct hash

private:
    std::weak_ptr<T> ref_;
    T const *        address_{ nullptr };
}; // class weak_handle

//------------------------------------------------------------------------------
} // namespace psi::collections
//------------------------------------------------------------------------------
