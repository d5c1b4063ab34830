////////////////////////////////////////////////////////////////////////////////
/// Exception types thrown by psi::collections containers.
///
/// Hierarchy:
///   std::out_of_range
///     lookup_error
///       key_error    (virtual base): element or key not present
///       index_error  (virtual base): position outside the sequence
///         ordered_set_index_error  : both at once (pop/remove/erase_at)
///   std::invalid_argument
///     ordering_error               : keys without a mutual order
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

#include <stdexcept>
//------------------------------------------------------------------------------
namespace psi::collections
{
//------------------------------------------------------------------------------

class lookup_error : public std::out_of_range
{
public:
    explicit lookup_error( char const * const what ) : std::out_of_range( what ) {}
}; // class lookup_error

class key_error : public virtual lookup_error
{
public:
    explicit key_error( char const * const what ) : lookup_error( what ) {}
}; // class key_error

class index_error : public virtual lookup_error
{
public:
    explicit index_error( char const * const what ) : lookup_error( what ) {}
}; // class index_error

// A single failure that is legitimately both a missing element and a bad
// position: the ordered_set is a set and a sequence at the same time.
class ordered_set_index_error final : public key_error, public index_error
{
public:
    explicit ordered_set_index_error( char const * const what )
        : lookup_error( what ), key_error( what ), index_error( what ) {}
}; // class ordered_set_index_error

class ordering_error : public std::invalid_argument
{
public:
    explicit ordering_error( char const * const what ) : std::invalid_argument( what ) {}
}; // class ordering_error


namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_key_error              ( char const * what = "psi::collections: key not found"      );
    [[ noreturn, gnu::cold ]] void throw_index_error            ( char const * what = "psi::collections: index out of range" );
    [[ noreturn, gnu::cold ]] void throw_ordered_set_index_error( char const * what                                          );
    [[ noreturn, gnu::cold ]] void throw_ordering_error         ( char const * what = "psi::collections: unordered keys"     );
    [[ noreturn, gnu::cold ]] void throw_invalid_argument       ( char const * what                                          );
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::collections
//------------------------------------------------------------------------------
