////////////////////////////////////////////////////////////////////////////////
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
#include <psi/collections/errors.hpp>
//------------------------------------------------------------------------------
namespace psi::collections
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_key_error              ( char const * const what ) { throw key_error              ( what ); }
    [[ noreturn, gnu::cold ]] void throw_index_error            ( char const * const what ) { throw index_error            ( what ); }
    [[ noreturn, gnu::cold ]] void throw_ordered_set_index_error( char const * const what ) { throw ordered_set_index_error( what ); }
    [[ noreturn, gnu::cold ]] void throw_ordering_error         ( char const * const what ) { throw ordering_error         ( what ); }
    [[ noreturn, gnu::cold ]] void throw_invalid_argument       ( char const * const what ) { throw std::invalid_argument  ( what ); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::collections
//------------------------------------------------------------------------------
