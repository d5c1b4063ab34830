////////////////////////////////////////////////////////////////////////////////
/// psi::collections insertion ordered set of weakly referenced objects
///
/// ordered_weak_set<T> has the ordering contract of ordered_set but never
/// keeps its elements alive: it stores weak_handle<T>s and hands out
/// std::shared_ptr<T>s. Entries whose object has been reclaimed are invisible
/// to every observer (size, positions, lookup, iteration) as soon as the
/// object dies. They are physically dropped, without reordering the
/// survivors, by the next modifier or by prune().
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
#include "ordered_set.hpp"
#include "slice.hpp"
#include "weak_handle.hpp"

#include <boost/assert.hpp>

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
//------------------------------------------------------------------------------
namespace psi::collections
{
//------------------------------------------------------------------------------

template <typename T>
class ordered_weak_set
{
public:
    using element_type    = T;
    using value_type      = std::shared_ptr<T>;
    using handle_type     = weak_handle<T>;
    using storage_type    = ordered_set<handle_type, typename handle_type::hash>;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;

private:
    //--------------------------------------------------------------------------
    // Iterators: yield strong references by value, skip expired entries.
    // A reverse iterator holds the position one past its current entry so
    // that 'before the first entry' is representable.
    //--------------------------------------------------------------------------
    template <bool Reverse>
    class iterator_impl
    {
    public:
        using iterator_concept  = std::forward_iterator_tag;
        using iterator_category = std::input_iterator_tag;
        using value_type        = std::shared_ptr<T>;
        using difference_type   = std::ptrdiff_t;
        using reference         = std::shared_ptr<T>;
        using pointer           = void;

        iterator_impl() noexcept = default;

        reference operator*() const
        {
            BOOST_ASSERT( !at_end() );
            return items()[ current() ].lock();
        }

        iterator_impl & operator++(     ) { step(); skip_expired(); return *this; }
        iterator_impl   operator++( int ) { auto tmp{ *this }; ++*this; return tmp; }

        friend bool operator==( iterator_impl const & a, iterator_impl const & b ) noexcept
        {
            bool const a_end{ a.at_end() };
            bool const b_end{ b.at_end() };
            return ( a_end || b_end ) ? ( a_end == b_end ) : ( a.pos_ == b.pos_ );
        }

    private:
        friend class ordered_weak_set;

        iterator_impl( storage_type const & storage, size_type const pos ) : storage_{ &storage }, pos_{ pos } { skip_expired(); }

        typename storage_type::container_type const & items() const noexcept { return storage_->sequence(); }

        size_type current() const noexcept { if constexpr ( Reverse ) return pos_ - 1; else return pos_; }

        bool at_end() const noexcept
        {
            if ( !storage_ )
                return true;
            if constexpr ( Reverse ) return pos_ == 0;
            else                     return pos_ >= items().size();
        }

        void step() noexcept
        {
            BOOST_ASSERT( !at_end() );
            if constexpr ( Reverse ) --pos_;
            else                     ++pos_;
        }

        void skip_expired() noexcept
        {
            while ( !at_end() && items()[ current() ].expired() )
                step();
        }

        storage_type const * storage_{ nullptr };
        size_type            pos_    { 0 };
    }; // class iterator_impl

public:
    using iterator               = iterator_impl<false>;
    using const_iterator         = iterator;
    using reverse_iterator       = iterator_impl<true>;
    using const_reverse_iterator = reverse_iterator;

    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------
    ordered_weak_set() = default;

    template <compatible_range<value_type> R>
    requires( !std::same_as<std::remove_cvref_t<R>, ordered_weak_set> )
    explicit ordered_weak_set( R && objects ) { update( std::forward<R>( objects ) ); }

    ordered_weak_set( std::initializer_list<value_type> const il ) { update( il ); }

    [[ nodiscard ]] ordered_weak_set copy() const
    {
        ordered_weak_set result;
        result.data_ = live_entries();
        return result;
    }

    //--------------------------------------------------------------------------
    // Iterators
    //--------------------------------------------------------------------------
    // Const members never compact the storage, so a running iterator stays
    // valid across any observer call; only the non-const modifiers and
    // prune() drop reclaimed entries.
    iterator begin() const noexcept { return { data_, 0             }; }
    iterator end  () const noexcept { return { data_, data_.size()  }; }

    reverse_iterator rbegin() const noexcept { return { data_, data_.size() }; }
    reverse_iterator rend  () const noexcept { return { data_, 0            }; }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard ]] size_type size () const noexcept { return static_cast<size_type>( std::ranges::count_if( data_.sequence(), is_live ) ); }
    [[ nodiscard ]] bool      empty() const noexcept { return std::ranges::none_of( data_.sequence(), is_live ); }

    //--------------------------------------------------------------------------
    // Positional access (positions count live entries only)
    //--------------------------------------------------------------------------
    value_type operator[]( size_type const pos ) const
    {
        auto const raw{ raw_position( pos ) };
        BOOST_ASSERT_MSG( raw < data_.size(), "ordered_weak_set index out of range" );
        return data_[ raw ].lock();
    }

    // Negative positions count from the back; throws index_error.
    value_type at( difference_type const pos ) const
    {
        auto const idx{ detail::normalize_index( pos, size() ) };
        if ( !idx )
            detail::throw_ordered_set_index_error( "psi::collections::ordered_weak_set::at: index out of range" );
        return data_[ raw_position( *idx ) ].lock();
    }

    [[ nodiscard ]] ordered_weak_set slice( collections::slice const & range ) const
    {
        ordered_weak_set result;
        result.data_ = live_entries().slice( range );
        return result;
    }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    // A live object can never share its identity with an expired entry, so
    // unpruned storage answers membership directly.
    [[ nodiscard ]] bool contains( value_type const & object ) const
    {
        return object && data_.contains( handle_type{ object } );
    }

    [[ nodiscard ]] size_type count( value_type const & object ) const { return contains( object ) ? 1 : 0; }

    // Position among the live entries; throws key_error if absent.
    [[ nodiscard ]] size_type index( value_type const & object ) const
    {
        if ( !object )
            detail::throw_key_error( "psi::collections::ordered_weak_set::index: null reference" );
        auto const raw{ data_.index( handle_type{ object } ) };
        auto const & items{ data_.sequence() };
        return static_cast<size_type>( std::count_if( items.begin(), items.begin() + static_cast<difference_type>( raw ), is_live ) );
    }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    // Appends a weak reference to object unless already present; null
    // references are rejected with std::invalid_argument.
    bool add( value_type const & object )
    {
        sweep();
        return data_.add( handle_type{ object } );
    }

    template <compatible_range<value_type> R>
    void update( R && objects )
    {
        sweep();
        for ( auto && object : objects )
            data_.add( handle_type{ object } );
    }

    void update( std::initializer_list<value_type> const il ) { update( std::ranges::subrange( il.begin(), il.end() ) ); }

    bool discard( value_type const & object )
    {
        if ( !object )
            return false;
        sweep();
        return data_.discard( handle_type{ object } );
    }

    void remove( value_type const & object )
    {
        if ( !discard( object ) )
            detail::throw_key_error( "psi::collections::ordered_weak_set::remove: object not in set" );
    }

    void erase_at( difference_type const pos )
    {
        sweep();
        data_.erase_at( pos );
    }

    value_type pop( difference_type const pos = -1 )
    {
        sweep();
        return data_.pop( pos ).lock();
    }

    void clear() noexcept { data_.clear(); }

    // Drops the entries of reclaimed objects, returns how many were dropped.
    size_type prune() { return sweep(); }

    //--------------------------------------------------------------------------
    // Comparison (set-wise, over the live entries)
    //--------------------------------------------------------------------------
    friend bool operator==( ordered_weak_set const & a, ordered_weak_set const & b )
    {
        return a.live_entries() == b.live_entries();
    }

private:
    static bool is_live( handle_type const & handle ) noexcept { return !handle.expired(); }

    // Storage position of the pos-th live entry (size() if there is none).
    size_type raw_position( size_type pos ) const noexcept
    {
        auto const & items{ data_.sequence() };
        for ( size_type raw{ 0 }; raw < items.size(); ++raw )
        {
            if ( is_live( items[ raw ] ) && pos-- == 0 )
                return raw;
        }
        return items.size();
    }

    storage_type live_entries() const
    {
        storage_type live;
        for ( auto const & handle : data_.sequence() )
        {
            if ( is_live( handle ) )
                live.append_unique( handle );
        }
        return live;
    }

    size_type sweep()
    {
        if ( std::ranges::all_of( data_.sequence(), is_live ) )
            return 0;
        return erase_if( data_, []( handle_type const & handle ) { return handle.expired(); } );
    }

    storage_type data_;
}; // class ordered_weak_set

//------------------------------------------------------------------------------
} // namespace psi::collections
//------------------------------------------------------------------------------
