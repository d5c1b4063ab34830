////////////////////////////////////////////////////////////////////////////////
/// psi::collections insertion ordered unique-element container
///
/// ordered_set<Key, Hash, KeyEqual> is simultaneously
///   - a sequence: positional access, slices, forward/reverse iteration, in
///     place reverse() and sort();
///   - a set: membership, add/discard/remove, full set algebra with results
///     of the same type, set-wise (position independent) comparisons.
///
/// Architecture:
///   items_: std::vector<Key> holding the elements in their logical order
///   index_: std::unordered_map<Key, size_type> mapping each element to its
///            position in items_
///   Both always describe the same sequence; every mutator either updates
///   the two in lockstep or rebuilds index_ from items_.
///
/// Result ordering of the set algebra: left operand order first, then the
/// elements newly introduced by the right operand(s) in their order.
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

#include "deep_copy.hpp"
#include "errors.hpp"
#include "slice.hpp"

#include <boost/assert.hpp>
#include <boost/sort/flat_stable_sort/flat_stable_sort.hpp>

#include <algorithm>
#include <compare>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <numeric>
#include <optional>
#include <ranges>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::collections
{

template <typename T> class ordered_weak_set;
//------------------------------------------------------------------------------

/// Any (set-like or sequence-like) range whose elements convert to T.
template <typename R, typename T>
concept compatible_range =
    std::ranges::input_range<R> &&
    std::convertible_to<std::ranges::range_reference_t<R>, T>;


template
<
    typename Key,
    typename Hash     = std::hash<Key>,
    typename KeyEqual = std::equal_to<Key>
>
class ordered_set
{
public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using key_type               = Key;
    using value_type             = Key;
    using hasher                 = Hash;
    using key_equal              = KeyEqual;
    using container_type         = std::vector<Key>;
    using size_type              = std::size_t;
    using difference_type        = std::ptrdiff_t;
    using reference              = Key const &;
    using const_reference        = Key const &;

    // elements are immutable in place: changing one would desync index_
    using iterator               = typename container_type::const_iterator;
    using const_iterator         = iterator;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = reverse_iterator;

    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------
    ordered_set() = default;

    explicit ordered_set( Hash const & hash, KeyEqual const & equal = KeyEqual{} )
        : index_( 0, hash, equal ) {}

    template <std::input_iterator InputIt>
    ordered_set( InputIt first, InputIt const last )
    {
        for ( ; first != last; ++first )
            add( *first );
    }

    template <compatible_range<Key> R>
    requires( !std::same_as<std::remove_cvref_t<R>, ordered_set> )
    explicit ordered_set( R && rg ) { update_one( rg ); }

    ordered_set( std::initializer_list<value_type> const il ) : ordered_set( il.begin(), il.end() ) {}

    ordered_set( ordered_set const & ) = default;
    ordered_set( ordered_set && )      = default;

    ordered_set & operator=( ordered_set const & ) = default;
    ordered_set & operator=( ordered_set && )      = default;

    ordered_set & operator=( std::initializer_list<value_type> const il )
    {
        clear();
        update( il );
        return *this;
    }

    [[ nodiscard ]] ordered_set copy() const { return *this; }

    [[ nodiscard ]] ordered_set deep_copy() const
    {
        ordered_set result{ hash_function(), key_eq() };
        result.items_.reserve( size() );
        for ( auto const & item : items_ )
            result.add( psi::collections::deep_copy<Key>( item ) );
        return result;
    }

    //--------------------------------------------------------------------------
    // Iterators
    //--------------------------------------------------------------------------
    iterator begin () const noexcept { return items_.cbegin(); }
    iterator end   () const noexcept { return items_.cend  (); }
    iterator cbegin() const noexcept { return begin(); }
    iterator cend  () const noexcept { return end  (); }

    reverse_iterator rbegin () const noexcept { return reverse_iterator{ end  () }; }
    reverse_iterator rend   () const noexcept { return reverse_iterator{ begin() }; }
    reverse_iterator crbegin() const noexcept { return rbegin(); }
    reverse_iterator crend  () const noexcept { return rend  (); }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard ]] bool      empty   () const noexcept { return items_.empty(); }
    [[ nodiscard ]] size_type size    () const noexcept { return items_.size (); }
    [[ nodiscard ]] size_type max_size() const noexcept { return std::min( items_.max_size(), index_.max_size() ); }

    void reserve( size_type const n )
    {
        items_.reserve( n );
        index_.reserve( n );
    }

    //--------------------------------------------------------------------------
    // Positional access
    //--------------------------------------------------------------------------
    const_reference operator[]( size_type const pos ) const noexcept
    {
        BOOST_ASSERT_MSG( pos < size(), "ordered_set index out of range" );
        return items_[ pos ];
    }

    // Negative positions count from the back.
    const_reference at( difference_type const pos ) const
    {
        auto const idx{ detail::normalize_index( pos, size() ) };
        if ( !idx )
            detail::throw_index_error( "psi::collections::ordered_set::at: index out of range" );
        return items_[ *idx ];
    }

    const_reference front() const noexcept { BOOST_ASSERT( !empty() ); return items_.front(); }
    const_reference back () const noexcept { BOOST_ASSERT( !empty() ); return items_.back (); }

    [[ nodiscard ]] ordered_set slice( collections::slice const & range ) const
    {
        auto const r{ range.indices( size() ) };
        ordered_set result{ hash_function(), key_eq() };
        result.reserve( r.length );
        for ( std::size_t i{ 0 }; i < r.length; ++i )
            result.append_unique( items_[ static_cast<size_type>( r.start + static_cast<difference_type>( i ) * r.step ) ] );
        return result;
    }

    [[ nodiscard ]] ordered_set slice( std::optional<difference_type> const start, std::optional<difference_type> const stop, difference_type const step = 1 ) const
    {
        return slice( collections::slice{ start, stop, step } );
    }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    [[ nodiscard ]] bool      contains( key_type const & value ) const { return index_.contains( value ); }
    [[ nodiscard ]] size_type count   ( key_type const & value ) const { return contains( value ) ? 1 : 0; }

    [[ nodiscard ]] iterator find( key_type const & value ) const
    {
        auto const it{ index_.find( value ) };
        return it != index_.end() ? begin() + static_cast<difference_type>( it->second ) : end();
    }

    // Position of value, optionally restricted to [start, stop) (bounds
    // interpreted as a slice). Throws key_error if absent from that range.
    [[ nodiscard ]] size_type index( key_type const & value, std::optional<difference_type> const start = {}, std::optional<difference_type> const stop = {} ) const
    {
        auto const it{ index_.find( value ) };
        if ( it == index_.end() )
            detail::throw_key_error( "psi::collections::ordered_set::index: value not in set" );
        auto const pos{ it->second };
        if ( start || stop )
        {
            auto const window{ collections::slice{ start, stop }.indices( size() ) };
            auto const spos  { static_cast<difference_type>( pos ) };
            if ( spos < window.start || spos >= window.stop )
                detail::throw_key_error( "psi::collections::ordered_set::index: value not in range" );
        }
        return pos;
    }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    // Appends value unless already present (existing elements never move).
    bool add( value_type value )
    {
        auto const [slot, inserted]{ index_.try_emplace( value, items_.size() ) };
        if ( !inserted )
            return false;
        try {
            items_.push_back( std::move( value ) );
        } catch ( ... ) {
            index_.erase( slot );
            throw;
        }
        return true;
    }

    template <compatible_range<Key>... R>
    void update( R &&... ranges ) { ( update_one( ranges ), ... ); }

    void update( std::initializer_list<value_type> const il ) { update_one( il ); }

    bool discard( key_type const & value )
    {
        auto const it{ index_.find( value ) };
        if ( it == index_.end() )
            return false;
        erase_position( it->second );
        return true;
    }

    void remove( key_type const & value )
    {
        if ( !discard( value ) )
            detail::throw_ordered_set_index_error( "psi::collections::ordered_set::remove: value not in set" );
    }

    // Removes and returns the element at pos (default: the last one).
    value_type pop( difference_type const pos = -1 )
    {
        if ( empty() )
            detail::throw_ordered_set_index_error( "psi::collections::ordered_set::pop: pop from an empty set" );
        auto const idx{ checked_position( pos ) };
        index_.erase( items_[ idx ] );
        value_type value( std::move( items_[ idx ] ) );
        items_.erase( items_.begin() + static_cast<difference_type>( idx ) );
        reindex_from( idx );
        return value;
    }

    void erase_at( difference_type const pos )
    {
        if ( empty() )
            detail::throw_ordered_set_index_error( "psi::collections::ordered_set::erase_at: empty set" );
        erase_position( checked_position( pos ) );
    }

    iterator erase( const_iterator const pos )
    {
        auto const idx{ static_cast<size_type>( pos - begin() ) };
        erase_position( idx );
        return begin() + static_cast<difference_type>( idx );
    }

    void clear() noexcept
    {
        items_.clear();
        index_.clear();
    }

    void reverse()
    {
        std::ranges::reverse( items_ );
        reindex_from( 0 );
    }

    // Stable in place sort by a key projection (default: the elements
    // themselves). descending keeps equal keys in their current relative
    // order, like an ascending sort does. A throwing comparison leaves the
    // set unchanged.
    template <typename Proj = std::identity, typename Comp = std::ranges::less>
    void sort( Proj key = {}, bool const descending = false, Comp comp = {} )
    {
        std::vector<size_type> order( size() );
        std::iota( order.begin(), order.end(), size_type{ 0 } );
        boost::sort::flat_stable_sort
        (
            order.begin(), order.end(),
            [&]( size_type const left, size_type const right ) -> bool
            {
                auto const & l{ items_[ left  ] };
                auto const & r{ items_[ right ] };
                return descending
                    ? std::invoke( comp, std::invoke( key, r ), std::invoke( key, l ) )
                    : std::invoke( comp, std::invoke( key, l ), std::invoke( key, r ) );
            }
        );
        container_type sorted;
        sorted.reserve( size() );
        for ( auto const idx : order )
            sorted.push_back( std::move( items_[ idx ] ) );
        items_ = std::move( sorted );
        reindex_from( 0 );
    }

    void swap( ordered_set & other ) noexcept
    {
        using std::swap;
        swap( items_, other.items_ );
        swap( index_, other.index_ );
    }
    friend void swap( ordered_set & a, ordered_set & b ) noexcept { a.swap( b ); }

    template <typename Pred>
    friend size_type erase_if( ordered_set & c, Pred pred )
    {
        auto const old_size{ c.size() };
        c.retain( [&pred]( key_type const & item ) { return !static_cast<bool>( pred( item ) ); } );
        return old_size - c.size();
    }

    //--------------------------------------------------------------------------
    // Set algebra
    //--------------------------------------------------------------------------
    template <compatible_range<Key>... R>
    [[ nodiscard ]] ordered_set set_union( R &&... others ) const
    {
        ordered_set result{ *this };
        ( result.update_one( others ), ... );
        return result;
    }

    // Elements of *this present in every one of others (order of *this).
    template <compatible_range<Key>... R>
    [[ nodiscard ]] ordered_set intersection( R &&... others ) const
    {
        if constexpr ( sizeof...( R ) == 0 )
            return *this;
        else
        {
            auto const tests{ std::make_tuple( membership( others )... ) };
            return filtered( [&tests]( key_type const & item ) {
                return std::apply( [&item]( auto const &... test ) { return ( test( item ) && ... ); }, tests );
            } );
        }
    }

    // Elements of *this present in none of others (order of *this).
    template <compatible_range<Key>... R>
    [[ nodiscard ]] ordered_set difference( R &&... others ) const
    {
        if constexpr ( sizeof...( R ) == 0 )
            return *this;
        else
        {
            auto const tests{ std::make_tuple( membership( others )... ) };
            return filtered( [&tests]( key_type const & item ) {
                return !std::apply( [&item]( auto const &... test ) { return ( test( item ) || ... ); }, tests );
            } );
        }
    }

    // Elements in exactly one of *this and other: those of *this first, then
    // those of other, each in their own order.
    template <compatible_range<Key> R>
    [[ nodiscard ]] ordered_set symmetric_difference( R && other ) const
    {
        if constexpr ( std::same_as<std::remove_cvref_t<R>, ordered_set> )
            return symmetric_difference_with( other );
        else
            return symmetric_difference_with( ordered_set( other ) );
    }

    template <compatible_range<Key>... R>
    void intersection_update( R &&... others )
    {
        if constexpr ( sizeof...( R ) != 0 )
            *this = intersection( others... );
    }

    template <compatible_range<Key>... R>
    void difference_update( R &&... others )
    {
        if constexpr ( sizeof...( R ) != 0 )
        {
            auto const tests{ std::make_tuple( membership( others )... ) };
            retain( [&tests]( key_type const & item ) {
                return !std::apply( [&item]( auto const &... test ) { return ( test( item ) || ... ); }, tests );
            } );
        }
    }

    template <compatible_range<Key> R>
    void symmetric_difference_update( R && other ) { *this = symmetric_difference( other ); }

    //--------------------------------------------------------------------------
    // Set relations (membership based, position independent)
    //--------------------------------------------------------------------------
    template <compatible_range<Key> R>
    [[ nodiscard ]] bool is_subset_of( R && other ) const
    {
        if constexpr ( std::ranges::sized_range<R> )
        {
            if ( size() > static_cast<size_type>( std::ranges::size( other ) ) )
                return false;
        }
        auto const in_other{ membership( other ) };
        return std::ranges::all_of( items_, in_other );
    }

    template <compatible_range<Key> R>
    [[ nodiscard ]] bool is_superset_of( R && other ) const
    {
        for ( auto && item : other )
        {
            if ( !contains( item ) )
                return false;
        }
        return true;
    }

    template <compatible_range<Key> R>
    [[ nodiscard ]] bool is_disjoint( R && other ) const
    {
        for ( auto && item : other )
        {
            if ( contains( item ) )
                return false;
        }
        return true;
    }

    // Set equality against any range (duplicates in other are irrelevant).
    template <compatible_range<Key> R>
    [[ nodiscard ]] bool equals( R && other ) const
    {
        if constexpr ( std::same_as<std::remove_cvref_t<R>, ordered_set> )
            return *this == other;
        else
            return *this == ordered_set( other );
    }

    // Positional comparison: same elements in the same order.
    template <compatible_range<Key> R>
    [[ nodiscard ]] bool sequence_equal( R && other ) const
    {
        return std::ranges::equal( items_, other, key_eq() );
    }

    friend bool operator==( ordered_set const & a, ordered_set const & b )
    {
        return a.size() == b.size() && std::ranges::all_of( a.items_, [&b]( key_type const & item ) { return b.contains( item ); } );
    }

    // equivalent: same members; less/greater: proper subset/superset;
    // unordered: neither contains the other.
    friend std::partial_ordering operator<=>( ordered_set const & a, ordered_set const & b )
    {
        bool const a_in_b{ a.is_subset_of( b ) };
        bool const b_in_a{ b.is_subset_of( a ) };
        if ( a_in_b && b_in_a ) return std::partial_ordering::equivalent;
        if ( a_in_b           ) return std::partial_ordering::less;
        if ( b_in_a           ) return std::partial_ordering::greater;
        return std::partial_ordering::unordered;
    }

    //--------------------------------------------------------------------------
    // Operator forms of the set algebra
    //--------------------------------------------------------------------------
    template <compatible_range<Key> R> friend ordered_set operator|( ordered_set const & left, R && right ) { return left.set_union           ( right ); }
    template <compatible_range<Key> R> friend ordered_set operator&( ordered_set const & left, R && right ) { return left.intersection        ( right ); }
    template <compatible_range<Key> R> friend ordered_set operator-( ordered_set const & left, R && right ) { return left.difference          ( right ); }
    template <compatible_range<Key> R> friend ordered_set operator^( ordered_set const & left, R && right ) { return left.symmetric_difference( right ); }

    // Plain range on the left: the result follows the left operand's order.
    template <compatible_range<Key> R> requires( !std::same_as<std::remove_cvref_t<R>, ordered_set> )
    friend ordered_set operator|( R && left, ordered_set const & right ) { return ordered_set( left ).set_union( right ); }
    template <compatible_range<Key> R> requires( !std::same_as<std::remove_cvref_t<R>, ordered_set> )
    friend ordered_set operator&( R && left, ordered_set const & right ) { return ordered_set( left ).intersection( right ); }
    template <compatible_range<Key> R> requires( !std::same_as<std::remove_cvref_t<R>, ordered_set> )
    friend ordered_set operator-( R && left, ordered_set const & right ) { return ordered_set( left ).difference( right ); }
    template <compatible_range<Key> R> requires( !std::same_as<std::remove_cvref_t<R>, ordered_set> )
    friend ordered_set operator^( R && left, ordered_set const & right ) { return ordered_set( left ).symmetric_difference( right ); }

    template <compatible_range<Key> R> ordered_set & operator|=( R && other ) { update_one( other );                  return *this; }
    template <compatible_range<Key> R> ordered_set & operator&=( R && other ) { intersection_update( other );         return *this; }
    template <compatible_range<Key> R> ordered_set & operator-=( R && other ) { difference_update( other );           return *this; }
    template <compatible_range<Key> R> ordered_set & operator^=( R && other ) { symmetric_difference_update( other ); return *this; }

    //--------------------------------------------------------------------------
    // Observers
    //--------------------------------------------------------------------------
    [[ nodiscard ]] hasher    hash_function() const { return index_.hash_function(); }
    [[ nodiscard ]] key_equal key_eq       () const { return index_.key_eq();        }

    [[ nodiscard ]] container_type const & sequence() const noexcept { return items_; }

private:
    template <typename T> friend class ordered_weak_set;

    template <typename R>
    void update_one( R & rg )
    {
        if constexpr ( std::ranges::sized_range<R> )
            reserve( size() + static_cast<size_type>( std::ranges::size( rg ) ) );
        for ( auto && item : rg )
            add( std::forward<decltype( item )>( item ) );
    }

    // Membership predicate over an arbitrary range: set-like ranges are
    // queried directly, anything else is indexed once.
    template <typename R>
    auto membership( R & other ) const
    {
        if constexpr ( requires( key_type const & v ) { { other.contains( v ) } -> std::convertible_to<bool>; } )
            return [&other]( key_type const & item ) -> bool { return other.contains( item ); };
        else
            return [lookup = ordered_set( other )]( key_type const & item ) -> bool { return lookup.contains( item ); };
    }

    template <typename Pred>
    ordered_set filtered( Pred const & keep ) const
    {
        ordered_set result{ hash_function(), key_eq() };
        for ( auto const & item : items_ )
        {
            if ( keep( item ) )
                result.append_unique( item );
        }
        return result;
    }

    // Keeps the elements satisfying keep, preserving their order. keep is
    // evaluated for every element before anything is moved.
    template <typename Pred>
    void retain( Pred const & keep )
    {
        std::vector<bool> kept( size() );
        for ( size_type i{ 0 }; i < size(); ++i )
            kept[ i ] = keep( items_[ i ] );

        container_type survivors;
        survivors.reserve( static_cast<size_type>( std::count( kept.begin(), kept.end(), true ) ) );
        for ( size_type i{ 0 }; i < size(); ++i )
        {
            if ( kept[ i ] )
                survivors.push_back( std::move( items_[ i ] ) );
        }
        items_ = std::move( survivors );
        rebuild_index();
    }

    ordered_set symmetric_difference_with( ordered_set const & other ) const
    {
        ordered_set result{ filtered( [&other]( key_type const & item ) { return !other.contains( item ); } ) };
        for ( auto const & item : other.items_ )
        {
            if ( !contains( item ) )
                result.append_unique( item );
        }
        return result;
    }

    // Caller guarantees value is not yet present.
    void append_unique( key_type const & value )
    {
        BOOST_ASSERT( !contains( value ) );
        add( value );
    }

    size_type checked_position( difference_type const pos ) const
    {
        auto const idx{ detail::normalize_index( pos, size() ) };
        if ( !idx )
            detail::throw_ordered_set_index_error( "psi::collections::ordered_set: index out of range" );
        return *idx;
    }

    void erase_position( size_type const pos )
    {
        BOOST_ASSERT( pos < size() );
        index_.erase( items_[ pos ] );
        items_.erase( items_.begin() + static_cast<difference_type>( pos ) );
        reindex_from( pos );
    }

    // Rewrites the positions of items_[ first.. ] after a shift.
    void reindex_from( size_type const first )
    {
        for ( auto pos{ first }; pos < items_.size(); ++pos )
        {
            auto const slot{ index_.find( items_[ pos ] ) };
            BOOST_ASSERT( slot != index_.end() );
            slot->second = pos;
        }
        BOOST_ASSERT( index_.size() == items_.size() );
    }

    void rebuild_index()
    {
        index_.clear();
        index_.reserve( items_.size() );
        for ( size_type pos{ 0 }; pos < items_.size(); ++pos )
            index_.emplace( items_[ pos ], pos );
        BOOST_ASSERT_MSG( index_.size() == items_.size(), "ordered_set elements must be unique" );
    }

    container_type                                      items_;
    std::unordered_map<Key, size_type, Hash, KeyEqual> index_;
}; // class ordered_set


//------------------------------------------------------------------------------
// Deduction guides
//------------------------------------------------------------------------------

template <std::input_iterator InputIt>
ordered_set( InputIt, InputIt )
    -> ordered_set<std::remove_const_t<typename std::iterator_traits<InputIt>::value_type>>;

template <typename Key>
ordered_set( std::initializer_list<Key> )
    -> ordered_set<Key>;

template <std::ranges::input_range R>
ordered_set( R && )
    -> ordered_set<std::ranges::range_value_t<R>>;

//------------------------------------------------------------------------------
} // namespace psi::collections
//------------------------------------------------------------------------------
