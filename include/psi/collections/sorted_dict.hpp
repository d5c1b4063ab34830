////////////////////////////////////////////////////////////////////////////////
/// psi::collections comparator sorted dictionary
///
/// A mapping whose canonical iteration order is the ascending comparator
/// order of its keys. Lookups are binary searches, single-key insertion and
/// erasure shift the tails of the storage (no re-sort).
///
/// Architecture:
///   sorted_dict privately inherits detail::paired_storage<KC, MC>, a
///   comparator-agnostic base that keeps the key and value containers in
///   lockstep (insert, erase, replace, clear, reserve, ...).
///
/// Dictionary semantics on top of the sorted-associative interface:
///   - construction from unsorted input: later duplicates win
///   - at()/pop()/popitem() report misses with key_error
///   - update()/operator|= are all-or-nothing: a throwing comparison (see
///     total_less) leaves the target untouched
///   - keys()/values()/items(): live, sized, bidirectional views
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
#include "komparator.hpp"

#include <boost/assert.hpp>
#include <boost/config.hpp>

#include <algorithm>
#include <compare>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <numeric>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::collections
{
//------------------------------------------------------------------------------

//==============================================================================
// detail::paired_storage: synchronized key/value container operations
//==============================================================================
namespace detail {

template <typename KeyContainer, typename MappedContainer>
struct paired_storage
{
    using size_type       = typename KeyContainer::size_type;
    using difference_type = std::ptrdiff_t;

    KeyContainer    keys;
    MappedContainer values;

    //--------------------------------------------------------------------------
    // Synchronized single-element insert at position (exception-safe)
    //--------------------------------------------------------------------------
    template <typename K, typename V>
    void insert_element_at( size_type const pos, K && key, V && val ) {
        auto const p{ static_cast<difference_type>( pos ) };
        keys.insert( keys.begin() + p, std::forward<K>( key ) );
        try {
            values.insert( values.begin() + p, std::forward<V>( val ) );
        } catch ( ... ) {
            keys.erase( keys.begin() + p );
            throw;
        }
    }

    //--------------------------------------------------------------------------
    // Synchronized erase
    //--------------------------------------------------------------------------
    void erase_element_at( size_type const pos ) noexcept {
        auto const p{ static_cast<difference_type>( pos ) };
        keys  .erase( keys  .begin() + p );
        values.erase( values.begin() + p );
    }

    void erase_elements( size_type const first, size_type const last ) noexcept {
        auto const f{ static_cast<difference_type>( first ) };
        auto const l{ static_cast<difference_type>( last  ) };
        keys  .erase( keys  .begin() + f, keys  .begin() + l );
        values.erase( values.begin() + f, values.begin() + l );
    }

    void reserve( size_type const n ) {
        keys  .reserve( n );
        values.reserve( n );
    }

    void replace( KeyContainer new_keys, MappedContainer new_values ) noexcept {
        BOOST_ASSERT( new_keys.size() == new_values.size() );
        keys   = std::move( new_keys   );
        values = std::move( new_values );
    }

    void clear() noexcept {
        keys  .clear();
        values.clear();
    }

    void swap_storage( paired_storage & other ) noexcept {
        using std::swap;
        swap( keys,   other.keys   );
        swap( values, other.values );
    }
}; // struct paired_storage

} // namespace detail


struct sorted_unique_t { explicit sorted_unique_t() = default; };
inline constexpr sorted_unique_t sorted_unique{};

//==============================================================================
// sorted_dict
//==============================================================================

template
<
    typename Key,
    typename T,
    typename Compare         = total_less<Key>,
    typename KeyContainer    = std::vector<Key>,
    typename MappedContainer = std::vector<T>
>
class sorted_dict
    : private detail::paired_storage<KeyContainer, MappedContainer>
{
    using base = detail::paired_storage<KeyContainer, MappedContainer>;

    static_assert( std::is_same_v<Key, typename KeyContainer   ::value_type>, "KeyContainer::value_type must be Key" );
    static_assert( std::is_same_v<T,   typename MappedContainer::value_type>, "MappedContainer::value_type must be T" );

    static constexpr bool transparent{ Komparator<Compare>::transparent_comparator };

public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using key_type              = Key;
    using mapped_type           = T;
    using value_type            = std::pair<key_type, mapped_type>;
    using key_compare           = Compare;
    using reference             = std::pair<key_type const &, mapped_type       &>;
    using const_reference       = std::pair<key_type const &, mapped_type const &>;
    using size_type             = typename base::size_type;
    using difference_type       = typename base::difference_type;
    using key_container_type    = KeyContainer;
    using mapped_container_type = MappedContainer;

    //--------------------------------------------------------------------------
    // Iterator
    //--------------------------------------------------------------------------
private:
    template <bool IsConst>
    class iterator_impl
    {
    public:
        using iterator_concept  = std::random_access_iterator_tag;
        using iterator_category = std::random_access_iterator_tag;
        using value_type        = sorted_dict::value_type;
        using difference_type   = sorted_dict::difference_type;
        using reference         = std::conditional_t<IsConst, sorted_dict::const_reference, sorted_dict::reference>;

        struct arrow_proxy {
            reference ref;
            constexpr reference       * operator->()       noexcept { return &ref; }
            constexpr reference const * operator->() const noexcept { return &ref; }
        };
        using pointer = arrow_proxy;

    private:
        friend sorted_dict;
        friend iterator_impl<!IsConst>;

        using dict_ptr = std::conditional_t<IsConst, sorted_dict const *, sorted_dict *>;

        dict_ptr        dict_{ nullptr };
        difference_type idx_ { 0 };

        constexpr iterator_impl( dict_ptr const d, difference_type const i ) noexcept : dict_{ d }, idx_{ i } {}

    public:
        constexpr iterator_impl() noexcept = default;
        constexpr iterator_impl( iterator_impl const & ) noexcept = default;
        constexpr iterator_impl & operator=( iterator_impl const & ) noexcept = default;

        constexpr iterator_impl( iterator_impl<!IsConst> const & other ) noexcept requires IsConst
            : dict_{ other.dict_ }, idx_{ other.idx_ } {}

        constexpr reference operator*() const noexcept {
            return { dict_->base::keys[ static_cast<size_type>( idx_ ) ], dict_->base::values[ static_cast<size_type>( idx_ ) ] };
        }

        constexpr arrow_proxy operator->() const noexcept { return { **this }; }

        constexpr reference operator[]( difference_type const n ) const noexcept {
            return *( *this + n );
        }

        constexpr iterator_impl & operator++(     ) noexcept { ++idx_; return *this; }
        constexpr iterator_impl   operator++( int ) noexcept { auto tmp{ *this }; ++idx_; return tmp; }
        constexpr iterator_impl & operator--(     ) noexcept { --idx_; return *this; }
        constexpr iterator_impl   operator--( int ) noexcept { auto tmp{ *this }; --idx_; return tmp; }

        constexpr iterator_impl & operator+=( difference_type const n ) noexcept { idx_ += n; return *this; }
        constexpr iterator_impl & operator-=( difference_type const n ) noexcept { idx_ -= n; return *this; }

        friend constexpr iterator_impl operator+( iterator_impl it, difference_type const n ) noexcept { return { it.dict_, it.idx_ + n }; }
        friend constexpr iterator_impl operator+( difference_type const n, iterator_impl it ) noexcept { return { it.dict_, it.idx_ + n }; }
        friend constexpr iterator_impl operator-( iterator_impl it, difference_type const n ) noexcept { return { it.dict_, it.idx_ - n }; }

        friend constexpr difference_type operator-( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ - b.idx_; }

        friend constexpr bool operator==( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ == b.idx_; }
        friend constexpr auto operator<=>( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ <=> b.idx_; }
    }; // iterator_impl

public:
    using iterator               = iterator_impl<false>;
    using const_iterator         = iterator_impl<true>;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    //--------------------------------------------------------------------------
    // Views
    //--------------------------------------------------------------------------

    // Live views: they observe the dictionary they were obtained from and
    // must not outlive it.
    class keys_view
    {
    public:
        using iterator         = typename KeyContainer::const_iterator;
        using reverse_iterator = std::reverse_iterator<iterator>;

        explicit keys_view( sorted_dict const & d ) noexcept : dict_{ &d } {}

        iterator         begin () const noexcept { return dict_->base::keys.begin(); }
        iterator         end   () const noexcept { return dict_->base::keys.end  (); }
        reverse_iterator rbegin() const noexcept { return reverse_iterator{ end  () }; }
        reverse_iterator rend  () const noexcept { return reverse_iterator{ begin() }; }

        [[ nodiscard ]] size_type size () const noexcept { return dict_->size (); }
        [[ nodiscard ]] bool      empty() const noexcept { return dict_->empty(); }

        [[ nodiscard ]] bool contains( key_type const & key ) const { return dict_->contains( key ); }

    private:
        sorted_dict const * dict_;
    }; // class keys_view

    class values_view
    {
    public:
        using iterator         = typename MappedContainer::const_iterator;
        using reverse_iterator = std::reverse_iterator<iterator>;

        explicit values_view( sorted_dict const & d ) noexcept : dict_{ &d } {}

        iterator         begin () const noexcept { return dict_->base::values.begin(); }
        iterator         end   () const noexcept { return dict_->base::values.end  (); }
        reverse_iterator rbegin() const noexcept { return reverse_iterator{ end  () }; }
        reverse_iterator rend  () const noexcept { return reverse_iterator{ begin() }; }

        [[ nodiscard ]] size_type size () const noexcept { return dict_->size (); }
        [[ nodiscard ]] bool      empty() const noexcept { return dict_->empty(); }

    private:
        sorted_dict const * dict_;
    }; // class values_view

    class items_view
    {
    public:
        using iterator         = const_iterator;
        using reverse_iterator = const_reverse_iterator;

        explicit items_view( sorted_dict const & d ) noexcept : dict_{ &d } {}

        iterator         begin () const noexcept { return dict_->begin (); }
        iterator         end   () const noexcept { return dict_->end   (); }
        reverse_iterator rbegin() const noexcept { return dict_->rbegin(); }
        reverse_iterator rend  () const noexcept { return dict_->rend  (); }

        [[ nodiscard ]] size_type size () const noexcept { return dict_->size (); }
        [[ nodiscard ]] bool      empty() const noexcept { return dict_->empty(); }

    private:
        sorted_dict const * dict_;
    }; // class items_view

    //--------------------------------------------------------------------------
    // Constructors
    //--------------------------------------------------------------------------
    sorted_dict() = default;

    explicit sorted_dict( Compare const & comp ) noexcept( std::is_nothrow_copy_constructible_v<Compare> )
        : comp_{ comp } {}

    sorted_dict( KeyContainer keys, MappedContainer values, Compare const & comp = Compare{} )
        : comp_{ comp }
    {
        BOOST_ASSERT( keys.size() == values.size() );
        assign_unsorted( std::move( keys ), std::move( values ) );
    }

    sorted_dict( sorted_unique_t, KeyContainer keys, MappedContainer values, Compare const & comp = Compare{} )
        : base{ std::move( keys ), std::move( values ) }, comp_{ comp }
    {
        BOOST_ASSERT( base::keys.size() == base::values.size() );
        BOOST_ASSERT_MSG( std::ranges::is_sorted( base::keys, std::cref( comp_.comp() ) ), "sorted_unique input must be sorted" );
    }

    template <std::input_iterator InputIt>
    sorted_dict( InputIt first, InputIt const last, Compare const & comp = Compare{} )
        : comp_{ comp }
    {
        KeyContainer    keys;
        MappedContainer values;
        for ( ; first != last; ++first )
        {
            auto && [key, value]{ *first };
            keys  .emplace_back( key   );
            values.emplace_back( value );
        }
        assign_unsorted( std::move( keys ), std::move( values ) );
    }

    template <std::ranges::input_range R>
    requires( !std::same_as<std::remove_cvref_t<R>, sorted_dict> && std::convertible_to<std::ranges::range_reference_t<R>, value_type> )
    explicit sorted_dict( R && rg, Compare const & comp = Compare{} )
        : comp_{ comp }
    {
        KeyContainer    keys;
        MappedContainer values;
        if constexpr ( std::ranges::sized_range<R> )
        {
            keys  .reserve( static_cast<size_type>( std::ranges::size( rg ) ) );
            values.reserve( static_cast<size_type>( std::ranges::size( rg ) ) );
        }
        for ( auto && entry : rg )
        {
            value_type v( std::forward<decltype( entry )>( entry ) );
            keys  .push_back( std::move( v.first  ) );
            values.push_back( std::move( v.second ) );
        }
        assign_unsorted( std::move( keys ), std::move( values ) );
    }

    sorted_dict( std::initializer_list<value_type> const il, Compare const & comp = Compare{} )
        : sorted_dict( il.begin(), il.end(), comp ) {}

    sorted_dict( sorted_dict const & ) = default;
    sorted_dict( sorted_dict && )      = default;

    sorted_dict & operator=( sorted_dict const & ) = default;
    sorted_dict & operator=( sorted_dict && )      = default;

    sorted_dict & operator=( std::initializer_list<value_type> const il ) {
        *this = sorted_dict( il, comp_.comp() );
        return *this;
    }

    // One pass: every key maps to (a copy of) value.
    template <std::ranges::input_range R>
    [[ nodiscard ]] static sorted_dict fromkeys( R && keys, mapped_type const & value = mapped_type{}, Compare const & comp = Compare{} )
    {
        KeyContainer key_container;
        for ( auto && key : keys )
            key_container.emplace_back( std::forward<decltype( key )>( key ) );
        MappedContainer values( key_container.size(), value );
        return sorted_dict( std::move( key_container ), std::move( values ), comp );
    }

    [[ nodiscard ]] sorted_dict copy() const { return *this; }

    // Keys are copied, values cloned through the deep_copy customization point.
    [[ nodiscard ]] sorted_dict deep_copy() const
    {
        MappedContainer values;
        values.reserve( size() );
        for ( auto const & value : base::values )
            values.push_back( psi::collections::deep_copy<mapped_type>( value ) );
        return sorted_dict( sorted_unique, base::keys, std::move( values ), comp_.comp() );
    }

    //--------------------------------------------------------------------------
    // Iterators
    //--------------------------------------------------------------------------
    iterator       begin()       noexcept { return { this, 0 }; }
    const_iterator begin() const noexcept { return { this, 0 }; }
    iterator       end  ()       noexcept { return { this, static_cast<difference_type>( base::keys.size() ) }; }
    const_iterator end  () const noexcept { return { this, static_cast<difference_type>( base::keys.size() ) }; }

    const_iterator cbegin() const noexcept { return begin(); }
    const_iterator cend  () const noexcept { return end  (); }

    reverse_iterator       rbegin()       noexcept { return reverse_iterator      { end  () }; }
    const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator{ end  () }; }
    reverse_iterator       rend  ()       noexcept { return reverse_iterator      { begin() }; }
    const_reverse_iterator rend  () const noexcept { return const_reverse_iterator{ begin() }; }

    const_reverse_iterator crbegin() const noexcept { return rbegin(); }
    const_reverse_iterator crend  () const noexcept { return rend  (); }

    keys_view   keys  () const noexcept { return keys_view  { *this }; }
    values_view values() const noexcept { return values_view{ *this }; }
    items_view  items () const noexcept { return items_view { *this }; }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard ]] bool      empty   () const noexcept { return base::keys.empty(); }
    [[ nodiscard ]] size_type size    () const noexcept { return static_cast<size_type>( base::keys.size() ); }
    [[ nodiscard ]] size_type max_size() const noexcept { return std::min( base::keys.max_size(), base::values.max_size() ); }

    using base::reserve;

    //--------------------------------------------------------------------------
    // Element access
    //--------------------------------------------------------------------------
    mapped_type & operator[]( key_type const & key ) {
        return try_emplace( key ).first->second;
    }

    mapped_type & operator[]( key_type && key ) {
        return try_emplace( std::move( key ) ).first->second;
    }

    template <typename K> requires( transparent )
    mapped_type & operator[]( K && key ) {
        return try_emplace( std::forward<K>( key ) ).first->second;
    }

    mapped_type       & at( key_type const & key )       { return base::values[ checked_position( key ) ]; }
    mapped_type const & at( key_type const & key ) const { return base::values[ checked_position( key ) ]; }

    template <typename K> requires( transparent )
    mapped_type       & at( K const & key )       { return base::values[ checked_position( key ) ]; }
    template <typename K> requires( transparent )
    mapped_type const & at( K const & key ) const { return base::values[ checked_position( key ) ]; }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
private:
    template <typename K>
    [[ nodiscard ]] BOOST_FORCEINLINE size_type lower_bound_index( K const & key ) const {
        return static_cast<size_type>( std::lower_bound( base::keys.begin(), base::keys.end(), key, std::cref( comp_.comp() ) ) - base::keys.begin() );
    }
    template <typename K>
    [[ nodiscard ]] BOOST_FORCEINLINE size_type upper_bound_index( K const & key ) const {
        return static_cast<size_type>( std::upper_bound( base::keys.begin(), base::keys.end(), key, std::cref( comp_.comp() ) ) - base::keys.begin() );
    }
    template <typename K>
    [[ nodiscard ]] bool key_eq_at( size_type const pos, K const & key ) const {
        return pos < base::keys.size() && comp_.geq( key, base::keys[ pos ] );
    }
    template <typename K>
    [[ nodiscard ]] size_type checked_position( K const & key ) const {
        auto const pos{ lower_bound_index( key ) };
        if ( !key_eq_at( pos, key ) )
            detail::throw_key_error( "psi::collections::sorted_dict: key not found" );
        return pos;
    }

public:
    iterator       find( key_type const & key )       { auto const pos{ lower_bound_index( key ) }; return key_eq_at( pos, key ) ? iterator      { this, static_cast<difference_type>( pos ) } : end(); }
    const_iterator find( key_type const & key ) const { auto const pos{ lower_bound_index( key ) }; return key_eq_at( pos, key ) ? const_iterator{ this, static_cast<difference_type>( pos ) } : end(); }

    template <typename K> requires( transparent )
    iterator       find( K const & key )       { auto const pos{ lower_bound_index( key ) }; return key_eq_at( pos, key ) ? iterator      { this, static_cast<difference_type>( pos ) } : end(); }
    template <typename K> requires( transparent )
    const_iterator find( K const & key ) const { auto const pos{ lower_bound_index( key ) }; return key_eq_at( pos, key ) ? const_iterator{ this, static_cast<difference_type>( pos ) } : end(); }

    [[ nodiscard ]] size_type count   ( key_type const & key ) const { return find( key ) != end() ? 1 : 0; }
    [[ nodiscard ]] bool      contains( key_type const & key ) const { return find( key ) != end(); }

    template <typename K> requires( transparent )
    [[ nodiscard ]] size_type count   ( K const & key ) const { return find( key ) != end() ? 1 : 0; }
    template <typename K> requires( transparent )
    [[ nodiscard ]] bool      contains( K const & key ) const { return find( key ) != end(); }

    // Value for key, or fallback when absent (no insertion).
    [[ nodiscard ]] mapped_type get( key_type const & key, mapped_type fallback = mapped_type{} ) const {
        auto const it{ find( key ) };
        return it != end() ? it->second : fallback;
    }

    iterator       lower_bound( key_type const & key )       { return { this, static_cast<difference_type>( lower_bound_index( key ) ) }; }
    const_iterator lower_bound( key_type const & key ) const { return { this, static_cast<difference_type>( lower_bound_index( key ) ) }; }
    iterator       upper_bound( key_type const & key )       { return { this, static_cast<difference_type>( upper_bound_index( key ) ) }; }
    const_iterator upper_bound( key_type const & key ) const { return { this, static_cast<difference_type>( upper_bound_index( key ) ) }; }

    std::pair<iterator, iterator>             equal_range( key_type const & key )       { return { lower_bound( key ), upper_bound( key ) }; }
    std::pair<const_iterator, const_iterator> equal_range( key_type const & key ) const { return { lower_bound( key ), upper_bound( key ) }; }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------
    std::pair<iterator, bool> insert( value_type const & v ) {
        return try_emplace( v.first, v.second );
    }

    std::pair<iterator, bool> insert( value_type && v ) {
        return try_emplace( std::move( v.first ), std::move( v.second ) );
    }

    template <typename K, typename... Args>
    std::pair<iterator, bool> try_emplace( K && key, Args &&... args ) {
        auto const pos{ lower_bound_index( key ) };
        if ( key_eq_at( pos, key ) )
            return { iterator{ this, static_cast<difference_type>( pos ) }, false };
        base::insert_element_at( pos, key_type( std::forward<K>( key ) ), mapped_type( std::forward<Args>( args )... ) );
        return { iterator{ this, static_cast<difference_type>( pos ) }, true };
    }

    template <typename K, typename M>
    std::pair<iterator, bool> insert_or_assign( K && key, M && value ) {
        auto const pos{ lower_bound_index( key ) };
        if ( key_eq_at( pos, key ) ) {
            base::values[ pos ] = std::forward<M>( value );
            return { iterator{ this, static_cast<difference_type>( pos ) }, false };
        }
        base::insert_element_at( pos, key_type( std::forward<K>( key ) ), std::forward<M>( value ) );
        return { iterator{ this, static_cast<difference_type>( pos ) }, true };
    }

    template <typename... Args>
    std::pair<iterator, bool> emplace( Args &&... args ) {
        value_type v( std::forward<Args>( args )... );
        return try_emplace( std::move( v.first ), std::move( v.second ) );
    }

    // Stored value for key, inserting fallback first when absent.
    mapped_type & setdefault( key_type const & key, mapped_type fallback = mapped_type{} ) {
        return try_emplace( key, std::move( fallback ) ).first->second;
    }

    iterator erase( iterator pos ) noexcept { return erase( const_iterator{ pos } ); }

    iterator erase( const_iterator pos ) noexcept {
        auto const idx{ static_cast<size_type>( pos.idx_ ) };
        BOOST_ASSERT( idx < size() );
        base::erase_element_at( idx );
        return { this, static_cast<difference_type>( idx ) };
    }

    iterator erase( const_iterator first, const_iterator last ) noexcept {
        base::erase_elements( static_cast<size_type>( first.idx_ ), static_cast<size_type>( last.idx_ ) );
        return { this, first.idx_ };
    }

    size_type erase( key_type const & key ) {
        auto const it{ find( key ) };
        if ( it == end() ) return 0;
        erase( const_iterator{ it } );
        return 1;
    }

    // Removes key and returns its value; key_error if absent.
    mapped_type pop( key_type const & key ) {
        auto const pos{ checked_position( key ) };
        mapped_type value( std::move( base::values[ pos ] ) );
        base::erase_element_at( pos );
        return value;
    }

    mapped_type pop( key_type const & key, mapped_type fallback ) {
        auto const pos{ lower_bound_index( key ) };
        if ( !key_eq_at( pos, key ) )
            return fallback;
        mapped_type value( std::move( base::values[ pos ] ) );
        base::erase_element_at( pos );
        return value;
    }

    // Removes and returns the entry with the largest key.
    value_type popitem() {
        if ( empty() )
            detail::throw_key_error( "psi::collections::sorted_dict::popitem: dictionary is empty" );
        value_type item( std::move( base::keys.back() ), std::move( base::values.back() ) );
        base::erase_element_at( size() - 1 );
        return item;
    }

    // Merges entries (other's values win). Either every entry is applied or,
    // if a comparison or copy throws, none is.
    template <std::ranges::input_range R>
    requires std::convertible_to<std::ranges::range_reference_t<R>, value_type>
    void update( R && entries ) {
        sorted_dict merged{ *this };
        for ( auto && entry : entries )
        {
            auto && [key, value]{ entry };
            merged.insert_or_assign( key, value );
        }
        swap( merged );
    }

    void update( std::initializer_list<value_type> const il ) { update( std::ranges::subrange( il.begin(), il.end() ) ); }

    template <std::ranges::input_range R>
    requires std::convertible_to<std::ranges::range_reference_t<R>, value_type>
    sorted_dict & operator|=( R && entries ) { update( std::forward<R>( entries ) ); return *this; }

    // Ranges of entries only: other mappings (e.g. a chain_map_proxy, whose
    // iteration yields bare keys) supply their own operator|.
    template <std::ranges::input_range R>
    requires std::convertible_to<std::ranges::range_reference_t<R>, value_type>
    [[ nodiscard ]] friend sorted_dict operator|( sorted_dict const & left, R && right ) {
        sorted_dict merged{ left };
        merged.update( std::forward<R>( right ) );
        return merged;
    }

    using base::clear;

    void swap( sorted_dict & other ) noexcept {
        base::swap_storage( other );
        using std::swap;
        swap( comp_, other.comp_ );
    }

    friend void swap( sorted_dict & a, sorted_dict & b ) noexcept { a.swap( b ); }

    template <typename Pred>
    friend size_type erase_if( sorted_dict & c, Pred pred ) {
        size_type dst{ 0 };
        auto const n{ c.size() };
        for ( size_type src{ 0 }; src < n; ++src ) {
            if ( pred( const_reference{ c.base::keys[ src ], c.base::values[ src ] } ) )
                continue;
            if ( dst != src ) {
                c.base::keys  [ dst ] = std::move( c.base::keys  [ src ] );
                c.base::values[ dst ] = std::move( c.base::values[ src ] );
            }
            ++dst;
        }
        c.base::erase_elements( dst, n );
        return n - dst;
    }

    //--------------------------------------------------------------------------
    // Observers
    //--------------------------------------------------------------------------
    [[ nodiscard ]] key_compare key_comp() const noexcept { return comp_.comp(); }

    [[ nodiscard ]] key_container_type    const & key_container   () const noexcept { return base::keys;   }
    [[ nodiscard ]] mapped_container_type const & mapped_container() const noexcept { return base::values; }

    //--------------------------------------------------------------------------
    // Comparison
    //--------------------------------------------------------------------------
    friend bool operator==( sorted_dict const & a, sorted_dict const & b ) {
        return a.base::keys == b.base::keys && a.base::values == b.base::values;
    }

    //--------------------------------------------------------------------------
    // Private helpers
    //--------------------------------------------------------------------------
private:
    // Sorts an arbitrary batch of entries; of equivalent keys the one that
    // came last is kept. Throws (leaving *this untouched) if the comparator
    // does.
    void assign_unsorted( KeyContainer keys, MappedContainer values ) {
        BOOST_ASSERT( keys.size() == values.size() );
        std::vector<size_type> order( keys.size() );
        std::iota( order.begin(), order.end(), size_type{ 0 } );
        comp_.sort_by
        (
            order.begin(), order.end(),
            [&]( size_type const left, size_type const right ) {
                if ( comp_.le( keys[ left ], keys[ right ] ) ) return true;
                if ( comp_.le( keys[ right ], keys[ left ] ) ) return false;
                return left < right;
            }
        );

        KeyContainer    sorted_keys;
        MappedContainer sorted_values;
        sorted_keys  .reserve( order.size() );
        sorted_values.reserve( order.size() );
        for ( size_type i{ 0 }; i < order.size(); ++i )
        {
            auto const pos{ order[ i ] };
            if ( i + 1 < order.size() && comp_.eq( keys[ pos ], keys[ order[ i + 1 ] ] ) )
                continue;
            sorted_keys  .push_back( std::move( keys  [ pos ] ) );
            sorted_values.push_back( std::move( values[ pos ] ) );
        }
        base::replace( std::move( sorted_keys ), std::move( sorted_values ) );
    }

    //--------------------------------------------------------------------------
    // Data members
    //--------------------------------------------------------------------------
    [[ no_unique_address ]] Komparator<key_compare> comp_;
}; // class sorted_dict

//------------------------------------------------------------------------------
// Deduction guides
//------------------------------------------------------------------------------

template <std::input_iterator InputIt, typename Comp = total_less<std::remove_const_t<typename std::iterator_traits<InputIt>::value_type::first_type>>>
sorted_dict( InputIt, InputIt, Comp = Comp{} )
    -> sorted_dict<std::remove_const_t<typename std::iterator_traits<InputIt>::value_type::first_type>,
                   typename std::iterator_traits<InputIt>::value_type::second_type,
                   Comp>;

template <typename Key, typename T, typename Comp = total_less<Key>>
sorted_dict( std::initializer_list<std::pair<Key, T>>, Comp = Comp{} )
    -> sorted_dict<Key, T, Comp>;

//------------------------------------------------------------------------------
} // namespace psi::collections
//------------------------------------------------------------------------------
