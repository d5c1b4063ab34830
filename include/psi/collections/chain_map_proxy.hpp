////////////////////////////////////////////////////////////////////////////////
/// psi::collections read-only layered mapping view
///
/// chain_map_proxy<K, V> looks keys up through an ordered list of mappings
/// ("layers"): the first layer holding the key wins. Layers are observed, not
/// copied: mutations made by a layer's owner are immediately visible through
/// every proxy referencing it. The proxy itself never mutates a layer and has
/// no item assignment.
///
/// A layer either borrows an externally owned mapping (std::map,
/// std::unordered_map, sorted_dict, another chain_map_proxy, ... anything with
/// find()/end() and pair iteration), which must then outlive every proxy
/// referencing it, or owns a mapping handed over as an rvalue.
///
/// Layers are consulted through find() only. A layer's own fallback for
/// absent keys (a default-creating operator[], a nested proxy's missing-key
/// handler) is never invoked: an absent key moves the lookup on to the next
/// layer, and only the proxy's own missing-key handler runs when every layer
/// misses.
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

#include <boost/assert.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <ranges>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::collections
{
//------------------------------------------------------------------------------

//==============================================================================
// mapping_layer: type erased read-only mapping
//==============================================================================

// Forward cursor over the keys of one layer.
template <typename K>
class key_cursor
{
public:
    virtual ~key_cursor() = default;

    // nullptr once exhausted
    [[ nodiscard ]] virtual K const * current() const = 0;

    virtual void advance() = 0;

    [[ nodiscard ]] virtual std::unique_ptr<key_cursor> clone() const = 0;
}; // class key_cursor

template <typename K, typename V>
class mapping_layer
{
public:
    using entry_visitor = std::function<void( K const &, V const & )>;

    virtual ~mapping_layer() = default;

    // nullptr if absent
    [[ nodiscard ]] virtual V const * find( K const & key ) const = 0;

    [[ nodiscard ]] virtual std::size_t size() const = 0;

    virtual void for_each( entry_visitor const & visit ) const = 0;

    [[ nodiscard ]] virtual std::unique_ptr<key_cursor<K>> keys() const = 0;

    [[ nodiscard ]] bool empty() const { return size() == 0; }
}; // class mapping_layer


namespace detail
{
    template <typename V, typename Map, typename K>
    V const * layer_lookup( Map const & map, K const & key )
    {
        if constexpr ( std::is_convertible_v<decltype( map.find( key ) ), V const *> )
            return map.find( key );
        else
        {
            auto const it{ map.find( key ) };
            return it != map.end() ? &it->second : nullptr;
        }
    }

    template <typename Map, typename Visitor>
    void visit_entries( Map const & map, Visitor const & visit )
    {
        if constexpr ( requires { map.for_each( visit ); } )
            map.for_each( visit );
        else
        {
            for ( auto && [key, value] : map )
                visit( key, value );
        }
    }

    template <typename K, typename Map>
    class map_key_cursor final : public key_cursor<K>
    {
    public:
        explicit map_key_cursor( Map const & map ) : it_{ std::ranges::begin( map ) }, end_{ std::ranges::end( map ) } {}

        K const * current() const override
        {
            if ( it_ == end_ )
                return nullptr;
            // pair-like entries (maps) or bare keys (a chain_map_proxy)
            if constexpr ( requires { ( *it_ ).first; } )
                return &( *it_ ).first;
            else
                return &*it_;
        }

        void advance() override { BOOST_ASSERT( it_ != end_ ); ++it_; }

        std::unique_ptr<key_cursor<K>> clone() const override { return std::make_unique<map_key_cursor>( *this ); }

    private:
        std::ranges::iterator_t<Map const> it_;
        std::ranges::sentinel_t<Map const> end_;
    }; // class map_key_cursor

    template <typename K, typename V, typename Map, bool Owned>
    class map_layer final : public mapping_layer<K, V>
    {
    public:
        using typename mapping_layer<K, V>::entry_visitor;

        explicit map_layer( Map const & map ) requires( !Owned ) : map_{ &map } {}
        explicit map_layer( Map         map ) requires(  Owned ) : map_{ std::move( map ) } {}

        V const * find( K const & key ) const override { return layer_lookup<V>( map(), key ); }

        std::size_t size() const override { return static_cast<std::size_t>( map().size() ); }

        void for_each( entry_visitor const & visit ) const override { visit_entries( map(), visit ); }

        std::unique_ptr<key_cursor<K>> keys() const override { return std::make_unique<map_key_cursor<K, Map>>( map() ); }

    private:
        Map const & map() const noexcept
        {
            if constexpr ( Owned )
                return map_;
            else
                return *map_;
        }

        std::conditional_t<Owned, Map, Map const *> map_;
    }; // class map_layer
} // namespace detail


/// Anything a chain_map_proxy can look keys up in.
/// Either find() yields a V const * directly (as chain_map_proxy's does) or
/// it yields an iterator to a pair-like entry.
template <typename M, typename K, typename V>
concept mapping_for =
    requires( M const & m ) { { m.size() } -> std::convertible_to<std::size_t>; } &&
    (
        requires( M const & m, K const & key ) { { m.find( key ) } -> std::convertible_to<V const *>; } ||
        requires( M const & m, K const & key )
        {
            m.find( key ) != m.end();
            { &m.find( key )->second } -> std::convertible_to<V const *>;
        }
    );


//==============================================================================
// chain_map_proxy
//==============================================================================

template
<
    typename K,
    typename V,
    typename Hash     = std::hash<K>,
    typename KeyEqual = std::equal_to<K>
>
class chain_map_proxy
{
public:
    using key_type        = K;
    using mapped_type     = V;
    using size_type       = std::size_t;
    using layer_type      = mapping_layer<K, V>;
    using layer_ptr       = std::shared_ptr<layer_type const>;
    using dict_type       = std::unordered_map<K, V, Hash, KeyEqual>;
    using missing_handler = std::function<V const &( K const & )>;

    //--------------------------------------------------------------------------
    // Key iterator: walks the layers lazily in priority order, skipping keys
    // an earlier layer already holds. Layer mutations are observed as with
    // the layers' own iterators (and invalidate it when they would).
    //--------------------------------------------------------------------------
    class keys_view;

    class const_iterator
    {
    public:
        using iterator_concept  = std::forward_iterator_tag;
        using iterator_category = std::forward_iterator_tag;
        using value_type        = K;
        using difference_type   = std::ptrdiff_t;
        using reference         = K const &;
        using pointer           = K const *;

        const_iterator() noexcept = default;

        const_iterator( const_iterator const & other )
            : layers_{ other.layers_ }, layer_{ other.layer_ }, cursor_{ other.cursor_ ? other.cursor_->clone() : nullptr } {}
        const_iterator( const_iterator && ) noexcept = default;

        const_iterator & operator=( const_iterator other ) noexcept
        {
            layers_ = other.layers_;
            layer_  = other.layer_;
            cursor_ = std::move( other.cursor_ );
            return *this;
        }

        reference operator* () const noexcept { BOOST_ASSERT( !at_end() ); return *cursor_->current(); }
        pointer   operator->() const noexcept { return &**this; }

        const_iterator & operator++(     ) { step(); skip_shadowed(); return *this; }
        const_iterator   operator++( int ) { auto tmp{ *this }; ++*this; return tmp; }

        friend bool operator==( const_iterator const & a, const_iterator const & b ) noexcept
        {
            bool const a_end{ a.at_end() };
            bool const b_end{ b.at_end() };
            if ( a_end || b_end )
                return a_end == b_end;
            return a.layers_ == b.layers_ && a.layer_ == b.layer_ && a.cursor_->current() == b.cursor_->current();
        }

    private:
        friend class chain_map_proxy;
        friend class keys_view;

        explicit const_iterator( std::vector<layer_ptr> const & layers ) : layers_{ &layers }
        {
            enter( 0 );
            skip_shadowed();
        }

        bool at_end() const noexcept { return !cursor_; }

        // Positions on the first key of the first non-empty layer at or
        // after layer.
        void enter( std::size_t const layer )
        {
            for ( layer_ = layer; layer_ < layers_->size(); ++layer_ )
            {
                cursor_ = (*layers_)[ layer_ ]->keys();
                if ( cursor_->current() )
                    return;
            }
            cursor_.reset();
        }

        void step()
        {
            BOOST_ASSERT( !at_end() );
            cursor_->advance();
            if ( !cursor_->current() )
                enter( layer_ + 1 );
        }

        bool shadowed() const
        {
            auto const & key{ *cursor_->current() };
            for ( std::size_t earlier{ 0 }; earlier < layer_; ++earlier )
            {
                if ( (*layers_)[ earlier ]->find( key ) )
                    return true;
            }
            return false;
        }

        void skip_shadowed()
        {
            while ( !at_end() && shadowed() )
                step();
        }

        std::vector<layer_ptr> const *  layers_{ nullptr };
        std::size_t                     layer_ { 0 };
        std::unique_ptr<key_cursor<K>>  cursor_;
    }; // class const_iterator

    using iterator = const_iterator;

    // Live view of the deduplicated key union. Shares the proxy's layers, so
    // it observes later layer mutations and may outlive the proxy.
    class keys_view
    {
    public:
        const_iterator begin() const { return const_iterator{ layers_ }; }
        const_iterator end  () const noexcept { return {}; }

        [[ nodiscard ]] size_type size() const { return static_cast<size_type>( std::ranges::distance( begin(), end() ) ); }
        [[ nodiscard ]] bool empty() const { return begin() == end(); }

    private:
        friend class chain_map_proxy;

        explicit keys_view( std::vector<layer_ptr> layers ) noexcept : layers_{ std::move( layers ) } {}

        std::vector<layer_ptr> layers_;
    }; // class keys_view

    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------

    // A single empty layer.
    chain_map_proxy() : layers_{ own( dict_type{} ) } {}

    // One layer per map, in priority order: lvalues are borrowed, rvalues
    // are moved into owned layers.
    template <typename... Maps>
    requires
    (
        sizeof...( Maps ) > 0 &&
        ( !std::same_as<std::remove_cvref_t<Maps>, chain_map_proxy> && ... ) &&
        ( mapping_for<std::remove_cvref_t<Maps>, K, V> && ... )
    )
    explicit chain_map_proxy( Maps &&... maps ) : layers_{ adopt( std::forward<Maps>( maps ) )... } {}

    explicit chain_map_proxy( std::vector<layer_ptr> layers, missing_handler on_missing = {} )
        : layers_{ std::move( layers ) }, on_missing_{ std::move( on_missing ) }
    {
        if ( layers_.empty() )
            layers_.push_back( own( dict_type{} ) );
        BOOST_ASSERT_MSG( std::ranges::none_of( layers_, []( layer_ptr const & layer ) { return !layer; } ), "null chain_map_proxy layer" );
    }

    template <std::ranges::input_range R>
    [[ nodiscard ]] static chain_map_proxy fromkeys( R && keys, V const & value = V{} )
    {
        dict_type dict;
        for ( auto && key : keys )
            dict.insert_or_assign( key_type( std::forward<decltype( key )>( key ) ), value );
        return chain_map_proxy{ std::vector<layer_ptr>{ own( std::move( dict ) ) } };
    }

    template <typename Map>
    [[ nodiscard ]] static layer_ptr borrow( Map const & map )
    {
        return std::make_shared<detail::map_layer<K, V, Map, false>>( map );
    }

    template <typename Map>
    [[ nodiscard ]] static layer_ptr own( Map map )
    {
        return std::make_shared<detail::map_layer<K, V, Map, true>>( std::move( map ) );
    }

    template <typename Map>
    [[ nodiscard ]] static layer_ptr adopt( Map && map )
    {
        if constexpr ( std::is_lvalue_reference_v<Map> )
            return borrow( map );
        else
            return own( std::remove_cvref_t<Map>( std::move( map ) ) );
    }

    // Same layers (shared, not copied) and missing-key handler.
    [[ nodiscard ]] chain_map_proxy copy() const { return *this; }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------

    // First hit in priority order, nullptr if no layer holds key.
    [[ nodiscard ]] V const * find( K const & key ) const
    {
        for ( auto const & layer : layers_ )
        {
            if ( auto const value{ layer->find( key ) } )
                return value;
        }
        return nullptr;
    }

    // First hit; otherwise whatever the missing-key handler yields (by
    // default a key_error).
    V const & operator[]( K const & key ) const
    {
        if ( auto const value{ find( key ) } )
            return *value;
        return missing( key );
    }

    V const & at( K const & key ) const { return (*this)[ key ]; }

    [[ nodiscard ]] V get( K const & key, V fallback = V{} ) const
    {
        auto const value{ find( key ) };
        return value ? *value : fallback;
    }

    [[ nodiscard ]] bool      contains( K const & key ) const { return find( key ) != nullptr; }
    [[ nodiscard ]] size_type count   ( K const & key ) const { return contains( key ) ? 1 : 0; }

    //--------------------------------------------------------------------------
    // Key union
    //--------------------------------------------------------------------------
    [[ nodiscard ]] size_type size() const
    {
        if ( layers_.size() == 1 )
            return layers_.front()->size();
        return static_cast<size_type>( std::ranges::distance( begin(), end() ) );
    }

    [[ nodiscard ]] bool empty() const
    {
        return std::ranges::all_of( layers_, []( layer_ptr const & layer ) { return layer->empty(); } );
    }

    // Keys of the first layer, then the keys each following layer adds.
    [[ nodiscard ]] keys_view keys() const { return keys_view{ layers_ }; }

    const_iterator begin() const { return const_iterator{ layers_ }; }
    const_iterator end  () const noexcept { return {}; }

    // Visits every key of the union once, with its effective value.
    template <typename Visitor>
    void for_each( Visitor && visit ) const
    {
        visit_union( [&visit]( K const & key, V const & value ) { std::invoke( visit, key, value ); } );
    }

    //--------------------------------------------------------------------------
    // Derived proxies
    //--------------------------------------------------------------------------

    // Prepends a new empty owned layer.
    [[ nodiscard ]] chain_map_proxy new_child() const { return prepend( own( dict_type{} ) ); }

    // Prepends map, borrowed.
    template <mapping_for<K, V> Map>
    [[ nodiscard ]] chain_map_proxy new_child( Map const & map ) const { return prepend( borrow( map ) ); }

    // Prepends map, owned (a temporary cannot be borrowed).
    template <mapping_for<K, V> Map>
    requires( !std::is_lvalue_reference_v<Map> )
    [[ nodiscard ]] chain_map_proxy new_child( Map && map ) const { return prepend( own( std::forward<Map>( map ) ) ); }

    // Prepends a new owned layer holding entries.
    [[ nodiscard ]] chain_map_proxy new_child( std::initializer_list<typename dict_type::value_type> const entries ) const
    {
        return prepend( own( dict_type( entries ) ) );
    }

    // Writes entries into map, then prepends it borrowed.
    template <mapping_for<K, V> Map>
    [[ nodiscard ]] chain_map_proxy new_child( Map & map, std::initializer_list<typename dict_type::value_type> const entries ) const
    {
        for ( auto const & [key, value] : entries )
            map.insert_or_assign( key, value );
        return prepend( borrow( map ) );
    }

    // All layers but the first (a single empty owned one if none remain).
    [[ nodiscard ]] chain_map_proxy parents() const
    {
        return chain_map_proxy{ std::vector<layer_ptr>( layers_.begin() + 1, layers_.end() ), on_missing_ };
    }

    [[ nodiscard ]] std::vector<layer_ptr> const & maps() const noexcept { return layers_; }

    //--------------------------------------------------------------------------
    // Missing-key hook
    //--------------------------------------------------------------------------
    void set_missing_handler( missing_handler handler ) noexcept { on_missing_ = std::move( handler ); }

    [[ nodiscard ]] missing_handler const & get_missing_handler() const noexcept { return on_missing_; }

    //--------------------------------------------------------------------------
    // Materialization
    //--------------------------------------------------------------------------

    // Concrete snapshot of the effective mapping.
    [[ nodiscard ]] dict_type to_dict() const
    {
        dict_type result;
        // lowest priority first so that higher layers overwrite
        for ( auto layer{ layers_.rbegin() }; layer != layers_.rend(); ++layer )
            (*layer)->for_each( [&result]( K const & key, V const & value ) { result.insert_or_assign( key, value ); } );
        return result;
    }

    // Effective mapping merged with other, other's entries winning.
    template <mapping_for<K, V> Map>
    friend dict_type operator|( chain_map_proxy const & proxy, Map const & other )
    {
        auto result{ proxy.to_dict() };
        detail::visit_entries( other, [&result]( K const & key, V const & value ) { result.insert_or_assign( key, value ); } );
        return result;
    }

    // other merged with the effective mapping, the proxy's entries winning.
    template <mapping_for<K, V> Map>
    requires( !std::same_as<Map, chain_map_proxy> )
    friend dict_type operator|( Map const & other, chain_map_proxy const & proxy )
    {
        dict_type result;
        detail::visit_entries( other, [&result]( K const & key, V const & value ) { result.insert_or_assign( key, value ); } );
        proxy.for_each( [&result]( K const & key, V const & value ) { result.insert_or_assign( key, value ); } );
        return result;
    }

private:
    chain_map_proxy prepend( layer_ptr layer ) const
    {
        std::vector<layer_ptr> layers;
        layers.reserve( layers_.size() + 1 );
        layers.push_back( std::move( layer ) );
        layers.insert( layers.end(), layers_.begin(), layers_.end() );
        return chain_map_proxy{ std::move( layers ), on_missing_ };
    }

    template <typename Visitor>
    void visit_union( Visitor const & visit ) const
    {
        if ( layers_.size() == 1 )
        {
            layers_.front()->for_each( visit );
            return;
        }
        for ( auto const & key : *this )
            visit( key, *find( key ) );
    }

    V const & missing( K const & key ) const
    {
        if ( on_missing_ )
            return on_missing_( key );
        detail::throw_key_error( "psi::collections::chain_map_proxy: key not found" );
    }

    std::vector<layer_ptr> layers_;
    missing_handler        on_missing_;
}; // class chain_map_proxy

//------------------------------------------------------------------------------
} // namespace psi::collections
//------------------------------------------------------------------------------
