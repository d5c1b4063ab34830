////////////////////////////////////////////////////////////////////////////////
/// psi::collections auto-populating dictionaries with one weakly held side
///
/// weak_key_default_dictionary<K, V>
///   keys are objects owned elsewhere (std::shared_ptr<K>, compared by
///   identity) and referenced weakly; an entry disappears once its key object
///   is reclaimed.
/// weak_value_default_dictionary<K, V, Hash, KeyEqual>
///   values are objects owned elsewhere (std::shared_ptr<V>) and referenced
///   weakly; an entry disappears once its value object is reclaimed.
///
/// Both optionally carry a default factory: operator[] on a missing key calls
/// it exactly once, stores the result and returns it. The factory runs before
/// the dictionary storage is touched, so a factory that reenters the
/// dictionary cannot leave a half-made slot behind.
///
/// Reclaimed entries are dropped eagerly by every observing or mutating call;
/// their absence is indistinguishable from "never inserted".
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
#include "weak_handle.hpp"

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <memory>
#include <unordered_map>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::collections
{
//------------------------------------------------------------------------------

//==============================================================================
// weak_key_default_dictionary
//==============================================================================

template <typename K, typename V>
class weak_key_default_dictionary
{
public:
    using key_type     = std::shared_ptr<K>;
    using mapped_type  = V;
    using size_type    = std::size_t;
    using handle_type  = weak_handle<K>;
    using factory_type = std::function<V()>;
    using storage_type = std::unordered_map<handle_type, V, typename handle_type::hash>;

    weak_key_default_dictionary() = default;

    explicit weak_key_default_dictionary( factory_type factory ) noexcept : factory_{ std::move( factory ) } {}

    weak_key_default_dictionary( factory_type factory, std::initializer_list<std::pair<key_type, V>> const entries )
        : factory_{ std::move( factory ) }
    {
        for ( auto const & [key, value] : entries )
            insert_or_assign( key, value );
    }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------

    // Stored value, else the default factory's (stored first), else key_error.
    V & operator[]( key_type const & key )
    {
        sweep();
        if ( auto const existing{ find_slot( key ) }; existing != data_.end() )
            return existing->second;
        if ( !factory_ )
            detail::throw_key_error( "psi::collections::weak_key_default_dictionary: key not found" );
        handle_type handle{ key }; // rejects a null key before the factory runs
        V value( factory_() );
        return data_.insert_or_assign( std::move( handle ), std::move( value ) ).first->second;
    }

    V & at( key_type const & key )
    {
        sweep();
        auto const slot{ find_slot( key ) };
        if ( slot == data_.end() )
            detail::throw_key_error( "psi::collections::weak_key_default_dictionary::at: key not found" );
        return slot->second;
    }

    V const & at( key_type const & key ) const
    {
        sweep();
        auto const slot{ find_slot( key ) };
        if ( slot == data_.end() )
            detail::throw_key_error( "psi::collections::weak_key_default_dictionary::at: key not found" );
        return slot->second;
    }

    // nullptr if absent
    V * find( key_type const & key )
    {
        sweep();
        auto const slot{ find_slot( key ) };
        return slot != data_.end() ? &slot->second : nullptr;
    }

    V const * find( key_type const & key ) const
    {
        sweep();
        auto const slot{ find_slot( key ) };
        return slot != data_.end() ? &slot->second : nullptr;
    }

    [[ nodiscard ]] V get( key_type const & key, V fallback = V{} ) const
    {
        auto const value{ find( key ) };
        return value ? *value : fallback;
    }

    [[ nodiscard ]] bool contains( key_type const & key ) const { return find( key ) != nullptr; }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    // Returns true if key was not present before.
    bool insert_or_assign( key_type const & key, V value )
    {
        sweep();
        return data_.insert_or_assign( handle_type{ key }, std::move( value ) ).second;
    }

    bool erase( key_type const & key )
    {
        sweep();
        auto const slot{ find_slot( key ) };
        if ( slot == data_.end() )
            return false;
        data_.erase( slot );
        return true;
    }

    void clear() noexcept { data_.clear(); }

    // Drops the entries of reclaimed keys, returns how many were dropped.
    size_type prune() { return sweep(); }

    //--------------------------------------------------------------------------
    // Observers
    //--------------------------------------------------------------------------
    [[ nodiscard ]] size_type size () const { sweep(); return data_.size (); }
    [[ nodiscard ]] bool      empty() const { sweep(); return data_.empty(); }

    // Visits every live entry as ( std::shared_ptr<K>, V & ).
    template <typename Visitor>
    void for_each( Visitor && visit )
    {
        sweep();
        for ( auto & [handle, value] : data_ )
        {
            if ( auto const key{ handle.lock() } )
                std::invoke( visit, key, value );
        }
    }

    template <typename Visitor>
    void for_each( Visitor && visit ) const
    {
        sweep();
        for ( auto const & [handle, value] : data_ )
        {
            if ( auto const key{ handle.lock() } )
                std::invoke( visit, key, value );
        }
    }

    [[ nodiscard ]] factory_type const & default_factory() const noexcept { return factory_; }
    void set_default_factory( factory_type factory ) noexcept { factory_ = std::move( factory ); }

private:
    typename storage_type::iterator find_slot( key_type const & key ) const
    {
        if ( !key )
            return data_.end();
        return data_.find( handle_type{ key } );
    }

    size_type sweep() const
    {
        return static_cast<size_type>( std::erase_if( data_, []( auto const & entry ) { return entry.first.expired(); } ) );
    }

    mutable storage_type data_;
    factory_type         factory_;
}; // class weak_key_default_dictionary


//==============================================================================
// weak_value_default_dictionary
//==============================================================================

template
<
    typename K,
    typename V,
    typename Hash     = std::hash<K>,
    typename KeyEqual = std::equal_to<K>
>
class weak_value_default_dictionary
{
public:
    using key_type     = K;
    using mapped_type  = std::shared_ptr<V>;
    using size_type    = std::size_t;
    using factory_type = std::function<std::shared_ptr<V>()>;
    using storage_type = std::unordered_map<K, std::weak_ptr<V>, Hash, KeyEqual>;

    weak_value_default_dictionary() = default;

    explicit weak_value_default_dictionary( factory_type factory ) noexcept : factory_{ std::move( factory ) } {}

    weak_value_default_dictionary( factory_type factory, std::initializer_list<std::pair<K const, mapped_type>> const entries )
        : factory_{ std::move( factory ) }
    {
        for ( auto const & [key, value] : entries )
            insert_or_assign( key, value );
    }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------

    // Live stored value, else the default factory's (stored first), else
    // key_error. The returned strong reference is meant for the caller's
    // scope only: holding on to it keeps the entry alive.
    mapped_type operator[]( K const & key )
    {
        if ( auto value{ find( key ) } )
            return value;
        if ( !factory_ )
            detail::throw_key_error( "psi::collections::weak_value_default_dictionary: key not found" );
        mapped_type value( factory_() );
        if ( !value )
            detail::throw_invalid_argument( "psi::collections::weak_value_default_dictionary: default factory returned null" );
        data_.insert_or_assign( key, value );
        return value;
    }

    mapped_type at( K const & key ) const
    {
        auto value{ find( key ) };
        if ( !value )
            detail::throw_key_error( "psi::collections::weak_value_default_dictionary::at: key not found" );
        return value;
    }

    // null if absent
    [[ nodiscard ]] mapped_type find( K const & key ) const
    {
        sweep();
        auto const slot{ data_.find( key ) };
        return slot != data_.end() ? slot->second.lock() : nullptr;
    }

    [[ nodiscard ]] mapped_type get( K const & key, mapped_type fallback = nullptr ) const
    {
        auto value{ find( key ) };
        return value ? value : fallback;
    }

    [[ nodiscard ]] bool contains( K const & key ) const { return find( key ) != nullptr; }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    // Returns true if key was not present before. Null values are rejected
    // with std::invalid_argument.
    bool insert_or_assign( K const & key, mapped_type const & value )
    {
        if ( !value )
            detail::throw_invalid_argument( "psi::collections::weak_value_default_dictionary: null value" );
        sweep();
        return data_.insert_or_assign( key, std::weak_ptr<V>{ value } ).second;
    }

    bool erase( K const & key )
    {
        sweep();
        return data_.erase( key ) != 0;
    }

    void clear() noexcept { data_.clear(); }

    // Drops the entries of reclaimed values, returns how many were dropped.
    size_type prune() { return sweep(); }

    //--------------------------------------------------------------------------
    // Observers
    //--------------------------------------------------------------------------
    [[ nodiscard ]] size_type size () const { sweep(); return data_.size (); }
    [[ nodiscard ]] bool      empty() const { sweep(); return data_.empty(); }

    // Visits every live entry as ( K const &, std::shared_ptr<V> const & ).
    template <typename Visitor>
    void for_each( Visitor && visit ) const
    {
        sweep();
        for ( auto const & [key, weak_value] : data_ )
        {
            if ( auto const value{ weak_value.lock() } )
                std::invoke( visit, key, value );
        }
    }

    [[ nodiscard ]] factory_type const & default_factory() const noexcept { return factory_; }
    void set_default_factory( factory_type factory ) noexcept { factory_ = std::move( factory ); }

private:
    size_type sweep() const
    {
        return static_cast<size_type>( std::erase_if( data_, []( auto const & entry ) { return entry.second.expired(); } ) );
    }

    mutable storage_type data_;
    factory_type         factory_;
}; // class weak_value_default_dictionary

//------------------------------------------------------------------------------
} // namespace psi::collections
//------------------------------------------------------------------------------
