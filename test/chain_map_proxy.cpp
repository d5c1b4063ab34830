////////////////////////////////////////////////////////////////////////////////
/// psi::collections::chain_map_proxy unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/collections/chain_map_proxy.hpp>
#include <psi/collections/print.hpp>
#include <psi/collections/sorted_dict.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <sstream>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::collections {
//------------------------------------------------------------------------------

namespace
{
    using proxy = chain_map_proxy<std::string, int>;
    using dict  = std::unordered_map<std::string, int>;
} // anonymous namespace

//==============================================================================
// Lookup
//==============================================================================

TEST( chain_map_proxy, first_layer_wins )
{
    dict const front{ { "a", 1 } };
    dict const back { { "a", 2 }, { "b", 3 } };
    proxy const p{ front, back };

    EXPECT_EQ( p[ "a" ], 1 );
    EXPECT_EQ( p[ "b" ], 3 );
    EXPECT_EQ( p.size(), 2 );
    EXPECT_TRUE ( p.contains( "b" ) );
    EXPECT_FALSE( p.contains( "c" ) );
    EXPECT_EQ( p.get( "c", -1 ), -1 );
    EXPECT_EQ( p.find( "c" ), nullptr );
}

TEST( chain_map_proxy, observes_live_layer_mutations )
{
    dict       front{ { "a", 1 } };
    dict const back { { "a", 2 }, { "b", 3 } };
    proxy const p{ front, back };

    front[ "a" ] = 9;
    EXPECT_EQ( p[ "a" ], 9 );
    front.erase( "a" );
    EXPECT_EQ( p[ "a" ], 2 );
    front[ "z" ] = 26;
    EXPECT_EQ( p.size(), 3 );
}

TEST( chain_map_proxy, missing_key_throws_key_error )
{
    dict const layer;
    proxy const p{ layer };
    EXPECT_THROW( std::ignore = p[ "nope" ], key_error );
    EXPECT_THROW( std::ignore = p.at( "nope" ), std::out_of_range );
}

TEST( chain_map_proxy, missing_handler_is_single_override_point )
{
    dict const layer{ { "a", 1 } };
    proxy p{ layer };
    static int const fallback{ 42 };
    std::vector<std::string> misses;
    p.set_missing_handler( [&misses]( std::string const & key ) -> int const & {
        misses.push_back( key );
        return fallback;
    } );

    EXPECT_EQ( p[ "a" ], 1 );
    EXPECT_EQ( p[ "x" ], 42 );
    EXPECT_EQ( p.at( "y" ), 42 );
    EXPECT_EQ( misses, ( std::vector<std::string>{ "x", "y" } ) );

    // carried over to derived proxies
    EXPECT_EQ( p.new_child()[ "w" ], 42 );
    EXPECT_EQ( misses.size(), 3 );
}

TEST( chain_map_proxy, heterogeneous_layers )
{
    std::map<std::string, int>         const ordered{ { "m", 1 } };
    sorted_dict<std::string, int>      const sorted { { "s", 2 }, { "m", 0 } };
    std::unordered_map<std::string, int> const hashed{ { "h", 3 } };
    proxy const p{ ordered, sorted, hashed };

    EXPECT_EQ( p[ "m" ], 1 );
    EXPECT_EQ( p[ "s" ], 2 );
    EXPECT_EQ( p[ "h" ], 3 );
    EXPECT_EQ( p.size(), 3 );

    // a proxy can itself be a layer
    dict const base{ { "o", 4 } };
    auto const outer{ proxy{ base }.new_child( p ) };
    EXPECT_EQ( outer[ "s" ], 2 );
    EXPECT_EQ( outer[ "o" ], 4 );
    EXPECT_EQ( outer.size(), 4 );
}

//==============================================================================
// Iteration
//==============================================================================

TEST( chain_map_proxy, iteration_is_deduplicated_union )
{
    std::map<std::string, int> const first { { "b", 1 }, { "a", 1 } };
    std::map<std::string, int> const second{ { "a", 2 }, { "c", 2 } };
    proxy const p{ first, second };

    std::vector<std::string> const keys( p.begin(), p.end() );
    EXPECT_EQ( keys, ( std::vector<std::string>{ "a", "b", "c" } ) );
    auto const view{ p.keys() };
    EXPECT_TRUE( std::ranges::equal( view, keys ) );
    EXPECT_EQ( view.size(), 3 );

    std::map<std::string, int> effective;
    p.for_each( [&]( std::string const & key, int const value ) { effective[ key ] = value; } );
    EXPECT_EQ( effective, ( std::map<std::string, int>{ { "a", 1 }, { "b", 1 }, { "c", 2 } } ) );
}

TEST( chain_map_proxy, keys_view_is_live )
{
    std::map<std::string, int> front{ { "b", 1 } };
    std::map<std::string, int> back { { "a", 2 }, { "c", 3 } };
    proxy const p{ front, back };

    auto const view{ p.keys() };
    front[ "a" ] = 0;
    back [ "d" ] = 4;
    back.erase( "c" );

    std::vector<std::string> const seen( view.begin(), view.end() );
    EXPECT_EQ( seen, ( std::vector<std::string>{ "a", "b", "d" } ) );
    EXPECT_EQ( view.size(), 3 );
    EXPECT_EQ( p.size(), 3 );

    front.clear();
    back .clear();
    EXPECT_TRUE( view.empty() );
}

TEST( chain_map_proxy, iterator_copies_advance_independently )
{
    dict const first { { "a", 1 } };
    dict const second{ { "a", 2 }, { "b", 2 } };
    proxy const p{ first, second };

    auto const start{ p.begin() };
    auto       other{ start };
    ++other;
    EXPECT_EQ( *start, "a" );
    EXPECT_EQ( *other, "b" );
    EXPECT_NE( start, other );
    ++other;
    EXPECT_EQ( other, p.end() );
}

TEST( chain_map_proxy, emptiness )
{
    proxy const empty;
    EXPECT_TRUE( empty.empty() );
    EXPECT_EQ( empty.size(), 0 );
    EXPECT_EQ( empty.maps().size(), 1 );
    EXPECT_EQ( empty.begin(), empty.end() );

    dict const layer{ { "k", 1 } };
    EXPECT_FALSE( empty.new_child( layer ).empty() );
}

//==============================================================================
// Derived proxies
//==============================================================================

TEST( chain_map_proxy, new_child_shadows_without_touching_parents )
{
    dict const base{ { "a", 1 }, { "b", 2 } };
    proxy const p{ base };

    auto const child{ p.new_child( { { "a", 10 } } ) };
    EXPECT_EQ( child[ "a" ], 10 );
    EXPECT_EQ( child[ "b" ], 2 );
    EXPECT_EQ( child.maps().size(), 2 );
    EXPECT_EQ( p[ "a" ], 1 );

    auto const grandchild{ child.new_child() };
    EXPECT_EQ( grandchild.maps().size(), 3 );
    EXPECT_TRUE( grandchild.maps().front()->empty() );
    EXPECT_EQ( grandchild[ "a" ], 10 );
}

TEST( chain_map_proxy, new_child_with_map_and_entries_updates_the_map )
{
    dict const base{ { "a", 1 } };
    dict overrides{ { "b", 2 } };
    proxy const p{ base };

    auto const child{ p.new_child( overrides, { { "a", 5 } } ) };
    EXPECT_EQ( overrides.at( "a" ), 5 );
    EXPECT_EQ( child[ "a" ], 5 );

    overrides[ "b" ] = 20;
    EXPECT_EQ( child[ "b" ], 20 );
}

TEST( chain_map_proxy, new_child_owns_temporaries )
{
    proxy const p;
    auto const child{ p.new_child( dict{ { "t", 1 } } ) };
    EXPECT_EQ( child[ "t" ], 1 );
}

TEST( chain_map_proxy, constructor_owns_temporaries )
{
    dict const borrowed{ { "b", 2 } };
    proxy const p{ dict{ { "a", 1 } }, borrowed, std::map<std::string, int>{ { "c", 3 } } };

    EXPECT_TRUE( p.contains( "a" ) );
    EXPECT_EQ( p[ "a" ], 1 );
    EXPECT_EQ( p[ "b" ], 2 );
    EXPECT_EQ( p[ "c" ], 3 );
    EXPECT_EQ( p.size(), 3 );
}

TEST( chain_map_proxy, parents )
{
    dict const first { { "a", 1 } };
    dict const second{ { "a", 2 } };
    proxy const p{ first, second };

    auto const up{ p.parents() };
    EXPECT_EQ( up[ "a" ], 2 );
    EXPECT_EQ( up.maps().size(), 1 );

    auto const top{ up.parents() };
    EXPECT_EQ( top.maps().size(), 1 );
    EXPECT_TRUE( top.empty() );
}

TEST( chain_map_proxy, copy_shares_layers )
{
    dict layer{ { "a", 1 } };
    proxy const p{ layer };
    auto const copy{ p.copy() };
    EXPECT_EQ( copy.maps().front(), p.maps().front() );
    layer[ "a" ] = 2;
    EXPECT_EQ( copy[ "a" ], 2 );
}

TEST( chain_map_proxy, fromkeys )
{
    auto const p{ proxy::fromkeys( std::vector<std::string>{ "x", "y" }, 0 ) };
    EXPECT_EQ( p.size(), 2 );
    EXPECT_EQ( p[ "y" ], 0 );
}

//==============================================================================
// Materialization
//==============================================================================

TEST( chain_map_proxy, to_dict_and_merge_operators )
{
    dict const first { { "a", 1 } };
    dict const second{ { "a", 2 }, { "b", 2 } };
    proxy const p{ first, second };

    EXPECT_EQ( p.to_dict(), ( dict{ { "a", 1 }, { "b", 2 } } ) );

    dict const other{ { "a", 7 }, { "c", 7 } };
    EXPECT_EQ( p | other, ( dict{ { "a", 7 }, { "b", 2 }, { "c", 7 } } ) );
    EXPECT_EQ( other | p, ( dict{ { "a", 1 }, { "b", 2 }, { "c", 7 } } ) );
}

TEST( chain_map_proxy, merge_operators_with_sorted_dict )
{
    sorted_dict<std::string, int> const sorted{ { "a", 7 }, { "c", 7 } };
    dict const layer{ { "a", 1 }, { "b", 2 } };
    proxy const p{ layer };

    EXPECT_EQ( sorted | p, ( dict{ { "a", 1 }, { "b", 2 }, { "c", 7 } } ) );
    EXPECT_EQ( p | sorted, ( dict{ { "a", 7 }, { "b", 2 }, { "c", 7 } } ) );
}

TEST( chain_map_proxy, absent_keys_fall_through_layers )
{
    dict const front{ { "a", 1 } };
    dict const back { { "b", 2 } };
    proxy inner{ front };
    static int const fallback{ 0 };
    inner.set_missing_handler( []( std::string const & ) -> int const & { return fallback; } );

    // the layer's own handler is not consulted, the next layer is
    auto const outer{ proxy{ back }.new_child( inner ) };
    EXPECT_EQ( outer[ "b" ], 2 );
    EXPECT_THROW( std::ignore = outer[ "z" ], key_error );
}

TEST( chain_map_proxy, print )
{
    std::map<std::string, int> const first { { "a", 1 } };
    std::map<std::string, int> const second{ { "b", 2 } };
    std::ostringstream os;
    os << proxy{ first, second };
    EXPECT_EQ( os.str(), "chain_map_proxy({a: 1}, {b: 2})" );
}

//------------------------------------------------------------------------------
} // namespace psi::collections
//------------------------------------------------------------------------------
