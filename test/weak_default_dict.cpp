////////////////////////////////////////////////////////////////////////////////
/// psi::collections weak default dictionary unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/collections/weak_default_dict.hpp>
#include <psi/collections/print.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>
#include <tuple>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::collections {
//------------------------------------------------------------------------------

namespace
{
    struct texture
    {
        explicit texture( std::string n ) : name{ std::move( n ) } {}
        std::string name;
    };
} // anonymous namespace

//==============================================================================
// weak_value_default_dictionary
//==============================================================================

TEST( weak_value_default_dictionary, factory_runs_once_per_live_value )
{
    int calls{ 0 };
    weak_value_default_dictionary<std::string, texture> cache{ [&calls] {
        ++calls;
        return std::make_shared<texture>( "generated" );
    } };

    auto const first{ cache[ "grass" ] };
    auto const again{ cache[ "grass" ] };
    EXPECT_EQ( calls, 1 );
    EXPECT_EQ( first, again );
    EXPECT_EQ( first->name, "generated" );
    EXPECT_TRUE( cache.contains( "grass" ) );
    EXPECT_EQ( cache.size(), 1 );
}

TEST( weak_value_default_dictionary, entry_vanishes_with_its_value )
{
    int calls{ 0 };
    weak_value_default_dictionary<std::string, texture> cache{ [&calls] {
        ++calls;
        return std::make_shared<texture>( "fresh" );
    } };

    auto value{ cache[ "rock" ] };
    value.reset();
    EXPECT_FALSE( cache.contains( "rock" ) );
    EXPECT_EQ( cache.size(), 0 );

    auto const recreated{ cache[ "rock" ] };
    EXPECT_EQ( calls, 2 );
    EXPECT_TRUE( cache.contains( "rock" ) );
}

TEST( weak_value_default_dictionary, lookups_without_factory )
{
    weak_value_default_dictionary<int, texture> cache;
    auto const stone{ std::make_shared<texture>( "stone" ) };
    EXPECT_TRUE ( cache.insert_or_assign( 1, stone ) );
    EXPECT_FALSE( cache.insert_or_assign( 1, stone ) );

    EXPECT_EQ( cache[ 1 ], stone );
    EXPECT_EQ( cache.at( 1 ), stone );
    EXPECT_EQ( cache.find( 2 ), nullptr );
    EXPECT_EQ( cache.get( 2, stone ), stone );
    EXPECT_THROW( std::ignore = cache[ 2 ], key_error );
    EXPECT_THROW( std::ignore = cache.at( 2 ), key_error );
    EXPECT_THROW( cache.insert_or_assign( 3, nullptr ), std::invalid_argument );

    EXPECT_TRUE ( cache.erase( 1 ) );
    EXPECT_FALSE( cache.erase( 1 ) );
    EXPECT_TRUE ( cache.empty() );
}

TEST( weak_value_default_dictionary, at_never_calls_the_factory )
{
    int calls{ 0 };
    weak_value_default_dictionary<int, int> cache{ [&calls] { ++calls; return std::make_shared<int>( 0 ); } };
    EXPECT_THROW( std::ignore = cache.at( 5 ), key_error );
    EXPECT_EQ( calls, 0 );
    EXPECT_FALSE( cache.contains( 5 ) );
}

TEST( weak_value_default_dictionary, null_factory_result_is_rejected )
{
    weak_value_default_dictionary<int, int> cache{ [] { return std::shared_ptr<int>{}; } };
    EXPECT_THROW( std::ignore = cache[ 0 ], std::invalid_argument );
    EXPECT_TRUE( cache.empty() );
}

TEST( weak_value_default_dictionary, prune_and_factory_swap )
{
    weak_value_default_dictionary<int, int> cache;
    auto a{ std::make_shared<int>( 1 ) };
    auto b{ std::make_shared<int>( 2 ) };
    cache.insert_or_assign( 1, a );
    cache.insert_or_assign( 2, b );
    a.reset();
    b.reset();
    EXPECT_EQ( cache.prune(), 2 );
    EXPECT_EQ( cache.prune(), 0 );

    EXPECT_FALSE( cache.default_factory() );
    cache.set_default_factory( [] { return std::make_shared<int>( 7 ); } );
    EXPECT_EQ( *cache[ 9 ], 7 );
}

//==============================================================================
// weak_key_default_dictionary
//==============================================================================

TEST( weak_key_default_dictionary, factory_populates_missing_keys )
{
    int calls{ 0 };
    weak_key_default_dictionary<texture, std::vector<int>> usage{ [&calls] { ++calls; return std::vector<int>{}; } };

    auto const grass{ std::make_shared<texture>( "grass" ) };
    usage[ grass ].push_back( 1 );
    usage[ grass ].push_back( 2 );
    EXPECT_EQ( calls, 1 );
    EXPECT_EQ( usage.at( grass ), ( std::vector<int>{ 1, 2 } ) );
    EXPECT_EQ( usage.size(), 1 );
}

TEST( weak_key_default_dictionary, null_key_is_rejected_before_the_factory_runs )
{
    int calls{ 0 };
    weak_key_default_dictionary<texture, int> counts{ [&calls] { ++calls; return 0; } };
    EXPECT_THROW( counts[ nullptr ], std::invalid_argument );
    EXPECT_EQ( calls, 0 );
    EXPECT_TRUE( counts.empty() );
}

TEST( weak_key_default_dictionary, entry_vanishes_with_its_key )
{
    weak_key_default_dictionary<texture, int> counts{ [] { return 0; } };
    auto       grass{ std::make_shared<texture>( "grass" ) };
    auto const rock { std::make_shared<texture>( "rock"  ) };
    ++counts[ grass ];
    ++counts[ rock  ];
    EXPECT_EQ( counts.size(), 2 );

    grass.reset();
    EXPECT_EQ( counts.size(), 1 );
    EXPECT_TRUE( counts.contains( rock ) );

    std::vector<std::string> names;
    counts.for_each( [&names]( std::shared_ptr<texture> const & key, int const value ) {
        names.push_back( key->name + '=' + std::to_string( value ) );
    } );
    EXPECT_EQ( names, ( std::vector<std::string>{ "rock=1" } ) );
}

TEST( weak_key_default_dictionary, keys_compare_by_identity )
{
    weak_key_default_dictionary<texture, int> counts;
    auto const a { std::make_shared<texture>( "same" ) };
    auto const a2{ std::make_shared<texture>( "same" ) };
    EXPECT_TRUE( counts.insert_or_assign( a, 1 ) );
    EXPECT_FALSE( counts.contains( a2 ) );
    EXPECT_TRUE( counts.insert_or_assign( a2, 2 ) );
    EXPECT_FALSE( counts.insert_or_assign( a, 3 ) );
    EXPECT_EQ( counts.at( a ), 3 );
    EXPECT_EQ( counts.size(), 2 );
}

TEST( weak_key_default_dictionary, lookups_without_factory )
{
    weak_key_default_dictionary<texture, int> const empty;
    auto const key{ std::make_shared<texture>( "k" ) };
    EXPECT_THROW( std::ignore = empty.at( key ), key_error );
    EXPECT_EQ( empty.find( key ), nullptr );
    EXPECT_EQ( empty.get( key, 5 ), 5 );
    EXPECT_FALSE( empty.contains( nullptr ) );

    weak_key_default_dictionary<texture, int> counts;
    EXPECT_THROW( counts[ key ], key_error );
    EXPECT_TRUE( counts.empty() );
    EXPECT_THROW( counts.insert_or_assign( nullptr, 1 ), std::invalid_argument );
    counts.insert_or_assign( key, 1 );
    EXPECT_TRUE ( counts.erase( key ) );
    EXPECT_FALSE( counts.erase( key ) );
}

TEST( weak_key_default_dictionary, prune_reports_dropped_entries )
{
    weak_key_default_dictionary<int, char> marks{ [] { return 'x'; } };
    auto a{ std::make_shared<int>( 1 ) };
    auto b{ std::make_shared<int>( 2 ) };
    auto const c{ std::make_shared<int>( 3 ) };
    marks[ a ];
    marks[ b ];
    marks[ c ];
    a.reset();
    b.reset();
    EXPECT_EQ( marks.prune(), 2 );
    EXPECT_EQ( marks.prune(), 0 );
    EXPECT_EQ( marks.get( c ), 'x' );
}

TEST( weak_default_dictionaries, print )
{
    auto const key  { std::make_shared<int>( 4 ) };
    auto const value{ std::make_shared<std::string>( "four" ) };

    weak_key_default_dictionary<int, std::string> by_key;
    by_key.insert_or_assign( key, "four" );
    weak_value_default_dictionary<int, std::string> by_value;
    by_value.insert_or_assign( 4, value );

    std::ostringstream os;
    os << by_key << ' ' << by_value;
    EXPECT_EQ( os.str(), "weak_key_default_dictionary({4: four}) weak_value_default_dictionary({4: four})" );
}

//------------------------------------------------------------------------------
} // namespace psi::collections
//------------------------------------------------------------------------------
