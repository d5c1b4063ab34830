////////////////////////////////////////////////////////////////////////////////
/// psi::collections slice, comparator and deep_copy unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/collections/deep_copy.hpp>
#include <psi/collections/komparator.hpp>
#include <psi/collections/slice.hpp>

#include <gtest/gtest.h>

#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::collections {
//------------------------------------------------------------------------------

//==============================================================================
// slice
//==============================================================================

TEST( slice, forward_bounds_are_clamped )
{
    auto const all{ slice{}.indices( 5 ) };
    EXPECT_EQ( all.start , 0 );
    EXPECT_EQ( all.stop  , 5 );
    EXPECT_EQ( all.length, 5 );

    auto const tail{ slice{ -2, {} }.indices( 5 ) };
    EXPECT_EQ( tail.start , 3 );
    EXPECT_EQ( tail.length, 2 );

    EXPECT_EQ( ( slice{ {}, {}, 2 } ).indices( 5 ).length, 3 );
    EXPECT_EQ( ( slice{ 10, 20 } ).indices( 5 ).length, 0 );
    EXPECT_EQ( ( slice{ 3, 1 } ).indices( 5 ).length, 0 );
    EXPECT_EQ( ( slice{ -100, 2 } ).indices( 5 ).start, 0 );
}

TEST( slice, backward_bounds_are_clamped )
{
    auto const reversed{ slice{ {}, {}, -1 }.indices( 5 ) };
    EXPECT_EQ( reversed.start , 4 );
    EXPECT_EQ( reversed.stop  , -1 );
    EXPECT_EQ( reversed.length, 5 );

    EXPECT_EQ( ( slice{ 3, 0, -2 } ).indices( 5 ).length, 2 );
    EXPECT_EQ( ( slice{ {}, {}, -1 } ).indices( 0 ).length, 0 );
}

TEST( slice, zero_step_is_rejected )
{
    EXPECT_THROW( std::ignore = ( slice{ {}, {}, 0 } ).indices( 3 ), std::invalid_argument );
}

TEST( slice, normalize_index )
{
    EXPECT_EQ( detail::normalize_index(  0, 3 ), 0u );
    EXPECT_EQ( detail::normalize_index( -1, 3 ), 2u );
    EXPECT_FALSE( detail::normalize_index(  3, 3 ).has_value() );
    EXPECT_FALSE( detail::normalize_index( -4, 3 ).has_value() );
}

//==============================================================================
// total_less
//==============================================================================

TEST( total_less, orders_and_rejects_unordered_pairs )
{
    total_less<double> const less;
    double const nan{ std::numeric_limits<double>::quiet_NaN() };
    EXPECT_TRUE ( less( 1.0, 2.0 ) );
    EXPECT_FALSE( less( 2.0, 2.0 ) );
    EXPECT_THROW( std::ignore = less( nan, 1.0 ), ordering_error );

    total_less<> const transparent;
    EXPECT_TRUE( transparent( 1, 2.5 ) );
    EXPECT_TRUE( transparent( std::string{ "a" }, "b" ) );
}

TEST( total_less, komparator_derived_operations )
{
    Komparator<total_less<int>> const comp{};
    EXPECT_TRUE ( comp.le ( 1, 2 ) );
    EXPECT_TRUE ( comp.eq ( 2, 2 ) );
    EXPECT_TRUE ( comp.geq( 2, 2 ) );
    EXPECT_FALSE( comp.geq( 1, 2 ) );

    std::vector<int> const keys { 5, 2, 9, 1 };
    std::vector<int>       order{ 0, 1, 2, 3 };
    comp.sort_by( order.begin(), order.end(), [&]( int const l, int const r ) { return comp.le( keys[ l ], keys[ r ] ); } );
    EXPECT_EQ( order, ( std::vector<int>{ 3, 1, 0, 2 } ) );
}

//==============================================================================
// deep_copy
//==============================================================================

TEST( deep_copy, clones_nested_ownership )
{
    using inner = std::vector<std::shared_ptr<int>>;
    std::map<std::string, std::shared_ptr<inner>> source;
    source[ "k" ] = std::make_shared<inner>( inner{ std::make_shared<int>( 1 ) } );

    auto const clone{ deep_copy( source ) };
    ASSERT_EQ( clone.size(), 1 );
    EXPECT_NE( clone.at( "k" ), source.at( "k" ) );
    EXPECT_NE( clone.at( "k" )->front(), source.at( "k" )->front() );
    EXPECT_EQ( *clone.at( "k" )->front(), 1 );

    *source.at( "k" )->front() = 2;
    EXPECT_EQ( *clone.at( "k" )->front(), 1 );
}

TEST( deep_copy, containers_of_scalars )
{
    std::vector<int> const numbers{ 1, 2, 3 };
    EXPECT_EQ( deep_copy( numbers ), numbers );
    EXPECT_EQ( deep_copy( 5 ), 5 );

    std::map<int, double> const table{ { 1, 0.5 } };
    EXPECT_EQ( deep_copy( table ), table );
}

TEST( deep_copy, null_and_plain_values )
{
    EXPECT_EQ( deep_copy( std::shared_ptr<int>{} ), nullptr );
    EXPECT_EQ( deep_copy( std::string{ "text" } ), "text" );
    auto const owned{ deep_copy( std::make_unique<int>( 3 ) ) };
    EXPECT_EQ( *owned, 3 );
}

//------------------------------------------------------------------------------
} // namespace psi::collections
//------------------------------------------------------------------------------
