#include <stdexcept>
#include <catch2/catch.hpp>
#include "fold/fold.h"

using Pairs = std::vector<Fold::Pair>;

TEST_CASE( "make_paren marks each pair once", "[render]" ) {
    CHECK( Fold::make_paren(Pairs{{0, 4}, {1, 3}}, 5) == "{{.}}" );
    CHECK( Fold::make_paren(Pairs{}, 3) == "..." );
    CHECK( Fold::make_paren(Pairs{}, 0) == "" );
}

TEST_CASE( "make_stacked_paren promotes the neighbouring positions", "[render]" ) {
    // k+1 and j+1 join the pair
    CHECK( Fold::make_stacked_paren(Pairs{{0, 4}}, 6) == "{{..}}" );
    // the opening side keeps an existing mark at k+1
    CHECK( Fold::make_stacked_paren(Pairs{{0, 1}}, 3) == "{{}" );
    // j keeps an existing mark, j+1 is overwritten
    CHECK( Fold::make_stacked_paren(Pairs{{2, 5}, {0, 2}}, 7) == "{{{}.}}" );
    CHECK( Fold::make_stacked_paren(Pairs{{3, 5}, {0, 2}}, 7) == "{{}}{}}" );
}

TEST_CASE( "parse_paren inverts make_paren", "[render]" ) {
    auto p = Fold::parse_paren("{.{}.}{}");
    REQUIRE( p.size() == 3 );
    CHECK( p[0] == Fold::Pair(2, 3) );
    CHECK( p[1] == Fold::Pair(0, 5) );
    CHECK( p[2] == Fold::Pair(6, 7) );
    CHECK( Fold::make_paren(p, 8) == "{.{}.}{}" );

    CHECK_THROWS_AS( Fold::parse_paren("{{}"), std::runtime_error );
    CHECK_THROWS_AS( Fold::parse_paren("}"), std::runtime_error );
}

TEST_CASE( "validate_sequence accepts only ACGU", "[validate]" ) {
    CHECK_NOTHROW( Fold::validate_sequence("") );
    CHECK_NOTHROW( Fold::validate_sequence("ACGUUGCA") );
    CHECK_THROWS_AS( Fold::validate_sequence("ACGT"), std::invalid_argument );
    CHECK_THROWS_WITH( Fold::validate_sequence("ACxU"), Catch::Contains("position 3") );
    CHECK_THROWS_AS( Fold::validate_sequence("acgu"), std::invalid_argument );
}

TEST_CASE( "Options defaults", "[options]" ) {
    Fold::Options o;
    CHECK( o.min_hairpin == 0 );
    CHECK( o.trace_bifurcation );
    o.min_hairpin_loop_length(3).bifurcation_traceback(false);
    CHECK( o.min_hairpin == 3 );
    CHECK_FALSE( o.trace_bifurcation );
}
