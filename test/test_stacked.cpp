#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <catch2/catch.hpp>
#include "fold/nussinov.h"
#include "fold/prediction.h"
#include "param/stacking.h"

namespace
{
    auto fold_stacked(const std::string& seq, const StackingTable& t = StackingTable::uniform(), size_t gap = 0)
    {
        return predict_nussinov<StackedPairScore>(seq, t, Fold::Options().min_hairpin_loop_length(gap));
    }
}

TEST_CASE( "dinucleotide indices", "[stacking]" ) {
    CHECK( StackingTable::index('A', 'U') == 0 );
    CHECK( StackingTable::index('U', 'A') == 1 );
    CHECK( StackingTable::index('G', 'C') == 2 );
    CHECK( StackingTable::index('C', 'G') == 3 );
    CHECK( StackingTable::index('G', 'U') == 4 );
    CHECK( StackingTable::index('U', 'G') == 5 );
    CHECK( StackingTable::index('A', 'A') == -1 );
    CHECK( StackingTable::index('G', 'G') == -1 );
    CHECK( StackingTable::index('A', '\0') == -1 );
    CHECK( StackingTable::name(4) == "GU" );
}

TEST_CASE( "StackingTable rejects bad entries", "[stacking]" ) {
    StackingTable t;
    CHECK( t.score(0, 0) == 0 );
    CHECK_THROWS_AS( t.set(6, 0, 1), std::out_of_range );
    CHECK_THROWS_AS( t.set(0, 0, -1), std::invalid_argument );
    CHECK_THROWS_AS( t.set(0, 0, StackingTable::MAX_SCORE+1), std::invalid_argument );
    t.set(2, 3, 4);
    CHECK( t.score(2, 3) == 4 );
    CHECK( StackingTable::uniform().score(5, 5) == 1 );
}

TEST_CASE( "stacked model legality needs both dinucleotides", "[stacking]" ) {
    // dinucleotides: GC CA AU UG G-
    StackedPairScore p("GCAUG", StackingTable::uniform());
    REQUIRE( p.size() == 5 );
    CHECK( p.allow_paired(0, 2) );
    CHECK( p.allow_paired(0, 3) );
    CHECK_FALSE( p.allow_paired(0, 1) );
    CHECK_FALSE( p.allow_paired(2, 4) ); // the last position has no successor
    CHECK( p.score_paired(0, 2) == 1 );
}

TEST_CASE( "three dinucleotide positions", "[stacking]" ) {
    auto r = fold_stacked("GCG");
    CHECK( r.score == 1 );
    REQUIRE( r.pairs.size() == 1 );
    CHECK( r.pairs[0] == Fold::Pair(0, 1) );
    // k, k+1 open; j already open; j+1 closes
    CHECK( *r.structure == "{{}" );
}

TEST_CASE( "stacked helices", "[stacking]" ) {
    auto r = fold_stacked("GCAUCCGGAUGC");
    CHECK( r.score == 3 );
    CHECK( *r.structure == "{{{{.{{.}}}}" );
    REQUIRE( r.pairs.size() == 3 );
    CHECK( r.pairs[0] == Fold::Pair(0, 10) );
    CHECK( r.pairs[1] == Fold::Pair(2, 9) );
    CHECK( r.pairs[2] == Fold::Pair(5, 8) );

    auto t = fold_stacked("GCAUCCGGAUGCA");
    CHECK( t.score == 3 );
    CHECK( *t.structure == "{{{{.{{.}}}}." );

    auto w = fold_stacked("GUUG");
    CHECK( w.score == 1 );
    CHECK( *w.structure == "{{}}" );
}

TEST_CASE( "stacked model with a non-uniform matrix", "[stacking]" ) {
    auto m = StackingTable::uniform();
    m.set(2, 3, 4).set(3, 2, 4); // GC/CG stacks score 4

    auto r = fold_stacked("GCGC", m);
    CHECK( r.score == 4 );
    CHECK( *r.structure == "{{}." );

    auto h = fold_stacked("GCAUCCGGAUGC", m);
    CHECK( h.score == 6 );
    CHECK( *h.structure == "{{}}.{{.{{}}" );
    REQUIRE( h.pairs.size() == 3 );
    CHECK( h.pairs[0] == Fold::Pair(5, 10) );
}

TEST_CASE( "stacked model degenerate inputs", "[stacking]" ) {
    CHECK( fold_stacked("").score == 0 );
    CHECK( fold_stacked("").structure->empty() );
    CHECK( *fold_stacked("A").structure == "." );
    auto r = fold_stacked("GGGAAACCC");
    CHECK( r.score == 0 );
    CHECK( *r.structure == "........." );
}

TEST_CASE( "stacked table and traceback invariants on random sequences", "[stacking][property]" ) {
    std::mt19937 rng(11);
    std::uniform_int_distribution<int> base(0, 3);
    const std::string alphabet = "ACGU";
    for (auto t=0; t!=200; ++t)
    {
        std::string seq(std::uniform_int_distribution<int>(0, 24)(rng), ' ');
        for (auto& c : seq) c = alphabet[base(rng)];
        const auto gap = std::uniform_int_distribution<size_t>(0, 3)(rng);
        const auto opts = Fold::Options().min_hairpin_loop_length(gap);

        Nussinov<StackedPairScore> f(std::make_unique<StackedPairScore>(seq, StackingTable::uniform()));
        const auto sc = f.compute_viterbi(seq, opts);
        const auto& dp = f.table();
        const int L = seq.size();

        for (auto i=0; i<L; ++i)
        {
            REQUIRE( dp.at(i, i) == 0 );
            REQUIRE( dp.at(i, i-1) == 0 );
            for (auto j=i+1; j<L; ++j)
            {
                REQUIRE( dp.at(i, j) >= dp.at(i, j-1) );
                REQUIRE( dp.at(i, j) >= dp.at(i+1, j) );
                if (j-i <= static_cast<int>(gap))
                    REQUIRE( dp.at(i, j) == 0 );
            }
        }

        const auto pairs = f.traceback_viterbi();
        auto total = 0;
        for (const auto& [k, j] : pairs)
        {
            REQUIRE( k < j );
            REQUIRE( j-k > gap );
            REQUIRE( f.param_model().allow_paired(k, j) );
            total += f.param_model().score_paired(k, j);
        }
        CHECK( total == sc );

        for (const auto& [k1, j1] : pairs)
            for (const auto& [k2, j2] : pairs)
                if (k1 < k2)
                    REQUIRE( (j1 < k2 || j2 < j1) );

        CHECK( f.param_model().make_paren(pairs).size() == seq.size() );
    }
}

TEST_CASE( "stacked prediction is deterministic", "[stacking][property]" ) {
    std::mt19937 rng(5);
    std::uniform_int_distribution<int> base(0, 3);
    const std::string alphabet = "ACGU";
    auto m = StackingTable::uniform();
    m.set(2, 3, 4).set(3, 2, 4).set(0, 1, 2);
    for (auto t=0; t!=20; ++t)
    {
        std::string seq(40, ' ');
        for (auto& c : seq) c = alphabet[base(rng)];
        auto a = fold_stacked(seq, m, 1);
        auto b = fold_stacked(seq, m, 1);
        CHECK( a.score == b.score );
        CHECK( *a.structure == *b.structure );
        CHECK( a.pairs == b.pairs );
    }
}
