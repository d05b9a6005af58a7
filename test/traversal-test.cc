// Copyright 2010 University of Helsinki
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include <gtest/gtest.h>

#include "transducer-builder.h"
#include "traversal.h"

using namespace olspell;

class TraversalTest : public testing::Test
{
protected:
    // start state: ε:e, @P.F.v@, @R.F.w@, a:a, @_IDENTITY_SYMBOL_@, @_UNKNOWN_SYMBOL_@:u
    TraversalTest()
    {
        TransducerBuilder builder;
        unsigned int s1 = builder.add_state();
        builder.add_arc(0, "", "e", s1, 0.5);
        builder.add_arc(0, "@P.F.v@", "@P.F.v@", s1);
        builder.add_arc(0, "@R.F.w@", "@R.F.w@", s1);
        builder.add_arc(0, "a", "a", s1);
        builder.add_arc(0, "@_IDENTITY_SYMBOL_@", "@_IDENTITY_SYMBOL_@", s1, 1.0);
        builder.add_arc(0, "@_UNKNOWN_SYMBOL_@", "u", s1, 2.0);
        builder.set_final(s1);
        t = builder.transducer();
    }

    HfstTransducerPtr t;
};

TEST_F(TraversalTest, epsilon_steps_apply_flags)
{
    TraversalStepVector steps;
    SearchStats stats;
    FlagDiacriticState flags(t->get_state_size(), 0);
    epsilon_steps(*t, 0, flags, steps, stats);

    // the epsilon and @P.F.v@ pass, @R.F.w@ needs F=w
    ASSERT_EQ(2u, steps.size());
    EXPECT_EQ(0, steps[0].input);
    EXPECT_EQ(t->get_alphabet().id_for_text("e"), steps[0].transition.symbol);
    EXPECT_FLOAT_EQ(0.5, steps[0].transition.weight);
    EXPECT_EQ(flags, steps[0].flags);
    EXPECT_TRUE(t->is_flag(steps[1].input));
    EXPECT_NE(0, steps[1].flags[0]);
    EXPECT_EQ(1u, stats.flag_rejections);
}

TEST_F(TraversalTest, insertion_steps_skip_flags)
{
    TraversalStepVector steps;
    insertion_steps(*t, 0, steps);
    ASSERT_EQ(1u, steps.size());
    EXPECT_EQ(t->get_alphabet().id_for_text("e"), steps[0].transition.symbol);
}

TEST_F(TraversalTest, symbol_steps_fall_back_to_identity_and_unknown)
{
    SymbolNumber a = t->get_alphabet().id_for_text("a");
    TraversalStepVector known;
    symbol_steps(*t, 0, a, true, known);
    ASSERT_EQ(1u, known.size());
    EXPECT_EQ(a, known[0].input);
    EXPECT_EQ(a, known[0].transition.symbol);

    // a number past the alphabet
    TraversalStepVector foreign;
    symbol_steps(*t, 0, 200, false, foreign);
    ASSERT_EQ(2u, foreign.size());
    EXPECT_EQ(t->get_identity(), foreign[0].input);
    EXPECT_FLOAT_EQ(1.0, foreign[0].transition.weight);
    EXPECT_EQ(t->get_unknown(), foreign[1].input);
    EXPECT_EQ(t->get_alphabet().id_for_text("u"), foreign[1].transition.symbol);
}

TEST(TraversalBoundTest, cuts_branches_over_the_limit)
{
    TraversalBound bound(3);
    EXPECT_EQ(3u, bound.limit());
    EXPECT_EQ(Continue, bound.check(0));
    EXPECT_EQ(Continue, bound.check(3));
    EXPECT_EQ(CycleBound, bound.check(4));
}

TEST(SearchStatsTest, adds_up)
{
    SearchStats a;
    a.nodes_expanded = 2;
    a.memo_discards = 1;
    SearchStats b;
    b.nodes_expanded = 3;
    b.cycle_bound_prunes = 4;
    a += b;
    EXPECT_EQ(5u, a.nodes_expanded);
    EXPECT_EQ(4u, a.cycle_bound_prunes);
    EXPECT_EQ(1u, a.memo_discards);
    EXPECT_EQ(0u, a.flag_rejections);
}
