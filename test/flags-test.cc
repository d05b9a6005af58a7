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

#include "flags.h"
#include "ospell.h"
#include "transducer-builder.h"

using namespace olspell;

namespace {

const SymbolNumber X = 0;
const ValueNumber A = 1;
const ValueNumber B = 2;

FlagDiacriticState unset()
{
    return FlagDiacriticState(1, 0);
}

bool apply(FlagDiacriticOperator op, ValueNumber value,
           FlagDiacriticState& state)
{
    FlagDiacriticState updated;
    if (!try_apply(FlagDiacriticOperation(op, X, value), state, updated)) {
        return false;
    }
    state = updated;
    return true;
}

// lexicon: @P.X.a@ c @R.X.<required>@
HfstTransducerPtr set_then_require(const std::string& required)
{
    TransducerBuilder builder;
    unsigned int s1 = builder.add_state();
    unsigned int s2 = builder.add_state();
    unsigned int s3 = builder.add_state();
    builder.add_arc(0, "@P.X.a@", "@P.X.a@", s1);
    builder.add_arc(s1, "c", "c", s2);
    std::string flag = "@R.X." + required + "@";
    builder.add_arc(s2, flag, flag, s3);
    builder.set_final(s3);
    return builder.transducer();
}

} // anonymous namespace

TEST(FlagTest, positive_set_then_require)
{
    FlagDiacriticState state = unset();
    ASSERT_TRUE(apply(P, A, state));
    EXPECT_EQ(A, state[X]);
    EXPECT_TRUE(apply(R, A, state));
    EXPECT_FALSE(apply(R, B, state));
    EXPECT_TRUE(apply(R, 0, state));
}

TEST(FlagTest, plain_require_needs_a_value)
{
    FlagDiacriticState state = unset();
    EXPECT_FALSE(apply(R, 0, state));
}

TEST(FlagTest, negative_set_and_unify)
{
    FlagDiacriticState state = unset();
    ASSERT_TRUE(apply(N, A, state));
    EXPECT_EQ(-A, state[X]);
    // negatively set to a, so b unifies but a does not
    EXPECT_FALSE(apply(U, A, state));
    EXPECT_TRUE(apply(U, B, state));
    EXPECT_EQ(B, state[X]);
    EXPECT_TRUE(apply(U, B, state));
    EXPECT_FALSE(apply(U, A, state));
}

TEST(FlagTest, disallow_and_clear)
{
    FlagDiacriticState state = unset();
    EXPECT_TRUE(apply(D, 0, state));
    ASSERT_TRUE(apply(P, A, state));
    EXPECT_FALSE(apply(D, 0, state));
    EXPECT_FALSE(apply(D, A, state));
    EXPECT_TRUE(apply(D, B, state));
    ASSERT_TRUE(apply(C, 0, state));
    EXPECT_EQ(0, state[X]);
    EXPECT_TRUE(apply(D, 0, state));
}

TEST(FlagTest, failure_leaves_state_alone)
{
    FlagDiacriticState current(1, A);
    FlagDiacriticState updated(1, 7);
    EXPECT_FALSE(try_apply(FlagDiacriticOperation(R, X, B), current, updated));
    EXPECT_EQ(7, updated[X]);
    EXPECT_EQ(A, current[X]);
}

TEST(FlagTest, unknown_feature_fails)
{
    FlagDiacriticState current(1, 0);
    FlagDiacriticState updated;
    EXPECT_FALSE(try_apply(FlagDiacriticOperation(P, 3, A), current, updated));
}

TEST(FlagTest, lexicon_paths_obey_flags)
{
    Speller matching(HfstTransducerPtr(), set_then_require("a"));
    EXPECT_TRUE(matching.check("c"));

    Speller clashing(HfstTransducerPtr(), set_then_require("b"));
    EXPECT_FALSE(clashing.check("c"));
}
