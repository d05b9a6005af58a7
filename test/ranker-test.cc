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

#include "ranker.h"

using namespace olspell;

TEST(SuggestionRankerTest, orders_by_weight_then_discovery)
{
    SuggestionRanker ranker;
    EXPECT_TRUE(ranker.empty());
    EXPECT_TRUE(ranker.add("dog", 2.0));
    EXPECT_TRUE(ranker.add("cat", 1.0));
    EXPECT_TRUE(ranker.add("cot", 2.0));
    EXPECT_TRUE(ranker.add("cut", 1.0));

    StringWeightVector rv = ranker.results();
    ASSERT_EQ(4u, rv.size());
    EXPECT_EQ("cat", rv[0].first);
    EXPECT_EQ("cut", rv[1].first);
    EXPECT_EQ("dog", rv[2].first);
    EXPECT_EQ("cot", rv[3].first);
}

TEST(SuggestionRankerTest, keeps_lowest_weight_of_duplicates)
{
    SuggestionRanker ranker;
    EXPECT_TRUE(ranker.add("cat", 3.0));
    EXPECT_TRUE(ranker.add("cot", 2.0));
    EXPECT_FALSE(ranker.add("cat", 1.0));
    EXPECT_FALSE(ranker.add("cat", 5.0));
    EXPECT_EQ(2u, ranker.size());

    StringWeightVector rv = ranker.results();
    ASSERT_EQ(2u, rv.size());
    EXPECT_EQ("cat", rv[0].first);
    EXPECT_FLOAT_EQ(1.0, rv[0].second);
}

TEST(SuggestionRankerTest, truncates_to_max_count)
{
    SuggestionRanker ranker(2);
    StringWeightVector input;
    input.push_back(StringWeightPair("c", 3.0));
    input.push_back(StringWeightPair("a", 1.0));
    input.push_back(StringWeightPair("b", 2.0));
    ranker.add(input);
    EXPECT_EQ(3u, ranker.size());

    StringWeightVector rv = ranker.results();
    ASSERT_EQ(2u, rv.size());
    EXPECT_EQ("a", rv[0].first);
    EXPECT_EQ("b", rv[1].first);
}
