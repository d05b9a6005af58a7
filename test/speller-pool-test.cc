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

#include <stdexcept>

#include "speller-pool.h"
#include "transducer-builder.h"

using namespace olspell;

class SpellerPoolTest : public testing::Test
{
protected:
    SpellerPoolTest()
    {
        TransducerBuilder errmodel = identity_error_model("abcdot");
        errmodel.add_arc(0, "a", "o", 0, 1.0);
        errmodel.add_arc(0, "o", "a", 0, 1.0);
        std::vector<std::string> lexicon;
        lexicon.push_back("cat");
        lexicon.push_back("cot");
        lexicon.push_back("dot");
        lexicon.push_back("bat");
        speller.reset(new Speller(errmodel.transducer(), make_lexicon(lexicon)));

        queries.push_back("cat");
        queries.push_back("dat");
        queries.push_back("bot");
        queries.push_back("cab");
        queries.push_back("Dot");
        queries.push_back("cot");
    }

    std::shared_ptr<const Speller> speller;
    std::vector<std::string> queries;
};

TEST_F(SpellerPoolTest, answers_like_the_speller)
{
    SpellerPool pool(speller, 4, 2);
    EXPECT_EQ(4u, pool.thread_count());

    std::vector<std::future<CorrectionResult> > suggestions;
    std::vector<std::future<bool> > checks;
    for (int round = 0; round < 5; ++round) {
        for (size_t i = 0; i < queries.size(); ++i) {
            suggestions.push_back(pool.submit_suggest(queries[i]));
            checks.push_back(pool.submit_check(queries[i]));
        }
    }
    for (size_t i = 0; i < suggestions.size(); ++i) {
        const std::string& word = queries[i % queries.size()];
        CorrectionResult expected = speller->correct(word);
        CorrectionResult got = suggestions[i].get();
        EXPECT_EQ(expected.corrections, got.corrections) << word;
        EXPECT_EQ(expected.status, got.status);
        EXPECT_EQ(speller->check(word, SpellerConfig()), checks[i].get()) << word;
    }
}

TEST_F(SpellerPoolTest, finishes_queued_work_on_destruction)
{
    std::vector<std::future<bool> > checks;
    {
        SpellerPool pool(speller, 1, 100);
        for (size_t i = 0; i < queries.size(); ++i) {
            checks.push_back(pool.submit_check(queries[i]));
        }
    }
    for (size_t i = 0; i < checks.size(); ++i) {
        ASSERT_TRUE(checks[i].valid());
        EXPECT_EQ(speller->check(queries[i], SpellerConfig()), checks[i].get());
    }
}

TEST_F(SpellerPoolTest, uses_at_least_one_thread)
{
    SpellerPool pool(speller, 0, 0);
    EXPECT_EQ(1u, pool.thread_count());
    EXPECT_TRUE(pool.submit_check("cat").get());
}

TEST(SpellerPoolSetupTest, needs_a_speller)
{
    EXPECT_THROW(SpellerPool(std::shared_ptr<const Speller>(), 1, 1),
                 std::invalid_argument);
}
