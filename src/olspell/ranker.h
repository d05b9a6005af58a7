/* -*- Mode: C++ -*- */
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

#ifndef OLSPELL_RANKER_H_
#define OLSPELL_RANKER_H_ 1

#include "olspell-stdafx.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "hfst-ol.h"

namespace olspell
{

    typedef std::pair<std::string, Weight> StringWeightPair;
    typedef std::vector<StringWeightPair> StringWeightVector;

    //! @brief Collects suggestions, one entry per distinct string.
    //!
    //! A string keeps the lowest weight it was offered with and the
    //! position at which it was first offered; results() orders by weight
    //! and falls back on that position for equal weights.
    class OLSPELL_API SuggestionRanker
    {
    public:
        //! @brief ranker giving at most @a max_count results, 0 for all
        explicit SuggestionRanker(unsigned long max_count = 0);

        //! @brief offer @a string with @a weight
        //! @return true when @a string had not been seen before
        bool add(const std::string& string, Weight weight);
        //! @brief offer every pair in @a suggestions in order
        void add(const StringWeightVector& suggestions);

        //! @brief distinct strings so far
        size_t size() const;
        bool empty() const;

        StringWeightVector results() const;

    private:
        struct Entry
        {
            Weight weight;
            unsigned long discovered;
        };

        unsigned long max_count_;
        std::map<std::string, Entry> best_;
    };

} // namespace olspell

#endif // OLSPELL_RANKER_H_
