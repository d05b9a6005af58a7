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

#ifndef OLSPELL_SPELLER_POOL_H_
#define OLSPELL_SPELLER_POOL_H_ 1

#include "olspell-stdafx.h"

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "ospell.h"

namespace olspell
{

    //! @brief Fixed set of threads answering queries on one Speller.
    //!
    //! The threads share nothing but the speller, which is immutable.
    //! Submitting blocks while @c max_pending queries are waiting.
    class OLSPELL_API SpellerPool
    {
    public:
        //! @brief start @a threads workers, at least one
        SpellerPool(std::shared_ptr<const Speller> speller,
                    unsigned int threads,
                    size_t max_pending);
        //! @brief answer every query submitted so far, then stop
        ~SpellerPool();

        std::future<bool> submit_check(const std::string& word,
                                       const SpellerConfig& config = SpellerConfig());
        std::future<CorrectionResult> submit_suggest(const std::string& word,
                                                     const SpellerConfig& config = SpellerConfig());

        size_t thread_count() const;

    private:
        SpellerPool(const SpellerPool&);
        SpellerPool& operator=(const SpellerPool&);

        void enqueue(const std::function<void()>& task);
        void work();

        std::shared_ptr<const Speller> speller_;
        size_t max_pending_;
        std::deque<std::function<void()> > tasks_;
        std::mutex mutex_;
        std::condition_variable task_ready_;
        std::condition_variable slot_free_;
        bool stopping_;
        std::vector<std::thread> workers_;
    };

} // namespace olspell

#endif // OLSPELL_SPELLER_POOL_H_
