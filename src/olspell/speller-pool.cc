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

#include "speller-pool.h"

#include <stdexcept>

namespace olspell {

SpellerPool::SpellerPool(std::shared_ptr<const Speller> speller,
                         unsigned int threads,
                         size_t max_pending) :
    speller_(speller),
    max_pending_(max_pending == 0 ? 1 : max_pending),
    stopping_(false)
{
    if (!speller_) {
        throw std::invalid_argument("SpellerPool needs a speller");
    }
    if (threads == 0) {
        threads = 1;
    }
    for (unsigned int i = 0; i < threads; ++i) {
        workers_.push_back(std::thread(&SpellerPool::work, this));
    }
}

SpellerPool::~SpellerPool()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    task_ready_.notify_all();
    for (size_t i = 0; i < workers_.size(); ++i) {
        workers_[i].join();
    }
}

size_t
SpellerPool::thread_count() const
{
    return workers_.size();
}

void
SpellerPool::enqueue(const std::function<void()>& task)
{
    {
        std::unique_lock<std::mutex> lock(mutex_);
        slot_free_.wait(lock, [this] { return tasks_.size() < max_pending_; });
        tasks_.push_back(task);
    }
    task_ready_.notify_one();
}

void
SpellerPool::work()
{
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            task_ready_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            // drain what is queued before stopping
            if (tasks_.empty()) {
                return;
            }
            task = tasks_.front();
            tasks_.pop_front();
        }
        slot_free_.notify_one();
        task();
    }
}

std::future<bool>
SpellerPool::submit_check(const std::string& word, const SpellerConfig& config)
{
    std::shared_ptr<const Speller> speller(speller_);
    std::shared_ptr<std::packaged_task<bool()> > task(
        new std::packaged_task<bool()>([speller, word, config] {
            return speller->check(word, config);
        }));
    std::future<bool> rv = task->get_future();
    enqueue([task] { (*task)(); });
    return rv;
}

std::future<CorrectionResult>
SpellerPool::submit_suggest(const std::string& word, const SpellerConfig& config)
{
    std::shared_ptr<const Speller> speller(speller_);
    std::shared_ptr<std::packaged_task<CorrectionResult()> > task(
        new std::packaged_task<CorrectionResult()>([speller, word, config] {
            return speller->correct(word, config);
        }));
    std::future<CorrectionResult> rv = task->get_future();
    enqueue([task] { (*task)(); });
    return rv;
}

} // namespace olspell
