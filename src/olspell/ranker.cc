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

#include "ranker.h"

#include <algorithm>

namespace olspell {

namespace {

struct RankedSuggestion
{
    StringWeightPair suggestion;
    unsigned long discovered;
};

// ascending weight, discovery order for equal weights
bool ranked_before(const RankedSuggestion& lhs, const RankedSuggestion& rhs)
{
    if (lhs.suggestion.second != rhs.suggestion.second) {
        return lhs.suggestion.second < rhs.suggestion.second;
    }
    return lhs.discovered < rhs.discovered;
}

} // anonymous namespace

SuggestionRanker::SuggestionRanker(unsigned long max_count) :
    max_count_(max_count)
{}

bool
SuggestionRanker::add(const std::string& string, Weight weight)
{
    std::map<std::string, Entry>::iterator it = best_.find(string);
    if (it == best_.end()) {
        Entry entry;
        entry.weight = weight;
        entry.discovered = best_.size();
        best_.insert(std::make_pair(string, entry));
        return true;
    }
    /* keep the lower weight, but the first sighting */
    if (weight < it->second.weight) {
        it->second.weight = weight;
    }
    return false;
}

void
SuggestionRanker::add(const StringWeightVector& suggestions)
{
    for (StringWeightVector::const_iterator it = suggestions.begin();
         it != suggestions.end(); ++it) {
        add(it->first, it->second);
    }
}

size_t
SuggestionRanker::size() const
{
    return best_.size();
}

bool
SuggestionRanker::empty() const
{
    return best_.empty();
}

StringWeightVector
SuggestionRanker::results() const
{
    std::vector<RankedSuggestion> ranked;
    ranked.reserve(best_.size());
    for (std::map<std::string, Entry>::const_iterator it = best_.begin();
         it != best_.end(); ++it) {
        RankedSuggestion r;
        r.suggestion = StringWeightPair(it->first, it->second.weight);
        r.discovered = it->second.discovered;
        ranked.push_back(r);
    }
    std::stable_sort(ranked.begin(), ranked.end(), ranked_before);

    StringWeightVector rv;
    for (size_t i = 0; i < ranked.size(); ++i) {
        if (max_count_ > 0 && rv.size() >= max_count_) {
            break;
        }
        rv.push_back(ranked[i].suggestion);
    }
    return rv;
}

} // namespace olspell
