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

//! @file traversal.h
//! @brief Single steps through one transducer, shared by every search mode.

#ifndef OLSPELL_TRAVERSAL_H_
#define OLSPELL_TRAVERSAL_H_ 1

#include "olspell-stdafx.h"

#include <vector>

#include "flags.h"
#include "transducer.h"

namespace olspell
{

    //! @brief Counters of one search, for diagnostics only.
    struct OLSPELL_API SearchStats
    {
        unsigned long nodes_expanded;
        unsigned long cycle_bound_prunes; //< branches cut by TraversalBound
        unsigned long flag_rejections;    //< flag diacritics that failed
        unsigned long memo_discards;      //< nodes no lighter than a known one

        SearchStats() :
            nodes_expanded(0),
            cycle_bound_prunes(0),
            flag_rejections(0),
            memo_discards(0)
        {}

        SearchStats& operator+=(const SearchStats& other);
    };

    // A transition found by the step functions. @a input is the symbol the
    // transition was matched with, which is the identity or unknown symbol
    // when the original symbol was foreign to the transducer.
    struct TraversalStep
    {
        SymbolNumber input;
        STransition transition;
        FlagDiacriticState flags; //< flags after the step

        TraversalStep(SymbolNumber i, const STransition& t) :
            input(i), transition(t) {}
        TraversalStep(SymbolNumber i, const STransition& t,
                      const FlagDiacriticState& f) :
            input(i), transition(t), flags(f) {}
    };

    typedef std::vector<TraversalStep> TraversalStepVector;

    //! @brief collect the epsilon and flag diacritic transitions of @a state
    //!
    //! Flags are applied to @a flags and the resulting state is stored in
    //! each step; transitions whose flag fails are left out and counted in
    //! @a stats.
    OLSPELL_API void epsilon_steps(const Transducer& t,
                                   TransitionTableIndex state,
                                   const FlagDiacriticState& flags,
                                   TraversalStepVector& out,
                                   SearchStats& stats);

    //! @brief collect the transitions of @a state with epsilon input
    //!
    //! Flag diacritics are not followed.
    OLSPELL_API void insertion_steps(const Transducer& t,
                                     TransitionTableIndex state,
                                     TraversalStepVector& out);

    //! @brief collect the transitions of @a state consuming @a symbol
    //!
    //! @a known tells whether @a symbol belongs to the alphabet of @a t. If
    //! it does not, the identity and unknown symbol transitions are
    //! collected instead.
    OLSPELL_API void symbol_steps(const Transducer& t,
                                  TransitionTableIndex state,
                                  SymbolNumber symbol,
                                  bool known,
                                  TraversalStepVector& out);

    enum StepOutcome
    {
        Continue,
        CycleBound
    };

    //! @brief Limit on steps taken in a row without consuming input.
    //!
    //! Epsilon cycles would otherwise let one branch grow forever; a branch
    //! over the limit is dropped while the rest of the search goes on.
    class OLSPELL_API TraversalBound
    {
    public:
        explicit TraversalBound(unsigned int max_steps) : max_steps_(max_steps) {}

        StepOutcome check(unsigned int steps) const
        {
            return steps > max_steps_ ? CycleBound : Continue;
        }

        unsigned int limit() const { return max_steps_; }

    private:
        unsigned int max_steps_;
    };

} // namespace olspell

#endif // OLSPELL_TRAVERSAL_H_
