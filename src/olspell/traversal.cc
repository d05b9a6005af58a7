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

#include "traversal.h"

namespace olspell {

namespace {

void collect_arcs(const Transducer& t,
                  TransitionTableIndex state,
                  SymbolNumber symbol,
                  TraversalStepVector& out)
{
    if (!t.has_transitions(state, symbol)) {
        return;
    }
    TransitionTableIndex next = t.next(state, symbol);
    STransition i_s = t.take_non_epsilons(next, symbol);
    while (i_s.symbol != NO_SYMBOL) {
        out.push_back(TraversalStep(symbol, i_s));
        ++next;
        i_s = t.take_non_epsilons(next, symbol);
    }
}

} // anonymous namespace

SearchStats&
SearchStats::operator+=(const SearchStats& other)
{
    nodes_expanded += other.nodes_expanded;
    cycle_bound_prunes += other.cycle_bound_prunes;
    flag_rejections += other.flag_rejections;
    memo_discards += other.memo_discards;
    return *this;
}

void epsilon_steps(const Transducer& t,
                   TransitionTableIndex state,
                   const FlagDiacriticState& flags,
                   TraversalStepVector& out,
                   SearchStats& stats)
{
    if (!t.has_epsilons_or_flags(state)) {
        return;
    }
    const TransducerAlphabet& alphabet = t.get_alphabet();
    TransitionTableIndex next = t.next(state, 0);
    STransition i_s = t.take_epsilons_and_flags(next);

    while (i_s.symbol != NO_SYMBOL) {
        SymbolNumber input = t.transition_input_symbol(next);
        FlagDiacriticOperation op;
        if (input == 0) {
            out.push_back(TraversalStep(input, i_s, flags));
        } else if (alphabet.flag_spec(input, op)) {
            // Not a true epsilon but a flag diacritic
            FlagDiacriticState updated;
            if (try_apply(op, flags, updated)) {
                out.push_back(TraversalStep(input, i_s, updated));
            } else {
                ++stats.flag_rejections;
            }
        }
        ++next;
        i_s = t.take_epsilons_and_flags(next);
    }
}

void insertion_steps(const Transducer& t,
                     TransitionTableIndex state,
                     TraversalStepVector& out)
{
    if (!t.has_epsilons_or_flags(state)) {
        return;
    }
    // epsilons share their block with the flags, which are skipped here
    TransitionTableIndex next = t.next(state, 0);
    STransition i_s = t.take_epsilons_and_flags(next);
    while (i_s.symbol != NO_SYMBOL) {
        if (t.transition_input_symbol(next) == 0) {
            out.push_back(TraversalStep(0, i_s));
        }
        ++next;
        i_s = t.take_epsilons_and_flags(next);
    }
}

void symbol_steps(const Transducer& t,
                  TransitionTableIndex state,
                  SymbolNumber symbol,
                  bool known,
                  TraversalStepVector& out)
{
    if (known) {
        collect_arcs(t, state, symbol, out);
        return;
    }
    // this input was not in the alphabet, so unknown or identity may apply
    if (t.get_identity() != NO_SYMBOL) {
        collect_arcs(t, state, t.get_identity(), out);
    }
    if (t.get_unknown() != NO_SYMBOL) {
        collect_arcs(t, state, t.get_unknown(), out);
    }
}

} // namespace olspell
