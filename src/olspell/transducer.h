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

//! @file transducer.h
//! @brief Read-only access to weighted transducers.
//!
//! The search code only talks to the abstract Transducer; HfstTransducer
//! reads the optimized-lookup tables out of a shared buffer and
//! IdentityTransducer stands in for an error model that allows no edits.

#ifndef OLSPELL_TRANSDUCER_H_
#define OLSPELL_TRANSDUCER_H_ 1

#include "olspell-stdafx.h"

#include <memory>
#include <string>

#include "buffer.h"
#include "hfst-ol.h"

namespace olspell
{

    // One step taken by the keyed primitives below.
    struct STransition
    {
        TransitionTableIndex index; //< target state
        SymbolNumber symbol;        //< output symbol, NO_SYMBOL if none
        Weight weight;              //< weight of transition

        //
        // create transition without weight
        STransition(TransitionTableIndex i,
                    SymbolNumber s) : index(i),
                                      symbol(s),
                                      weight(0.0)
        {
        }

        // create transition with weight
        STransition(TransitionTableIndex i,
                    SymbolNumber s,
                    Weight w) : index(i),
                                symbol(s),
                                weight(w)
        {
        }
    };

    //! @brief A complete transition as seen by TransitionRange.
    struct TransitionArc
    {
        SymbolNumber input;
        SymbolNumber output;
        TransitionTableIndex target;
        Weight weight;
    };

    class Transducer;

    //! @brief All transitions leaving one state.
    //!
    //! The range is lazy and reads the tables on every step; iterating it
    //! again starts over from the first transition. Epsilons and flags come
    //! first, then the other transitions ordered by input symbol.
    class OLSPELL_API TransitionRange
    {
    public:
        class OLSPELL_API iterator
        {
        public:
            iterator();
            const TransitionArc& operator*() const { return arc_; }
            const TransitionArc* operator->() const { return &arc_; }
            iterator& operator++();
            bool operator==(const iterator& other) const;
            bool operator!=(const iterator& other) const
            {
                return !(*this == other);
            }
        private:
            friend class TransitionRange;
            iterator(const Transducer* t, TransitionTableIndex state);

            bool load(TransitionTableIndex i);
            void seek(SymbolNumber from_symbol);

            const Transducer* transducer_;
            TransitionTableIndex state_;
            SymbolNumber symbol_;
            TransitionTableIndex index_;
            TransitionArc arc_;
        };

        TransitionRange(const Transducer& t, TransitionTableIndex state);
        iterator begin() const;
        iterator end() const;

    private:
        const Transducer* transducer_;
        TransitionTableIndex state_;
    };

    //! @brief Capabilities the search needs from an automaton.
    //!
    //! States are TransitionTableIndex values as in the optimized-lookup
    //! format; a transition index is an opaque position that the take_*
    //! functions read and that can be incremented to reach the next
    //! transition with the same input symbol.
    class OLSPELL_API Transducer
    {
    public:
        virtual ~Transducer() {}

        TransitionTableIndex start_state() const { return 0; }
        virtual bool is_final(TransitionTableIndex s) const = 0;
        virtual Weight final_weight(TransitionTableIndex s) const = 0;

        //! @brief lazily iterate all transitions of state @a s
        TransitionRange transitions_from(TransitionTableIndex s) const
        {
            return TransitionRange(*this, s);
        }

        //
        // whether state @a s has any transitions with input @a symbol
        virtual bool has_transitions(TransitionTableIndex s,
                                     SymbolNumber symbol) const = 0;
        //
        // whether state @a s has epsilons or flags
        virtual bool has_epsilons_or_flags(TransitionTableIndex s) const = 0;
        //
        // first transition index of @a s for input @a symbol
        virtual TransitionTableIndex next(TransitionTableIndex s,
                                          SymbolNumber symbol) const = 0;
        //
        // follow epsilon transitions from index
        virtual STransition take_epsilons(TransitionTableIndex i) const = 0;
        //
        // follow epsilon transitions and flags from index
        virtual STransition take_epsilons_and_flags(TransitionTableIndex i) const = 0;
        //
        // follow real transitions from index
        virtual STransition take_non_epsilons(TransitionTableIndex i,
                                              SymbolNumber symbol) const = 0;
        virtual SymbolNumber transition_input_symbol(TransitionTableIndex i) const = 0;

        virtual const TransducerAlphabet& get_alphabet() const = 0;

        SymbolNumber symbol_count() const
        {
            return get_alphabet().get_orig_symbol_count();
        }
        SymbolNumber get_unknown() const { return get_alphabet().get_unknown(); }
        SymbolNumber get_identity() const { return get_alphabet().get_identity(); }
        SymbolNumber get_state_size() const { return get_alphabet().get_state_size(); }
        bool is_flag(SymbolNumber symbol) const
        {
            return get_alphabet().is_flag(symbol);
        }
    };

    //! @brief Transducer read from hfst optimized-lookup data.
    //!
    //! The tables are read in place from the buffer, which the transducer
    //! keeps alive. The whole buffer is validated on construction: every
    //! symbol number and transition target is checked to lie inside the
    //! tables, so lookups never leave the data. Any defect raises a
    //! FormatError and no transducer is created.
    class OLSPELL_API HfstTransducer : public Transducer
    {
    public:
        //! @brief read transducer from @a buffer
        explicit HfstTransducer(ByteBufferPtr buffer);
        //! @brief map and read transducer file @a filename
        explicit HfstTransducer(const std::string& filename);

        bool is_final(TransitionTableIndex s) const;
        Weight final_weight(TransitionTableIndex s) const;
        bool has_transitions(TransitionTableIndex s, SymbolNumber symbol) const;
        bool has_epsilons_or_flags(TransitionTableIndex s) const;
        TransitionTableIndex next(TransitionTableIndex s, SymbolNumber symbol) const;
        STransition take_epsilons(TransitionTableIndex i) const;
        STransition take_epsilons_and_flags(TransitionTableIndex i) const;
        STransition take_non_epsilons(TransitionTableIndex i,
                                      SymbolNumber symbol) const;
        SymbolNumber transition_input_symbol(TransitionTableIndex i) const;
        const TransducerAlphabet& get_alphabet() const;

        //
        // get encoder for mapping strings to input symbols
        const Encoder& get_encoder() const;
        const TransducerHeader& get_header() const;
        bool is_weighted() const;

    private:
        HfstTransducer(const HfstTransducer&);
        HfstTransducer& operator=(const HfstTransducer&);

        // transition of a transition-table state with input @a symbol
        TransitionTableIndex scan(TransitionTableIndex s,
                                  SymbolNumber symbol) const;

        ByteBufferPtr buffer_;       //< owner of the table data
        const char* cursor_;         //< read position while loading
        const char* end_;
        TransducerHeader header;     //< header data
        TransducerAlphabet alphabet; //< alphabet data
        Encoder encoder;             //< encoder to convert the strings
        IndexTable indices;          //< index table
        TransitionTable transitions; //< transition table
    };

    typedef std::shared_ptr<const HfstTransducer> HfstTransducerPtr;

    //! @brief One final state looping every symbol to itself at no cost.
    //!
    //! Used as the error model when checking a word against the lexicon.
    //! Every non-epsilon symbol that is not a flag diacritic is accepted,
    //! including numbers past the end of @a alphabet that a query allocates
    //! for characters nobody knows. The alphabet must outlive this object.
    class OLSPELL_API IdentityTransducer : public Transducer
    {
    public:
        explicit IdentityTransducer(const TransducerAlphabet& alphabet);

        bool is_final(TransitionTableIndex s) const;
        Weight final_weight(TransitionTableIndex s) const;
        bool has_transitions(TransitionTableIndex s, SymbolNumber symbol) const;
        bool has_epsilons_or_flags(TransitionTableIndex s) const;
        TransitionTableIndex next(TransitionTableIndex s, SymbolNumber symbol) const;
        STransition take_epsilons(TransitionTableIndex i) const;
        STransition take_epsilons_and_flags(TransitionTableIndex i) const;
        STransition take_non_epsilons(TransitionTableIndex i,
                                      SymbolNumber symbol) const;
        SymbolNumber transition_input_symbol(TransitionTableIndex i) const;
        const TransducerAlphabet& get_alphabet() const;

    private:
        bool accepts(SymbolNumber symbol) const;

        const TransducerAlphabet& alphabet_;
    };

} // namespace olspell

#endif // OLSPELL_TRANSDUCER_H_
