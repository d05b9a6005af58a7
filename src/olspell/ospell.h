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

#ifndef OLSPELL_OSPELL_H_
#define OLSPELL_OSPELL_H_ 1

#include "olspell-stdafx.h"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "flags.h"
#include "hfst-ol.h"
#include "ranker.h"
#include "transducer.h"
#include "traversal.h"

namespace olspell
{

    // Internal class for search state.

    // One partial path through both automata at once.
    struct TreeNode
    {
        SymbolVector string;                //< the current output vector
        unsigned int input_state;           //< position in input
        TransitionTableIndex mutator_state; //< state in error model
        TransitionTableIndex lexicon_state; //< state in language model
        FlagDiacriticState flag_state;      //< state of flags
        Weight weight;                      //< weight
        unsigned int epsilon_steps;         //< steps since input was consumed
        bool complete;                      //< final weights included

        //
        // construct a node in trie from all that stuff
        TreeNode(const SymbolVector& prev_string,
                 unsigned int i,
                 TransitionTableIndex mutator,
                 TransitionTableIndex lexicon,
                 const FlagDiacriticState& state,
                 Weight w,
                 unsigned int steps) : string(prev_string),
                                       input_state(i),
                                       mutator_state(mutator),
                                       lexicon_state(lexicon),
                                       flag_state(state),
                                       weight(w),
                                       epsilon_steps(steps),
                                       complete(false)
        {
        }

        //
        // construct empty node with a starting state for flags
        explicit TreeNode(const FlagDiacriticState& start_state) :
            string(SymbolVector()),
            input_state(0),
            mutator_state(0),
            lexicon_state(0),
            flag_state(start_state),
            weight(0.0),
            epsilon_steps(0),
            complete(false)
        {
        }

        //
        // The update functions return updated copies of this state

        //
        // traverse an epsilon or flag in lexicon
        TreeNode update_lexicon(SymbolNumber symbol,
                                TransitionTableIndex next_lexicon,
                                const FlagDiacriticState& next_flags,
                                Weight weight) const;

        //
        // traverse an epsilon in error model
        TreeNode update_mutator(TransitionTableIndex next_mutator,
                                Weight weight) const;

        //
        // traverse both, maybe consuming input
        TreeNode update(SymbolNumber output_symbol,
                        unsigned int next_input,
                        TransitionTableIndex next_mutator,
                        TransitionTableIndex next_lexicon,
                        Weight weight) const;

        //
        // end the path with the final weights of both models
        TreeNode finish(Weight final_weights) const;
    };

    //! @brief Limits and switches of one query.
    struct OLSPELL_API SpellerConfig
    {
        //! @brief most corrections to give, 0 for no limit
        unsigned long n_best;
        //! @brief heaviest correction to give, negative for no limit
        Weight max_weight;
        //! @brief give only corrections within this of the best one,
        //!        negative for no limit
        Weight beam;
        //! @brief seconds to search at most, 0 or less for no limit
        double time_cutoff;
        //! @brief also try the case variants of the word
        bool case_handling;
        //! @brief steps allowed in a row without consuming input
        unsigned int max_epsilon_steps;

        SpellerConfig() :
            n_best(0),
            max_weight(-1.0),
            beam(-1.0),
            time_cutoff(0.0),
            case_handling(true),
            max_epsilon_steps(256)
        {}
    };

    enum SearchStatus
    {
        Complete,  //< the search ran to its end
        Cancelled, //< stopped through the CancellationToken
        TimeLimit  //< stopped by SpellerConfig::time_cutoff
    };

    //! @brief Corrections of one word, best first.
    //!
    //! When the search was stopped early the corrections found until then
    //! are still given and @c status tells why it stopped.
    struct OLSPELL_API CorrectionResult
    {
        StringWeightVector corrections;
        SearchStatus status;
        SearchStats stats;

        CorrectionResult() : status(Complete) {}
    };

    //! @brief Asks running searches to stop, from any thread.
    class OLSPELL_API CancellationToken
    {
    public:
        CancellationToken() : cancelled_(false) {}
        void cancel() { cancelled_.store(true); }
        void reset() { cancelled_.store(false); }
        bool cancelled() const { return cancelled_.load(); }
    private:
        CancellationToken(const CancellationToken&);
        CancellationToken& operator=(const CancellationToken&);

        std::atomic<bool> cancelled_;
    };

    // Exception when speller cannot map characters of error model to language
    // model.

    // Gets raised if the error model has more symbols of its own than fit in
    // the symbol numbers left over by the language model.
    class AlphabetTranslationException : public std::runtime_error
    { // "what" should hold the first untranslatable symbol
    public:
        //
        // create alphabet exception with symbol as explanation
        explicit AlphabetTranslationException(const std::string& what) :
            std::runtime_error(what)
        {
        }
    };

    // @brief Basic spell-checking automata pair unit.

    // Speller consists of two automata, one for language modeling and one for
    // error modeling. The speller itself is immutable once built: every query
    // keeps its own search state, so one speller may serve any number of
    // threads at once.
    // @see ZHfstSpeller for high level access.
    class OLSPELL_API Speller
    {
    public:
        //
        // Create a speller object from error model and language automata.
        // The error model may be null, in which case nothing gets corrected.
        Speller(HfstTransducerPtr mutator_ptr, HfstTransducerPtr lexicon_ptr);

        // @brief Check if the given string is accepted by the speller
        bool check(const std::string& word) const;
        // @brief check, with the case variants of @a word when
        //        @a config asks for case handling
        bool check(const std::string& word, const SpellerConfig& config) const;

        // @brief suggest corrections for given string @a word.
        //
        // Corrections are distinct and ordered by ascending weight, equal
        // weights in the order they were found.
        CorrectionResult correct(const std::string& word,
                                 const SpellerConfig& config = SpellerConfig(),
                                 const CancellationToken* cancel = NULL) const;

        // @brief analyse given string @a word.
        //
        // If language model is two-tape, give a list of analyses for string.
        // If not, this gives @a word itself if the string is in language
        // model and nothing if it isn't. With case handling the analyses of
        // every case variant are merged.
        StringWeightVector analyse(const std::string& word,
                                   const SpellerConfig& config = SpellerConfig()) const;

        bool can_correct() const;
        const HfstTransducer& get_lexicon() const;
        //
        // the error model, or NULL
        const HfstTransducer* get_mutator() const;
        //
        // size of states
        SymbolNumber get_state_size() const;
        //
        // error model symbols in lexicon numbering
        const SymbolVector& get_alphabet_translator() const;
        //
        // printable forms of all symbols a correction can be made of
        const KeyTable& get_output_keys() const;

    private:
        Speller(const Speller&);
        Speller& operator=(const Speller&);

        //
        // initialise string conversions
        void build_alphabet_translator();
        CorrectionResult correct_variant(const std::string& word,
                                         const SpellerConfig& config,
                                         const CancellationToken* cancel,
                                         const std::chrono::steady_clock::time_point* deadline) const;

        HfstTransducerPtr mutator_;       //< error model
        HfstTransducerPtr lexicon_;       //< language model
        IdentityTransducer identity_;     //< error model for checking
        SymbolVector alphabet_translator; //< error model to lexicon symbols
        SymbolVector identity_translator; //< lexicon to lexicon symbols
        KeyTable output_keys;             //< lexicon keys plus error model's
    };

} // namespace olspell

#endif // OLSPELL_OSPELL_H_
