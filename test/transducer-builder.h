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

#ifndef OLSPELL_TEST_TRANSDUCER_BUILDER_H_
#define OLSPELL_TEST_TRANSDUCER_BUILDER_H_ 1

#include <map>
#include <string>
#include <vector>

#include "buffer.h"
#include "hfst-ol.h"
#include "transducer.h"

namespace olspell
{

    // Writes small automata in the optimized-lookup format.
    //
    // State 0 is the start state and goes in the index table; every other
    // state gets a block of its own in the transition table. An empty
    // string stands for epsilon.
    class TransducerBuilder
    {
    public:
        // byte offsets of the parts of a built buffer
        struct Layout
        {
            size_t header;
            size_t index_table;
            size_t transition_table;
        };

        explicit TransducerBuilder(bool weighted = true);

        SymbolNumber symbol(const std::string& name);
        unsigned int add_state();
        void add_arc(unsigned int from, const std::string& input,
                     const std::string& output, unsigned int to,
                     Weight weight = 0.0);
        void set_final(unsigned int state, Weight weight = 0.0);
        // a fresh path from the start state spelling @a word
        void add_word(const std::string& word, Weight weight = 0.0);
        // wrap the tables in an hfst3 header of the given type
        void set_hfst3_type(const std::string& type);

        std::string build(Layout* layout = NULL) const;
        ByteBufferPtr buffer() const;
        HfstTransducerPtr transducer() const;

    private:
        struct Arc
        {
            SymbolNumber input;
            SymbolNumber output;
            unsigned int target;
            Weight weight;
        };
        struct State
        {
            bool final;
            Weight weight;
            std::vector<Arc> arcs;
        };

        bool is_flag(SymbolNumber s) const;

        bool weighted_;
        std::string hfst3_type_;
        std::vector<std::string> symbols_;
        std::map<std::string, SymbolNumber> symbol_numbers_;
        std::vector<State> states_;
    };

    // characters of a UTF-8 string, one per element
    std::vector<std::string> utf8_characters(const std::string& s);

    // lexicon of @a words, each ending in a final state of weight 0
    HfstTransducerPtr make_lexicon(const std::vector<std::string>& words);

    // one state error model copying each of @a alphabet at no cost
    TransducerBuilder identity_error_model(const std::string& alphabet);

} // namespace olspell

#endif // OLSPELL_TEST_TRANSDUCER_BUILDER_H_
