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

//! @file hfst-ol.h
//! @brief Decoding of the hfst optimized-lookup binary format.
//!
//! Everything in here reads straight out of a caller-owned byte range; the
//! tables are views and never copy the transducer data.

#ifndef OLSPELL_HFST_OL_H_
#define OLSPELL_HFST_OL_H_ 1

#include "olspell-stdafx.h"

#include <climits>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace olspell
{

typedef uint16_t SymbolNumber;
typedef uint32_t TransitionTableIndex;
typedef std::vector<SymbolNumber> SymbolVector;
typedef std::vector<std::string> KeyTable;
typedef std::map<std::string, SymbolNumber> StringSymbolMap;
typedef short ValueNumber;
typedef float Weight;

const SymbolNumber NO_SYMBOL = USHRT_MAX;
const TransitionTableIndex NO_TABLE_INDEX = UINT_MAX;
const TransitionTableIndex TARGET_TABLE = 2147483648u;
const Weight INFINITE_WEIGHT = std::numeric_limits<Weight>::infinity();

// Sizes of the fixed-width records on disk
const size_t HEADER_SIZE = 2 * sizeof(SymbolNumber) +
                           4 * sizeof(TransitionTableIndex) +
                           9 * sizeof(uint32_t);
const size_t INDEX_ROW_SIZE = sizeof(SymbolNumber) + sizeof(TransitionTableIndex);
const size_t UNWEIGHTED_TRANSITION_ROW_SIZE = 2 * sizeof(SymbolNumber) +
                                              sizeof(TransitionTableIndex);
const size_t WEIGHTED_TRANSITION_ROW_SIZE = UNWEIGHTED_TRANSITION_ROW_SIZE +
                                            sizeof(Weight);

#define OLSPELL_THROW_MESSAGE(E, M) throw E(std::string(#E) + ": " + (M))

//! @brief Any failure to decode a transducer buffer.
//!
//! Raised only while a transducer is being loaded; a transducer that was
//! constructed successfully never raises it during lookup.
class FormatError : public std::runtime_error
{
public:
    explicit FormatError(const std::string& message) :
        std::runtime_error(message) {}
};

#define OLSPELL_FORMAT_ERROR_CHILD(CHILD) \
    class CHILD : public FormatError \
    { \
    public: \
        explicit CHILD(const std::string& message) : FormatError(message) {} \
    }

OLSPELL_FORMAT_ERROR_CHILD(HeaderParsingException);
OLSPELL_FORMAT_ERROR_CHILD(TransducerTypeException);
OLSPELL_FORMAT_ERROR_CHILD(AlphabetParsingException);
OLSPELL_FORMAT_ERROR_CHILD(IndexTableReadingException);
OLSPELL_FORMAT_ERROR_CHILD(TransitionTableReadingException);

//! @brief A transducer file could not be opened or mapped.
class FileOpeningException : public std::runtime_error
{
public:
    explicit FileOpeningException(const std::string& message) :
        std::runtime_error(message) {}
};

// Little-endian readers, independent of host byte order
uint16_t read_uint16_le(const char* p);
uint32_t read_uint32_le(const char* p);
Weight read_weight_le(const char* p);

enum HeaderFlag {
    Weighted,
    Deterministic,
    Input_deterministic,
    Minimized,
    Cyclic,
    Has_epsilon_epsilon_transitions,
    Has_input_epsilon_transitions,
    Has_input_epsilon_cycles,
    Has_unweighted_input_epsilon_cycles
};

// The header of the optimized-lookup format, with or without the hfst3
// envelope in front of it.
class TransducerHeader
{
private:
    SymbolNumber number_of_input_symbols;
    SymbolNumber number_of_symbols;
    TransitionTableIndex size_of_transition_index_table;
    TransitionTableIndex size_of_transition_target_table;
    TransitionTableIndex number_of_states;
    TransitionTableIndex number_of_transitions;

    bool weighted;
    bool deterministic;
    bool input_deterministic;
    bool minimized;
    bool cyclic;
    bool has_epsilon_epsilon_transitions;
    bool has_input_epsilon_transitions;
    bool has_input_epsilon_cycles;
    bool has_unweighted_input_epsilon_cycles;

    static void read_property(bool& property, const char** raw);
    void skip_hfst3_header(const char** raw, const char* end);

public:
    //! @brief parse header at @a *raw, leaving @a *raw past it
    TransducerHeader(const char** raw, const char* end);

    SymbolNumber symbol_count() const;
    SymbolNumber input_symbol_count() const;
    TransitionTableIndex index_table_size() const;
    TransitionTableIndex target_table_size() const;
    TransitionTableIndex state_count() const;
    TransitionTableIndex transition_count() const;
    bool probe_flag(HeaderFlag flag) const;
};

enum FlagDiacriticOperator { P, N, R, D, C, U };

// One parsed @OP.FEATURE.VALUE@ symbol; feature and value are interned ids
class FlagDiacriticOperation
{
private:
    FlagDiacriticOperator operation;
    SymbolNumber feature;
    ValueNumber value;
public:
    FlagDiacriticOperation(FlagDiacriticOperator op, SymbolNumber feat,
                           ValueNumber val) :
        operation(op), feature(feat), value(val) {}

    FlagDiacriticOperation() :
        operation(P), feature(NO_SYMBOL), value(0) {}

    bool isFlag() const;
    FlagDiacriticOperator Operation() const;
    SymbolNumber Feature() const;
    ValueNumber Value() const;
};

typedef std::map<SymbolNumber, FlagDiacriticOperation> OperationMap;

//! @brief Symbol table of one transducer.
//!
//! Built once from the symbol list of the binary format and read-only after
//! that; any number of searches may consult it concurrently.
class OLSPELL_API TransducerAlphabet
{
private:
    KeyTable kt;                 //< printable form, empty for specials
    KeyTable names;              //< raw symbol text as stored
    OperationMap operations;
    StringSymbolMap string_to_symbol;
    SymbolNumber unknown_symbol;
    SymbolNumber identity_symbol;
    SymbolNumber flag_state_size;
    SymbolNumber orig_symbol_count;
    std::vector<std::string> feature_names;
    std::vector<std::string> value_names;

    void read(const char** raw, const char* end, SymbolNumber number_of_symbols);
    void read_flag(SymbolNumber k, const std::string& sym,
                   std::map<std::string, SymbolNumber>& feature_bucket,
                   std::map<std::string, ValueNumber>& value_bucket);

public:
    //! @brief parse @a number_of_symbols NUL-terminated strings at @a *raw
    TransducerAlphabet(const char** raw, const char* end,
                       SymbolNumber number_of_symbols);

    //! @brief printable strings indexed by symbol number
    const KeyTable& get_key_table() const;
    //! @brief number of flag diacritic features
    SymbolNumber get_state_size() const;
    SymbolNumber get_unknown() const;
    SymbolNumber get_identity() const;
    SymbolNumber get_orig_symbol_count() const;

    //! @brief raw text of @a symbol, flag diacritics included
    const std::string& symbol_for_id(SymbolNumber symbol) const;
    //! @brief symbol number of a literal, NO_SYMBOL if there is none
    SymbolNumber id_for_text(const std::string& text) const;
    bool is_flag(SymbolNumber symbol) const;
    //! @brief the flag operation of @a symbol; false if it is no flag
    bool flag_spec(SymbolNumber symbol, FlagDiacriticOperation& op) const;
    const std::string& feature_name(SymbolNumber feature) const;
    const std::string& value_name(ValueNumber value) const;
};

// Index table view. A row is a 16-bit input symbol followed by a 32-bit
// transition table pointer, or a final weight for finality rows.
class IndexTable
{
private:
    const char* indices;
    TransitionTableIndex size;
    bool weighted;

public:
    IndexTable(const char** raw, const char* end,
               TransitionTableIndex number_of_table_entries,
               bool weighted_table);

    void validate(SymbolNumber symbol_count,
                  TransitionTableIndex transition_count) const;

    TransitionTableIndex entries() const { return size; }
    SymbolNumber input_symbol(TransitionTableIndex i) const;
    TransitionTableIndex target(TransitionTableIndex i) const;
    bool final(TransitionTableIndex i) const;
    Weight final_weight(TransitionTableIndex i) const;
};

// Transition table view. Weighted rows carry a 32-bit float after the
// target; unweighted rows stop at the target.
class TransitionTable
{
private:
    const char* transitions;
    TransitionTableIndex size;
    bool weighted;
    size_t row_size;

    const char* row(TransitionTableIndex i) const
    {
        return transitions + row_size * i;
    }

public:
    TransitionTable(const char** raw, const char* end,
                    TransitionTableIndex transition_count,
                    bool weighted_table);

    void validate(SymbolNumber symbol_count,
                  TransitionTableIndex index_count) const;

    TransitionTableIndex entries() const { return size; }
    SymbolNumber input_symbol(TransitionTableIndex i) const;
    SymbolNumber output_symbol(TransitionTableIndex i) const;
    TransitionTableIndex target(TransitionTableIndex i) const;
    Weight weight(TransitionTableIndex i) const;
    bool final(TransitionTableIndex i) const;
    //! @brief whether row @a i is a state marker rather than a transition
    bool marker(TransitionTableIndex i) const;
};

// Byte trie for multicharacter symbols
class LetterTrie
{
private:
    std::vector<LetterTrie*> letters;
    SymbolVector symbols;

    LetterTrie(const LetterTrie&);
    LetterTrie& operator=(const LetterTrie&);

public:
    LetterTrie() :
        letters(UCHAR_MAX + 1, static_cast<LetterTrie*>(NULL)),
        symbols(UCHAR_MAX + 1, NO_SYMBOL)
    {}
    ~LetterTrie();

    void add_string(const char* p, SymbolNumber symbol_key);
    bool has_key_starting_with(const char c) const;
    SymbolNumber find_key(const char** p) const;
};

//! @brief Longest-match tokenizer from text to input symbols.
class Encoder
{
private:
    LetterTrie letters;
    SymbolVector ascii_symbols;

    void read_input_symbol(const char* s, const int s_num);

public:
    Encoder(const KeyTable& kt, SymbolNumber number_of_input_symbols);
    //! @brief consume one symbol at @a *p; NO_SYMBOL leaves @a *p alone
    SymbolNumber find_key(const char** p) const;
};

int nByte_utf8(unsigned char c);

} // namespace olspell

#endif // OLSPELL_HFST_OL_H_
