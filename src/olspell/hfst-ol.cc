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

#include "hfst-ol.h"

#include <cstring>
#include <sstream>

namespace olspell {

namespace {

size_t remaining(const char* raw, const char* end)
{
    return raw < end ? static_cast<size_t>(end - raw) : 0;
}

std::string row_message(const char* what, TransitionTableIndex i)
{
    std::ostringstream s;
    s << what << " at row " << i;
    return s.str();
}

} // anonymous namespace

uint16_t read_uint16_le(const char* p)
{
    const unsigned char* u = reinterpret_cast<const unsigned char*>(p);
    return static_cast<uint16_t>(u[0] | (u[1] << 8));
}

uint32_t read_uint32_le(const char* p)
{
    const unsigned char* u = reinterpret_cast<const unsigned char*>(p);
    return static_cast<uint32_t>(u[0]) |
        (static_cast<uint32_t>(u[1]) << 8) |
        (static_cast<uint32_t>(u[2]) << 16) |
        (static_cast<uint32_t>(u[3]) << 24);
}

Weight read_weight_le(const char* p)
{
    uint32_t bits = read_uint32_le(p);
    Weight w;
    memcpy(&w, &bits, sizeof(w));
    return w;
}

void
TransducerHeader::read_property(bool& property, const char** raw)
{
    property = read_uint32_le(*raw) != 0;
    (*raw) += sizeof(uint32_t);
}

void TransducerHeader::skip_hfst3_header(const char** raw, const char* end)
{
    const char header1[] = "HFST";
    const size_t magic_len = sizeof(header1); // including the NUL
    if (remaining(*raw, end) < magic_len ||
        memcmp(*raw, header1, magic_len) != 0) {
        // plain optimized-lookup data, nothing to skip
        return;
    }
    (*raw) += magic_len;
    if (remaining(*raw, end) < sizeof(uint16_t) + 1) {
        OLSPELL_THROW_MESSAGE(HeaderParsingException,
                              "Found broken HFST3 header");
    }
    uint16_t remaining_header_len = read_uint16_le(*raw);
    (*raw) += sizeof(uint16_t);
    if (**raw != '\0') {
        OLSPELL_THROW_MESSAGE(HeaderParsingException,
                              "Found broken HFST3 header");
    }
    ++(*raw);
    if (remaining(*raw, end) < remaining_header_len) {
        OLSPELL_THROW_MESSAGE(HeaderParsingException,
                              "HFST3 header ended unexpectedly");
    }
    std::string headervalue(*raw, remaining_header_len);
    (*raw) += remaining_header_len;
    if (remaining_header_len == 0 ||
        headervalue[remaining_header_len - 1] != '\0') {
        OLSPELL_THROW_MESSAGE(HeaderParsingException,
                              "Found broken HFST3 header");
    }
    // key\0value\0 pairs
    size_t pos = 0;
    while (pos < headervalue.size()) {
        size_t key_end = headervalue.find('\0', pos);
        if (key_end == std::string::npos || key_end + 1 >= headervalue.size()) {
            break;
        }
        size_t value_end = headervalue.find('\0', key_end + 1);
        std::string key = headervalue.substr(pos, key_end - pos);
        std::string value = headervalue.substr(key_end + 1,
                                               value_end - key_end - 1);
        if (key == "type" && value != "HFST_OL" && value != "HFST_OLW") {
            OLSPELL_THROW_MESSAGE(
                TransducerTypeException,
                "Transducer has incorrect type " + value +
                ", should be hfst-optimized-lookup");
        }
        pos = value_end + 1;
    }
}

TransducerHeader::TransducerHeader(const char** raw, const char* end)
{
    skip_hfst3_header(raw, end); // skip header iff it is present
    if (remaining(*raw, end) < HEADER_SIZE) {
        OLSPELL_THROW_MESSAGE(HeaderParsingException,
                              "Header ended unexpectedly");
    }
    number_of_input_symbols = read_uint16_le(*raw);
    (*raw) += sizeof(SymbolNumber);
    number_of_symbols = read_uint16_le(*raw);
    (*raw) += sizeof(SymbolNumber);
    size_of_transition_index_table = read_uint32_le(*raw);
    (*raw) += sizeof(TransitionTableIndex);
    size_of_transition_target_table = read_uint32_le(*raw);
    (*raw) += sizeof(TransitionTableIndex);
    number_of_states = read_uint32_le(*raw);
    (*raw) += sizeof(TransitionTableIndex);
    number_of_transitions = read_uint32_le(*raw);
    (*raw) += sizeof(TransitionTableIndex);

    read_property(weighted, raw);
    read_property(deterministic, raw);
    read_property(input_deterministic, raw);
    read_property(minimized, raw);
    read_property(cyclic, raw);
    read_property(has_epsilon_epsilon_transitions, raw);
    read_property(has_input_epsilon_transitions, raw);
    read_property(has_input_epsilon_cycles, raw);
    read_property(has_unweighted_input_epsilon_cycles, raw);

    if (number_of_input_symbols > number_of_symbols) {
        OLSPELL_THROW_MESSAGE(HeaderParsingException,
                              "More input symbols than symbols");
    }
}

SymbolNumber
TransducerHeader::symbol_count() const
{
    return number_of_symbols;
}

SymbolNumber
TransducerHeader::input_symbol_count() const
{
    return number_of_input_symbols;
}

TransitionTableIndex
TransducerHeader::index_table_size() const
{
    return size_of_transition_index_table;
}

TransitionTableIndex
TransducerHeader::target_table_size() const
{
    return size_of_transition_target_table;
}

TransitionTableIndex
TransducerHeader::state_count() const
{
    return number_of_states;
}

TransitionTableIndex
TransducerHeader::transition_count() const
{
    return number_of_transitions;
}

bool
TransducerHeader::probe_flag(HeaderFlag flag) const
{
    switch (flag) {
    case Weighted:
        return weighted;
    case Deterministic:
        return deterministic;
    case Input_deterministic:
        return input_deterministic;
    case Minimized:
        return minimized;
    case Cyclic:
        return cyclic;
    case Has_epsilon_epsilon_transitions:
        return has_epsilon_epsilon_transitions;
    case Has_input_epsilon_transitions:
        return has_input_epsilon_transitions;
    case Has_input_epsilon_cycles:
        return has_input_epsilon_cycles;
    case Has_unweighted_input_epsilon_cycles:
        return has_unweighted_input_epsilon_cycles;
    }
    return false;
}

bool
FlagDiacriticOperation::isFlag() const
{
    return feature != NO_SYMBOL;
}

FlagDiacriticOperator
FlagDiacriticOperation::Operation() const
{
    return operation;
}

SymbolNumber
FlagDiacriticOperation::Feature() const
{
    return feature;
}

ValueNumber
FlagDiacriticOperation::Value() const
{
    return value;
}

void TransducerAlphabet::read_flag(SymbolNumber k, const std::string& sym,
                                   std::map<std::string, SymbolNumber>& feature_bucket,
                                   std::map<std::string, ValueNumber>& value_bucket)
{
    FlagDiacriticOperator op = P; // for the compiler
    switch (sym[1]) {
    case 'P': op = P; break;
    case 'N': op = N; break;
    case 'R': op = R; break;
    case 'D': op = D; break;
    case 'C': op = C; break;
    case 'U': op = U; break;
    default:
        OLSPELL_THROW_MESSAGE(AlphabetParsingException,
                              "Unknown flag diacritic operator in " + sym);
    }
    if (sym.size() < 5 || sym[sym.size() - 1] != '@') {
        OLSPELL_THROW_MESSAGE(AlphabetParsingException,
                              "Unterminated flag diacritic " + sym);
    }
    std::string body = sym.substr(3, sym.size() - 4);
    std::string feat = body;
    std::string val;
    size_t dot = body.find('.');
    if (dot != std::string::npos) {
        feat = body.substr(0, dot);
        val = body.substr(dot + 1);
    }
    if (feat.empty()) {
        OLSPELL_THROW_MESSAGE(AlphabetParsingException,
                              "Flag diacritic without a feature: " + sym);
    }
    if (feature_bucket.count(feat) == 0) {
        SymbolNumber feat_num = static_cast<SymbolNumber>(feature_bucket.size());
        feature_bucket[feat] = feat_num;
        feature_names.push_back(feat);
    }
    if (value_bucket.count(val) == 0) {
        ValueNumber val_num = static_cast<ValueNumber>(value_bucket.size());
        value_bucket[val] = val_num;
        value_names.push_back(val);
    }
    operations.insert(
        std::pair<SymbolNumber, FlagDiacriticOperation>(
            k,
            FlagDiacriticOperation(op, feature_bucket[feat], value_bucket[val])));
}

void TransducerAlphabet::read(const char** raw, const char* end,
                              SymbolNumber number_of_symbols)
{
    std::map<std::string, SymbolNumber> feature_bucket;
    std::map<std::string, ValueNumber> value_bucket;
    value_bucket[std::string()] = 0; // empty value = neutral
    value_names.push_back(std::string());

    for (SymbolNumber k = 0; k < number_of_symbols; ++k) {
        const char* nul = static_cast<const char*>(
            memchr(*raw, '\0', remaining(*raw, end)));
        if (nul == NULL) {
            OLSPELL_THROW_MESSAGE(AlphabetParsingException,
                                  "Symbol table ended unexpectedly");
        }
        std::string sym(*raw, nul);
        *raw = nul + 1;
        names.push_back(sym);

        if (k == 0) {
            kt.push_back(std::string("")); // zeroth symbol is epsilon
            continue;
        }
        if (sym.size() >= 3 && sym[0] == '@' && sym[2] == '.' &&
            sym[1] >= 'A' && sym[1] <= 'Z') {
            read_flag(k, sym, feature_bucket, value_bucket);
            kt.push_back(std::string(""));
            continue;
        }
        // Detect and handle special symbols, which begin and end with @
        if (sym.size() >= 2 && sym[0] == '@' && sym[sym.size() - 1] == '@') {
            if (sym == "@_UNKNOWN_SYMBOL_@") {
                unknown_symbol = k;
            } else if (sym == "@_IDENTITY_SYMBOL_@") {
                identity_symbol = k;
            }
            // anything else we don't know is suppressed
            kt.push_back(std::string(""));
            continue;
        }
        kt.push_back(sym);
        if (sym.empty()) {
            continue;
        }
        if (string_to_symbol.count(sym) != 0) {
            OLSPELL_THROW_MESSAGE(AlphabetParsingException,
                                  "Symbol " + sym + " occurs twice");
        }
        string_to_symbol[sym] = k;
    }
    flag_state_size = static_cast<SymbolNumber>(feature_bucket.size());
}

TransducerAlphabet::TransducerAlphabet(const char** raw, const char* end,
                                       SymbolNumber number_of_symbols):
    unknown_symbol(NO_SYMBOL),
    identity_symbol(NO_SYMBOL),
    flag_state_size(0),
    orig_symbol_count(number_of_symbols)
{
    read(raw, end, number_of_symbols);
}

const KeyTable&
TransducerAlphabet::get_key_table() const
{
    return kt;
}

SymbolNumber
TransducerAlphabet::get_state_size() const
{
    return flag_state_size;
}

SymbolNumber
TransducerAlphabet::get_unknown() const
{
    return unknown_symbol;
}

SymbolNumber
TransducerAlphabet::get_identity() const
{
    return identity_symbol;
}

SymbolNumber TransducerAlphabet::get_orig_symbol_count() const
{
    return orig_symbol_count;
}

const std::string&
TransducerAlphabet::symbol_for_id(SymbolNumber symbol) const
{
    static const std::string none;
    if (symbol >= names.size()) {
        return none;
    }
    return names[symbol];
}

SymbolNumber
TransducerAlphabet::id_for_text(const std::string& text) const
{
    StringSymbolMap::const_iterator it = string_to_symbol.find(text);
    if (it == string_to_symbol.end()) {
        return NO_SYMBOL;
    }
    return it->second;
}

bool
TransducerAlphabet::is_flag(SymbolNumber symbol) const
{
    return operations.count(symbol) == 1;
}

bool
TransducerAlphabet::flag_spec(SymbolNumber symbol,
                              FlagDiacriticOperation& op) const
{
    OperationMap::const_iterator it = operations.find(symbol);
    if (it == operations.end()) {
        return false;
    }
    op = it->second;
    return true;
}

const std::string&
TransducerAlphabet::feature_name(SymbolNumber feature) const
{
    static const std::string none;
    return feature < feature_names.size() ? feature_names[feature] : none;
}

const std::string&
TransducerAlphabet::value_name(ValueNumber value) const
{
    static const std::string none;
    if (value < 0 || static_cast<size_t>(value) >= value_names.size()) {
        return none;
    }
    return value_names[value];
}

IndexTable::IndexTable(const char** raw, const char* end,
                       TransitionTableIndex number_of_table_entries,
                       bool weighted_table):
    indices(*raw),
    size(number_of_table_entries),
    weighted(weighted_table)
{
    uint64_t table_size = static_cast<uint64_t>(number_of_table_entries) *
        INDEX_ROW_SIZE;
    if (remaining(*raw, end) < table_size) {
        OLSPELL_THROW_MESSAGE(IndexTableReadingException,
                              "Index table ended unexpectedly");
    }
    (*raw) += table_size;
}

void
IndexTable::validate(SymbolNumber symbol_count,
                     TransitionTableIndex transition_count) const
{
    for (TransitionTableIndex i = 0; i < size; ++i) {
        SymbolNumber input = input_symbol(i);
        if (input == NO_SYMBOL) {
            continue; // finality or unused row
        }
        if (input >= symbol_count) {
            OLSPELL_THROW_MESSAGE(IndexTableReadingException,
                                  row_message("Symbol out of range", i));
        }
        TransitionTableIndex t = target(i);
        if (t < TARGET_TABLE || t - TARGET_TABLE >= transition_count) {
            OLSPELL_THROW_MESSAGE(IndexTableReadingException,
                                  row_message("Target outside transition table", i));
        }
    }
}

SymbolNumber
IndexTable::input_symbol(TransitionTableIndex i) const
{
    if (i < size) {
        return read_uint16_le(indices + INDEX_ROW_SIZE * i);
    } else {
        return NO_SYMBOL;
    }
}

TransitionTableIndex
IndexTable::target(TransitionTableIndex i) const
{
    if (i < size) {
        return read_uint32_le(indices + INDEX_ROW_SIZE * i +
                              sizeof(SymbolNumber));
    } else {
        return NO_TABLE_INDEX;
    }
}

bool
IndexTable::final(TransitionTableIndex i) const
{
    return input_symbol(i) == NO_SYMBOL && target(i) != NO_TABLE_INDEX;
}

Weight
IndexTable::final_weight(TransitionTableIndex i) const
{
    if (i >= size) {
        return INFINITE_WEIGHT;
    }
    if (!weighted) {
        return 0.0;
    }
    return read_weight_le(indices + INDEX_ROW_SIZE * i + sizeof(SymbolNumber));
}

TransitionTable::TransitionTable(const char** raw, const char* end,
                                 TransitionTableIndex transition_count,
                                 bool weighted_table):
    transitions(*raw),
    size(transition_count),
    weighted(weighted_table),
    row_size(weighted_table ? WEIGHTED_TRANSITION_ROW_SIZE
                            : UNWEIGHTED_TRANSITION_ROW_SIZE)
{
    uint64_t table_size = static_cast<uint64_t>(transition_count) * row_size;
    if (remaining(*raw, end) < table_size) {
        OLSPELL_THROW_MESSAGE(TransitionTableReadingException,
                              "Transition table ended unexpectedly");
    }
    (*raw) += table_size;
}

void
TransitionTable::validate(SymbolNumber symbol_count,
                          TransitionTableIndex index_count) const
{
    for (TransitionTableIndex i = 0; i < size; ++i) {
        if (marker(i)) {
            continue;
        }
        if (input_symbol(i) >= symbol_count || output_symbol(i) >= symbol_count) {
            OLSPELL_THROW_MESSAGE(TransitionTableReadingException,
                                  row_message("Symbol out of range", i));
        }
        TransitionTableIndex t = target(i);
        bool in_index = t < index_count;
        bool in_transitions = t >= TARGET_TABLE && t - TARGET_TABLE < size;
        if (!in_index && !in_transitions) {
            OLSPELL_THROW_MESSAGE(TransitionTableReadingException,
                                  row_message("Target outside both tables", i));
        }
    }
}

SymbolNumber
TransitionTable::input_symbol(TransitionTableIndex i) const
{
    if (i < size) {
        return read_uint16_le(row(i));
    } else {
        return NO_SYMBOL;
    }
}

SymbolNumber
TransitionTable::output_symbol(TransitionTableIndex i) const
{
    if (i < size) {
        return read_uint16_le(row(i) + sizeof(SymbolNumber));
    } else {
        return NO_SYMBOL;
    }
}

TransitionTableIndex
TransitionTable::target(TransitionTableIndex i) const
{
    if (i < size) {
        return read_uint32_le(row(i) + 2 * sizeof(SymbolNumber));
    } else {
        return NO_TABLE_INDEX;
    }
}

Weight
TransitionTable::weight(TransitionTableIndex i) const
{
    if (i >= size) {
        return INFINITE_WEIGHT;
    }
    if (!weighted) {
        return 0.0;
    }
    return read_weight_le(row(i) + 2 * sizeof(SymbolNumber) +
                          sizeof(TransitionTableIndex));
}

bool
TransitionTable::final(TransitionTableIndex i) const
{
    return marker(i) && target(i) == 1;
}

bool
TransitionTable::marker(TransitionTableIndex i) const
{
    return input_symbol(i) == NO_SYMBOL && output_symbol(i) == NO_SYMBOL;
}

void LetterTrie::add_string(const char * p, SymbolNumber symbol_key)
{
    if (*(p+1) == 0)
    {
        symbols[(unsigned char)(*p)] = symbol_key;
        return;
    }
    if (letters[(unsigned char)(*p)] == NULL)
    {
        letters[(unsigned char)(*p)] = new LetterTrie();
    }
    letters[(unsigned char)(*p)]->add_string(p+1,symbol_key);
}

SymbolNumber LetterTrie::find_key(const char ** p) const
{
    const char * old_p = *p;
    ++(*p);
    if (letters[(unsigned char)(*old_p)] == NULL)
    {
        return symbols[(unsigned char)(*old_p)];
    }
    SymbolNumber s = letters[(unsigned char)(*old_p)]->find_key(p);
    if (s == NO_SYMBOL)
    {
        --(*p);
        return symbols[(unsigned char)(*old_p)];
    }
    return s;
}

bool LetterTrie::has_key_starting_with(const char c) const
{
    return letters[(unsigned char) c] != NULL;
}

LetterTrie::~LetterTrie()
{
    for (size_t i = 0; i < letters.size(); ++i)
    {
        delete letters[i];
    }
}

Encoder::Encoder(const KeyTable& kt, SymbolNumber number_of_input_symbols):
    ascii_symbols(UCHAR_MAX+1,NO_SYMBOL)
{
    for (SymbolNumber k = 0; k < number_of_input_symbols && k < kt.size(); ++k)
    {
        read_input_symbol(kt[k].c_str(), k);
    }
}

void Encoder::read_input_symbol(const char * s, const int s_num)
{
    if (strlen(s) == 0) { // ignore empty strings
        return;
    }
    if ((strlen(s) == 1) && (unsigned char)(*s) <= 127 &&
        !letters.has_key_starting_with(*s))
    {
        // an ascii symbol with no longer symbol sharing its first byte
        ascii_symbols[(unsigned char)(*s)] = static_cast<SymbolNumber>(s_num);
    } else if ((unsigned char)(*s) <= 127 &&
               ascii_symbols[(unsigned char)(*s)] != NO_SYMBOL) {
        // a longer symbol shadows the shortcut
        ascii_symbols[(unsigned char)(*s)] = NO_SYMBOL;
    }

    letters.add_string(s, static_cast<SymbolNumber>(s_num));
}

SymbolNumber Encoder::find_key(const char ** p) const
{
    if (**p == '\0')
    {
        return NO_SYMBOL;
    }
    if (ascii_symbols[(unsigned char)(**p)] == NO_SYMBOL)
    {
        const char * start = *p;
        SymbolNumber s = letters.find_key(p);
        if (s == NO_SYMBOL)
        {
            *p = start;
        }
        return s;
    }
    SymbolNumber s = ascii_symbols[(unsigned char)(**p)];
    ++(*p);
    return s;
}

int nByte_utf8(unsigned char c)
{
    /* utility function to determine how many bytes to peel off as
       a utf-8 character for representing as OTHER */
    if (c <= 127) {
        return 1;
    } else if ( (c & (128 + 64 + 32 + 16)) == (128 + 64 + 32 + 16) ) {
        return 4;
    } else if ( (c & (128 + 64 + 32 )) == (128 + 64 + 32) ) {
        return 3;
    } else if ( (c & (128 + 64 )) == (128 + 64)) {
        return 2;
    } else {
        return 0;
    }
}

} // namespace olspell
