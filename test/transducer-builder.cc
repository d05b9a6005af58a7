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

#include "transducer-builder.h"

#include <algorithm>
#include <cstring>

namespace olspell {

namespace {

void put_u16(std::string& out, uint16_t v)
{
    out += static_cast<char>(v & 0xFF);
    out += static_cast<char>((v >> 8) & 0xFF);
}

void put_u32(std::string& out, uint32_t v)
{
    for (int i = 0; i < 4; ++i) {
        out += static_cast<char>((v >> (8 * i)) & 0xFF);
    }
}

uint32_t weight_bits(Weight w)
{
    uint32_t bits;
    memcpy(&bits, &w, sizeof(bits));
    return bits;
}

// epsilons and flags first, then by input symbol
struct ArcOrder
{
    explicit ArcOrder(const std::vector<bool>& flags) : flags_(flags) {}
    template<typename A>
    bool operator()(const A& lhs, const A& rhs) const
    {
        return key(lhs.input) < key(rhs.input);
    }
    unsigned int key(SymbolNumber s) const
    {
        return (s == 0 || flags_[s]) ? 0 : s;
    }
    const std::vector<bool>& flags_;
};

} // anonymous namespace

TransducerBuilder::TransducerBuilder(bool weighted) :
    weighted_(weighted)
{
    symbols_.push_back("@_EPSILON_SYMBOL_@");
    symbol_numbers_[""] = 0;
    add_state();
}

SymbolNumber
TransducerBuilder::symbol(const std::string& name)
{
    std::map<std::string, SymbolNumber>::const_iterator it =
        symbol_numbers_.find(name);
    if (it != symbol_numbers_.end()) {
        return it->second;
    }
    SymbolNumber s = static_cast<SymbolNumber>(symbols_.size());
    symbols_.push_back(name);
    symbol_numbers_[name] = s;
    return s;
}

unsigned int
TransducerBuilder::add_state()
{
    State state;
    state.final = false;
    state.weight = 0.0;
    states_.push_back(state);
    return static_cast<unsigned int>(states_.size() - 1);
}

void
TransducerBuilder::add_arc(unsigned int from, const std::string& input,
                           const std::string& output, unsigned int to,
                           Weight weight)
{
    Arc arc;
    arc.input = symbol(input);
    arc.output = symbol(output);
    arc.target = to;
    arc.weight = weight;
    states_.at(from).arcs.push_back(arc);
}

void
TransducerBuilder::set_final(unsigned int state, Weight weight)
{
    states_.at(state).final = true;
    states_.at(state).weight = weight;
}

void
TransducerBuilder::add_word(const std::string& word, Weight weight)
{
    std::vector<std::string> chars = utf8_characters(word);
    unsigned int state = 0;
    for (size_t i = 0; i < chars.size(); ++i) {
        unsigned int next = add_state();
        add_arc(state, chars[i], chars[i], next);
        state = next;
    }
    set_final(state, weight);
}

void
TransducerBuilder::set_hfst3_type(const std::string& type)
{
    hfst3_type_ = type;
}

bool
TransducerBuilder::is_flag(SymbolNumber s) const
{
    const std::string& name = symbols_[s];
    return name.size() >= 3 && name[0] == '@' && name[2] == '.' &&
        name[1] >= 'A' && name[1] <= 'Z';
}

std::string
TransducerBuilder::build(Layout* layout) const
{
    const SymbolNumber symbol_count = static_cast<SymbolNumber>(symbols_.size());
    std::vector<bool> flags(symbol_count, false);
    for (SymbolNumber s = 0; s < symbol_count; ++s) {
        flags[s] = is_flag(s);
    }
    ArcOrder order(flags);

    std::vector<std::vector<Arc> > sorted(states_.size());
    std::vector<uint32_t> position(states_.size(), 0);
    uint32_t rows = 0;
    uint32_t arc_count = 0;
    for (size_t k = 0; k < states_.size(); ++k) {
        sorted[k] = states_[k].arcs;
        std::stable_sort(sorted[k].begin(), sorted[k].end(), order);
        position[k] = rows;
        rows += 1 + static_cast<uint32_t>(sorted[k].size());
        arc_count += static_cast<uint32_t>(sorted[k].size());
    }
    const uint32_t index_rows = symbol_count + 1;

    std::string out;
    if (!hfst3_type_.empty()) {
        std::string props("version");
        props += '\0';
        props += "3.3";
        props += '\0';
        props += "type";
        props += '\0';
        props += hfst3_type_;
        props += '\0';
        out.append("HFST", 5);
        put_u16(out, static_cast<uint16_t>(props.size()));
        out += '\0';
        out += props;
    }
    if (layout != NULL) {
        layout->header = out.size();
    }
    put_u16(out, symbol_count); // input symbols
    put_u16(out, symbol_count);
    put_u32(out, index_rows);
    put_u32(out, rows);
    put_u32(out, static_cast<uint32_t>(states_.size()));
    put_u32(out, arc_count);
    put_u32(out, weighted_ ? 1 : 0);
    for (int i = 0; i < 8; ++i) {
        put_u32(out, 0);
    }
    for (SymbolNumber s = 0; s < symbol_count; ++s) {
        out += symbols_[s];
        out += '\0';
    }

    // index table: the start state only
    if (layout != NULL) {
        layout->index_table = out.size();
    }
    std::vector<SymbolNumber> index_input(index_rows, NO_SYMBOL);
    std::vector<uint32_t> index_target(index_rows, NO_TABLE_INDEX);
    if (states_[0].final) {
        index_target[0] = weighted_ ? weight_bits(states_[0].weight) : 1;
    }
    for (size_t i = 0; i < sorted[0].size(); ++i) {
        SymbolNumber key = static_cast<SymbolNumber>(order.key(sorted[0][i].input));
        if (index_input[1 + key] == NO_SYMBOL) {
            index_input[1 + key] = key;
            index_target[1 + key] = TARGET_TABLE + position[0] + 1 +
                static_cast<uint32_t>(i);
        }
    }
    for (uint32_t i = 0; i < index_rows; ++i) {
        put_u16(out, index_input[i]);
        put_u32(out, index_target[i]);
    }

    if (layout != NULL) {
        layout->transition_table = out.size();
    }
    for (size_t k = 0; k < states_.size(); ++k) {
        put_u16(out, NO_SYMBOL);
        put_u16(out, NO_SYMBOL);
        put_u32(out, states_[k].final ? 1 : 0);
        if (weighted_) {
            put_u32(out, weight_bits(states_[k].final ? states_[k].weight
                                                      : INFINITE_WEIGHT));
        }
        for (size_t i = 0; i < sorted[k].size(); ++i) {
            const Arc& arc = sorted[k][i];
            put_u16(out, arc.input);
            put_u16(out, arc.output);
            put_u32(out, arc.target == 0 ? 0 : TARGET_TABLE + position[arc.target]);
            if (weighted_) {
                put_u32(out, weight_bits(arc.weight));
            }
        }
    }
    return out;
}

ByteBufferPtr
TransducerBuilder::buffer() const
{
    return ByteBufferPtr(new MemoryBuffer(build()));
}

HfstTransducerPtr
TransducerBuilder::transducer() const
{
    return HfstTransducerPtr(new HfstTransducer(buffer()));
}

std::vector<std::string>
utf8_characters(const std::string& s)
{
    std::vector<std::string> rv;
    size_t i = 0;
    while (i < s.size()) {
        int n = nByte_utf8(static_cast<unsigned char>(s[i]));
        if (n == 0) {
            n = 1;
        }
        rv.push_back(s.substr(i, n));
        i += n;
    }
    return rv;
}

HfstTransducerPtr
make_lexicon(const std::vector<std::string>& words)
{
    TransducerBuilder builder;
    for (size_t i = 0; i < words.size(); ++i) {
        builder.add_word(words[i]);
    }
    return builder.transducer();
}

TransducerBuilder
identity_error_model(const std::string& alphabet)
{
    TransducerBuilder builder;
    builder.set_final(0);
    std::vector<std::string> chars = utf8_characters(alphabet);
    for (size_t i = 0; i < chars.size(); ++i) {
        builder.add_arc(0, chars[i], chars[i], 0);
    }
    return builder;
}

} // namespace olspell
