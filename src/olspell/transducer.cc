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

#include "transducer.h"

namespace olspell {

namespace {

const char* checked_begin(const ByteBufferPtr& buffer)
{
    if (!buffer) {
        OLSPELL_THROW_MESSAGE(HeaderParsingException, "No transducer data");
    }
    return buffer->data();
}

} // anonymous namespace

TransitionRange::iterator::iterator() :
    transducer_(NULL),
    state_(0),
    symbol_(0),
    index_(NO_TABLE_INDEX)
{
    arc_.input = NO_SYMBOL;
    arc_.output = NO_SYMBOL;
    arc_.target = NO_TABLE_INDEX;
    arc_.weight = INFINITE_WEIGHT;
}

TransitionRange::iterator::iterator(const Transducer* t,
                                    TransitionTableIndex state) :
    transducer_(t),
    state_(state),
    symbol_(0),
    index_(NO_TABLE_INDEX)
{
    seek(0);
}

bool
TransitionRange::iterator::load(TransitionTableIndex i)
{
    STransition t = (symbol_ == 0) ?
        transducer_->take_epsilons_and_flags(i) :
        transducer_->take_non_epsilons(i, symbol_);
    if (t.symbol == NO_SYMBOL) {
        return false;
    }
    index_ = i;
    arc_.input = transducer_->transition_input_symbol(i);
    arc_.output = t.symbol;
    arc_.target = t.index;
    arc_.weight = t.weight;
    return true;
}

void
TransitionRange::iterator::seek(SymbolNumber from_symbol)
{
    SymbolNumber count = transducer_->symbol_count();
    for (symbol_ = from_symbol; symbol_ < count; ++symbol_) {
        if (symbol_ == 0) {
            if (transducer_->has_epsilons_or_flags(state_) &&
                load(transducer_->next(state_, 0))) {
                return;
            }
            continue;
        }
        // flags were listed along with the epsilons
        if (transducer_->is_flag(symbol_)) {
            continue;
        }
        if (transducer_->has_transitions(state_, symbol_) &&
            load(transducer_->next(state_, symbol_))) {
            return;
        }
    }
    // past the end
    transducer_ = NULL;
    state_ = 0;
    symbol_ = 0;
    index_ = NO_TABLE_INDEX;
}

TransitionRange::iterator&
TransitionRange::iterator::operator++()
{
    if (transducer_ == NULL) {
        return *this;
    }
    if (!load(index_ + 1)) {
        seek(static_cast<SymbolNumber>(symbol_ + 1));
    }
    return *this;
}

bool
TransitionRange::iterator::operator==(const iterator& other) const
{
    return transducer_ == other.transducer_ &&
        state_ == other.state_ &&
        symbol_ == other.symbol_ &&
        index_ == other.index_;
}

TransitionRange::TransitionRange(const Transducer& t,
                                 TransitionTableIndex state) :
    transducer_(&t),
    state_(state)
{}

TransitionRange::iterator
TransitionRange::begin() const
{
    return iterator(transducer_, state_);
}

TransitionRange::iterator
TransitionRange::end() const
{
    return iterator();
}

HfstTransducer::HfstTransducer(ByteBufferPtr buffer) :
    buffer_(buffer),
    cursor_(checked_begin(buffer)),
    end_(cursor_ + buffer->size()),
    header(&cursor_, end_),
    alphabet(&cursor_, end_, header.symbol_count()),
    encoder(alphabet.get_key_table(), header.input_symbol_count()),
    indices(&cursor_, end_, header.index_table_size(),
            header.probe_flag(Weighted)),
    transitions(&cursor_, end_, header.target_table_size(),
                header.probe_flag(Weighted))
{
    indices.validate(header.symbol_count(), header.target_table_size());
    transitions.validate(header.symbol_count(), header.index_table_size());
}

HfstTransducer::HfstTransducer(const std::string& filename) :
    HfstTransducer(map_file(filename))
{}

TransitionTableIndex
HfstTransducer::scan(TransitionTableIndex s, SymbolNumber symbol) const
{
    for (TransitionTableIndex i = s - TARGET_TABLE + 1;
         i < transitions.entries() && !transitions.marker(i); ++i) {
        if (transitions.input_symbol(i) == symbol) {
            return i;
        }
    }
    return NO_TABLE_INDEX;
}

bool
HfstTransducer::is_final(TransitionTableIndex s) const
{
    if (s >= TARGET_TABLE) {
        return transitions.final(s - TARGET_TABLE);
    } else {
        return indices.final(s);
    }
}

Weight
HfstTransducer::final_weight(TransitionTableIndex s) const
{
    if (s >= TARGET_TABLE) {
        return transitions.weight(s - TARGET_TABLE);
    } else {
        return indices.final_weight(s);
    }
}

bool
HfstTransducer::has_transitions(TransitionTableIndex s,
                                SymbolNumber symbol) const
{
    if (symbol == NO_SYMBOL) {
        return false;
    }
    if (s >= TARGET_TABLE) {
        return scan(s, symbol) != NO_TABLE_INDEX;
    } else {
        return indices.input_symbol(s + 1 + symbol) == symbol;
    }
}

bool
HfstTransducer::has_epsilons_or_flags(TransitionTableIndex s) const
{
    if (s >= TARGET_TABLE) {
        SymbolNumber first = transitions.input_symbol(s - TARGET_TABLE + 1);
        return first == 0 || alphabet.is_flag(first);
    } else {
        return indices.input_symbol(s + 1) == 0;
    }
}

TransitionTableIndex
HfstTransducer::next(TransitionTableIndex s, SymbolNumber symbol) const
{
    if (s >= TARGET_TABLE) {
        if (symbol == 0) {
            return s - TARGET_TABLE + 1;
        }
        return scan(s, symbol);
    } else {
        TransitionTableIndex t = indices.target(s + 1 + symbol);
        if (t == NO_TABLE_INDEX) {
            return NO_TABLE_INDEX;
        }
        return t - TARGET_TABLE;
    }
}

STransition
HfstTransducer::take_epsilons(TransitionTableIndex i) const
{
    if (transitions.input_symbol(i) != 0) {
        return STransition(0, NO_SYMBOL);
    }
    return STransition(transitions.target(i),
                       transitions.output_symbol(i),
                       transitions.weight(i));
}

STransition
HfstTransducer::take_epsilons_and_flags(TransitionTableIndex i) const
{
    SymbolNumber input = transitions.input_symbol(i);
    if (input != 0 && !alphabet.is_flag(input)) {
        return STransition(0, NO_SYMBOL);
    }
    return STransition(transitions.target(i),
                       transitions.output_symbol(i),
                       transitions.weight(i));
}

STransition
HfstTransducer::take_non_epsilons(TransitionTableIndex i,
                                  SymbolNumber symbol) const
{
    if (transitions.input_symbol(i) != symbol) {
        return STransition(0, NO_SYMBOL);
    }
    return STransition(transitions.target(i),
                       transitions.output_symbol(i),
                       transitions.weight(i));
}

SymbolNumber
HfstTransducer::transition_input_symbol(TransitionTableIndex i) const
{
    return transitions.input_symbol(i);
}

const TransducerAlphabet&
HfstTransducer::get_alphabet() const
{
    return alphabet;
}

const Encoder&
HfstTransducer::get_encoder() const
{
    return encoder;
}

const TransducerHeader&
HfstTransducer::get_header() const
{
    return header;
}

bool
HfstTransducer::is_weighted() const
{
    return header.probe_flag(Weighted);
}

IdentityTransducer::IdentityTransducer(const TransducerAlphabet& alphabet) :
    alphabet_(alphabet)
{}

bool
IdentityTransducer::accepts(SymbolNumber symbol) const
{
    return symbol != 0 && symbol != NO_SYMBOL && !alphabet_.is_flag(symbol);
}

bool
IdentityTransducer::is_final(TransitionTableIndex s) const
{
    return s == 0;
}

Weight
IdentityTransducer::final_weight(TransitionTableIndex s) const
{
    return s == 0 ? 0.0 : INFINITE_WEIGHT;
}

bool
IdentityTransducer::has_transitions(TransitionTableIndex s,
                                    SymbolNumber symbol) const
{
    return s == 0 && accepts(symbol);
}

bool
IdentityTransducer::has_epsilons_or_flags(TransitionTableIndex) const
{
    return false;
}

TransitionTableIndex
IdentityTransducer::next(TransitionTableIndex s, SymbolNumber symbol) const
{
    // the transition for a symbol sits at the symbol's own number
    return has_transitions(s, symbol) ? symbol : NO_TABLE_INDEX;
}

STransition
IdentityTransducer::take_epsilons(TransitionTableIndex) const
{
    return STransition(0, NO_SYMBOL);
}

STransition
IdentityTransducer::take_epsilons_and_flags(TransitionTableIndex) const
{
    return STransition(0, NO_SYMBOL);
}

STransition
IdentityTransducer::take_non_epsilons(TransitionTableIndex i,
                                      SymbolNumber symbol) const
{
    if (i != symbol || !accepts(symbol)) {
        return STransition(0, NO_SYMBOL);
    }
    return STransition(0, symbol, 0.0);
}

SymbolNumber
IdentityTransducer::transition_input_symbol(TransitionTableIndex i) const
{
    return i < NO_SYMBOL ? static_cast<SymbolNumber>(i) : NO_SYMBOL;
}

const TransducerAlphabet&
IdentityTransducer::get_alphabet() const
{
    return alphabet_;
}

} // namespace olspell
