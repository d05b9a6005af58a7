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

#include "ospell.h"

#include <map>
#include <queue>
#include <utility>

#include "case-handling.h"

namespace olspell {

namespace {

typedef std::chrono::steady_clock SearchClock;

const HfstTransducer& checked_lexicon(const HfstTransducerPtr& lexicon)
{
    if (!lexicon) {
        throw std::invalid_argument("Speller needs a lexicon");
    }
    return *lexicon;
}

// Everything that decides how a node can go on. Two nodes with equal keys
// have the same futures, so only the lighter one needs to be searched.
// Besides the two states and the input position, the key holds the flag
// state, which limits the lexicon paths still open, and the output, so that
// different corrections reaching one configuration are all kept.
struct SearchKey
{
    TransitionTableIndex lexicon_state;
    TransitionTableIndex mutator_state;
    unsigned int input_state;
    FlagDiacriticState flag_state;
    SymbolVector string;

    explicit SearchKey(const TreeNode& n) :
        lexicon_state(n.lexicon_state),
        mutator_state(n.mutator_state),
        input_state(n.input_state),
        flag_state(n.flag_state),
        string(n.string)
    {}

    bool operator<(const SearchKey& rhs) const
    {
        if (lexicon_state != rhs.lexicon_state) {
            return lexicon_state < rhs.lexicon_state;
        }
        if (mutator_state != rhs.mutator_state) {
            return mutator_state < rhs.mutator_state;
        }
        if (input_state != rhs.input_state) {
            return input_state < rhs.input_state;
        }
        if (flag_state != rhs.flag_state) {
            return flag_state < rhs.flag_state;
        }
        return string < rhs.string;
    }
};

struct QueuedNode
{
    TreeNode node;
    unsigned long sequence; //< order of insertion, breaks weight ties

    QueuedNode(const TreeNode& n, unsigned long s) : node(n), sequence(s) {}
};

// @brief comparison for the search frontier
//
// The lightest node comes out first, and of equally heavy nodes the one
// queued first.
class NodeWeightComparison
{
public:
    bool operator()(const QueuedNode& lhs, const QueuedNode& rhs) const
    { // return true when we want rhs to appear before lhs
        if (lhs.node.weight != rhs.node.weight) {
            return lhs.node.weight > rhs.node.weight;
        }
        return lhs.sequence > rhs.sequence;
    }
};

typedef std::priority_queue<QueuedNode,
                            std::vector<QueuedNode>,
                            NodeWeightComparison> NodeQueue;

// One query through an error model and a lexicon.
//
// Input symbols are numbered as in the error model; numbers past the end
// of the translator are characters of this query that no alphabet knows.
// Output symbols are numbered as in the output key table, again followed
// by the characters of this query.
class Search
{
public:
    enum Mode
    {
        Check,
        Correct,
        Lookup
    };

    Search(const Transducer& mutator_model,
           const Transducer& lexicon_model,
           const Encoder& input_encoder,
           const SymbolVector& alphabet_translator,
           const KeyTable& output_key_table,
           Mode search_mode,
           const SpellerConfig& search_config,
           const CancellationToken* cancel_token,
           const SearchClock::time_point* search_deadline) :
        mutator(mutator_model),
        lexicon(lexicon_model),
        encoder(input_encoder),
        translator(alphabet_translator),
        output_keys(output_key_table),
        mode(search_mode),
        config(search_config),
        cancel(cancel_token),
        deadline(search_deadline),
        bound(search_config.max_epsilon_steps),
        sequence(0),
        ranker(search_mode == Correct ? search_config.n_best : 0),
        have_best(false),
        best_weight(0.0),
        accepted(false)
    {}

    bool init_input(const std::string& word);
    SearchStatus run();

    bool is_accepted() const { return accepted; }
    StringWeightVector get_results() const { return ranker.results(); }
    const SearchStats& get_stats() const { return stats; }

private:
    SymbolNumber translate(SymbolNumber symbol) const;
    SymbolNumber translate_output(SymbolNumber output, SymbolNumber input_symbol) const;
    std::string stringify(const SymbolVector& symbols) const;
    bool over_limit(Weight w) const;
    bool stale(const TreeNode& node) const;
    void push(const TreeNode& node);

    void expand(const TreeNode& node);
    void lexicon_epsilons(const TreeNode& node);
    void mutator_epsilons(const TreeNode& node);
    void consume_input(const TreeNode& node);
    void queue_lexicon_arcs(const TreeNode& node,
                            SymbolNumber lexicon_symbol,
                            TransitionTableIndex mutator_state,
                            Weight mutator_weight,
                            unsigned int input_increment);

    const Transducer& mutator;
    const Transducer& lexicon;
    const Encoder& encoder;
    const SymbolVector& translator;
    const KeyTable& output_keys;
    Mode mode;
    const SpellerConfig& config;
    const CancellationToken* cancel;
    const SearchClock::time_point* deadline;
    TraversalBound bound;

    SymbolVector input;              //< current input
    SymbolVector local_translation;  //< lexicon side of unknown characters
    KeyTable local_keys;             //< the unknown characters themselves
    NodeQueue queue;
    std::map<SearchKey, Weight> memo; //< lightest weight per key so far
    unsigned long sequence;
    SuggestionRanker ranker;
    bool have_best;
    Weight best_weight;
    bool accepted;
    SearchStats stats;
};

bool Search::init_input(const std::string& word)
{
    // Initialize the symbol vector to the tokenization given by encoder.
    // In the case of tokenization failure, valid utf-8 characters
    // are tokenized as unknown and tokenization is reattempted from
    // such a character onwards. The empty string is tokenized as an
    // empty vector; there is no end marker.
    input.clear();
    local_translation.clear();
    local_keys.clear();
    std::map<std::string, SymbolNumber> local_symbols;
    const size_t input_base = translator.size();
    const size_t output_base = output_keys.size();
    const char* p = word.c_str();
    const char* end = p + word.size();

    while (p < end) {
        if (*p == '\0') {
            return false;
        }
        const char* oldpointer = p;
        SymbolNumber k = encoder.find_key(&p);
        if (k != NO_SYMBOL) {
            input.push_back(k);
            continue;
        }
        int bytes_to_tokenize = nByte_utf8(static_cast<unsigned char>(*oldpointer));
        if (bytes_to_tokenize == 0 || oldpointer + bytes_to_tokenize > end) {
            return false; // can't parse utf-8 character, admit failure
        }
        std::string new_symbol(oldpointer, bytes_to_tokenize);
        p = oldpointer + bytes_to_tokenize;
        std::map<std::string, SymbolNumber>::const_iterator known =
            local_symbols.find(new_symbol);
        if (known != local_symbols.end()) {
            input.push_back(known->second);
            continue;
        }
        size_t j = local_keys.size();
        if (input_base + j >= NO_SYMBOL || output_base + j >= NO_SYMBOL) {
            return false;
        }
        SymbolNumber lexicon_symbol =
            lexicon.get_alphabet().id_for_text(new_symbol);
        if (lexicon_symbol == NO_SYMBOL) {
            lexicon_symbol = static_cast<SymbolNumber>(output_base + j);
        }
        local_keys.push_back(new_symbol);
        local_translation.push_back(lexicon_symbol);
        SymbolNumber input_symbol = static_cast<SymbolNumber>(input_base + j);
        local_symbols[new_symbol] = input_symbol;
        input.push_back(input_symbol);
    }
    return true;
}

SymbolNumber Search::translate(SymbolNumber symbol) const
{
    if (symbol < translator.size()) {
        return translator[symbol];
    }
    size_t j = symbol - translator.size();
    return j < local_translation.size() ? local_translation[j] : NO_SYMBOL;
}

SymbolNumber Search::translate_output(SymbolNumber output,
                                      SymbolNumber input_symbol) const
{
    // identity, and unknown read for an unknown input, copy the input
    bool copies_input = output == mutator.get_identity() ||
        (output == mutator.get_unknown() && input_symbol != NO_SYMBOL &&
         input_symbol >= mutator.symbol_count());
    if (copies_input) {
        return input_symbol == NO_SYMBOL ? NO_SYMBOL : translate(input_symbol);
    }
    return translate(output);
}

std::string Search::stringify(const SymbolVector& symbols) const
{
    std::string s;
    for (SymbolVector::const_iterator it = symbols.begin();
         it != symbols.end(); ++it) {
        if (*it < output_keys.size()) {
            s.append(output_keys[*it]);
        } else if (*it - output_keys.size() < local_keys.size()) {
            s.append(local_keys[*it - output_keys.size()]);
        }
    }
    return s;
}

bool Search::over_limit(Weight w) const
{
    if (config.max_weight >= 0.0 && w > config.max_weight) {
        return true;
    }
    return have_best && config.beam >= 0.0 && w > best_weight + config.beam;
}

bool Search::stale(const TreeNode& node) const
{
    std::map<SearchKey, Weight>::const_iterator it = memo.find(SearchKey(node));
    return it != memo.end() && it->second < node.weight;
}

void Search::push(const TreeNode& node)
{
    if (over_limit(node.weight)) {
        return;
    }
    if (!node.complete) {
        if (bound.check(node.epsilon_steps) == CycleBound) {
            ++stats.cycle_bound_prunes;
            return;
        }
        SearchKey key(node);
        std::map<SearchKey, Weight>::iterator it = memo.find(key);
        if (it != memo.end()) {
            if (node.weight >= it->second) {
                ++stats.memo_discards;
                return;
            }
            it->second = node.weight;
        } else {
            memo.insert(std::make_pair(key, node.weight));
        }
    }
    queue.push(QueuedNode(node, sequence++));
}

SearchStatus Search::run()
{
    push(TreeNode(FlagDiacriticState(lexicon.get_state_size(), 0)));

    while (!queue.empty()) {
        if (cancel != NULL && cancel->cancelled()) {
            return Cancelled;
        }
        if (deadline != NULL && SearchClock::now() >= *deadline) {
            return TimeLimit;
        }
        TreeNode next_node = queue.top().node;
        queue.pop();
        // the queue is ordered, so everything after this is over too
        if (over_limit(next_node.weight)) {
            break;
        }
        if (!next_node.complete && stale(next_node)) {
            continue;
        }
        ++stats.nodes_expanded;
        if (next_node.complete) {
            if (mode == Check) {
                accepted = true;
                break;
            }
            if (ranker.add(stringify(next_node.string), next_node.weight)) {
                if (!have_best) {
                    have_best = true;
                    best_weight = next_node.weight;
                }
                if (mode == Correct && config.n_best > 0 &&
                    ranker.size() >= config.n_best) {
                    break;
                }
            }
            continue;
        }
        expand(next_node);
    }
    return Complete;
}

void Search::expand(const TreeNode& node)
{
    lexicon_epsilons(node);
    mutator_epsilons(node);
    consume_input(node);
    if (node.input_state == input.size() &&
        mutator.is_final(node.mutator_state) &&
        lexicon.is_final(node.lexicon_state)) {
        push(node.finish(mutator.final_weight(node.mutator_state) +
                         lexicon.final_weight(node.lexicon_state)));
    }
}

void Search::lexicon_epsilons(const TreeNode& node)
{
    TraversalStepVector steps;
    epsilon_steps(lexicon, node.lexicon_state, node.flag_state, steps, stats);
    for (TraversalStepVector::const_iterator it = steps.begin();
         it != steps.end(); ++it) {
        // only analyses print what the lexicon writes on epsilon input
        SymbolNumber output = 0;
        if (mode == Lookup && it->input == 0) {
            output = it->transition.symbol;
        }
        push(node.update_lexicon(output, it->transition.index, it->flags,
                                 it->transition.weight));
    }
}

void Search::mutator_epsilons(const TreeNode& node)
{
    TraversalStepVector steps;
    insertion_steps(mutator, node.mutator_state, steps);
    for (TraversalStepVector::const_iterator it = steps.begin();
         it != steps.end(); ++it) {
        if (it->transition.symbol == 0) {
            push(node.update_mutator(it->transition.index,
                                     it->transition.weight));
            continue;
        }
        queue_lexicon_arcs(node,
                           translate_output(it->transition.symbol, NO_SYMBOL),
                           it->transition.index, it->transition.weight, 0);
    }
}

void Search::consume_input(const TreeNode& node)
{
    if (node.input_state >= input.size()) {
        return; // not enough input to consume
    }
    SymbolNumber input_sym = input[node.input_state];
    bool known = input_sym < mutator.symbol_count() ||
        mutator.has_transitions(node.mutator_state, input_sym);
    TraversalStepVector steps;
    symbol_steps(mutator, node.mutator_state, input_sym, known, steps);
    for (TraversalStepVector::const_iterator it = steps.begin();
         it != steps.end(); ++it) {
        if (it->transition.symbol == 0) {
            // deletion
            push(node.update(0, node.input_state + 1,
                             it->transition.index,
                             node.lexicon_state,
                             it->transition.weight));
            continue;
        }
        queue_lexicon_arcs(node,
                           translate_output(it->transition.symbol, input_sym),
                           it->transition.index, it->transition.weight, 1);
    }
}

void Search::queue_lexicon_arcs(const TreeNode& node,
                                SymbolNumber lexicon_symbol,
                                TransitionTableIndex mutator_state,
                                Weight mutator_weight,
                                unsigned int input_increment)
{
    if (lexicon_symbol == NO_SYMBOL) {
        return;
    }
    TraversalStepVector steps;
    symbol_steps(lexicon, node.lexicon_state, lexicon_symbol,
                 lexicon_symbol < lexicon.symbol_count(), steps);
    for (TraversalStepVector::const_iterator it = steps.begin();
         it != steps.end(); ++it) {
        SymbolNumber output = 0;
        if (mode == Correct) {
            // corrections are written in the lexicon's surface symbols
            output = lexicon_symbol;
        } else if (mode == Lookup) {
            output = it->transition.symbol;
            if (it->input != lexicon_symbol &&
                (output == lexicon.get_identity() ||
                 output == lexicon.get_unknown())) {
                output = lexicon_symbol;
            }
        }
        push(node.update(output,
                         node.input_state + input_increment,
                         mutator_state,
                         it->transition.index,
                         mutator_weight + it->transition.weight));
    }
}

} // anonymous namespace

TreeNode TreeNode::update_lexicon(SymbolNumber symbol,
                                  TransitionTableIndex next_lexicon,
                                  const FlagDiacriticState& next_flags,
                                  Weight w) const
{
    SymbolVector str(this->string);
    if (symbol != 0) {
        str.push_back(symbol);
    }
    return TreeNode(str,
                    this->input_state,
                    this->mutator_state,
                    next_lexicon,
                    next_flags,
                    this->weight + w,
                    this->epsilon_steps + 1);
}

TreeNode TreeNode::update_mutator(TransitionTableIndex next_mutator,
                                  Weight w) const
{
    return TreeNode(this->string,
                    this->input_state,
                    next_mutator,
                    this->lexicon_state,
                    this->flag_state,
                    this->weight + w,
                    this->epsilon_steps + 1);
}

TreeNode TreeNode::update(SymbolNumber symbol,
                          unsigned int next_input,
                          TransitionTableIndex next_mutator,
                          TransitionTableIndex next_lexicon,
                          Weight w) const
{
    SymbolVector str(this->string);
    if (symbol != 0) {
        str.push_back(symbol);
    }
    return TreeNode(str,
                    next_input,
                    next_mutator,
                    next_lexicon,
                    this->flag_state,
                    this->weight + w,
                    next_input > this->input_state ? 0 : this->epsilon_steps + 1);
}

TreeNode TreeNode::finish(Weight final_weights) const
{
    TreeNode rv(*this);
    rv.weight += final_weights;
    rv.complete = true;
    return rv;
}

Speller::Speller(HfstTransducerPtr mutator_ptr, HfstTransducerPtr lexicon_ptr):
    mutator_(mutator_ptr),
    lexicon_(lexicon_ptr),
    identity_(checked_lexicon(lexicon_ptr).get_alphabet())
{
    build_alphabet_translator();
}

void Speller::build_alphabet_translator()
{
    const TransducerAlphabet& to = lexicon_->get_alphabet();
    output_keys = to.get_key_table();
    for (size_t i = 0; i < output_keys.size(); ++i) {
        identity_translator.push_back(static_cast<SymbolNumber>(i));
    }
    if (!mutator_) {
        return;
    }
    const KeyTable& from_keys = mutator_->get_alphabet().get_key_table();
    alphabet_translator.push_back(0); // zeroth element is always epsilon
    for (size_t i = 1; i < from_keys.size(); ++i) {
        const std::string& sym = from_keys[i];
        if (sym.empty()) {
            // flags and special symbols have no counterpart
            alphabet_translator.push_back(NO_SYMBOL);
            continue;
        }
        SymbolNumber lexicon_key = to.id_for_text(sym);
        if (lexicon_key == NO_SYMBOL) {
            // A symbol in the error source isn't present in the
            // lexicon, so it is numbered after the lexicon's symbols.
            if (output_keys.size() >= NO_SYMBOL) {
                throw AlphabetTranslationException(sym);
            }
            lexicon_key = static_cast<SymbolNumber>(output_keys.size());
            output_keys.push_back(sym);
        }
        alphabet_translator.push_back(lexicon_key);
    }
}

bool Speller::check(const std::string& word) const
{
    SpellerConfig config;
    config.case_handling = false;
    return check(word, config);
}

bool Speller::check(const std::string& word, const SpellerConfig& config) const
{
    std::vector<std::string> variants;
    if (config.case_handling) {
        variants = word_variants(word);
    } else {
        variants.push_back(word);
    }
    // no weight limits apply to plain acceptance
    SpellerConfig limits;
    limits.max_epsilon_steps = config.max_epsilon_steps;
    for (size_t i = 0; i < variants.size(); ++i) {
        Search search(identity_, *lexicon_, lexicon_->get_encoder(),
                      identity_translator, output_keys, Search::Check,
                      limits, NULL, NULL);
        if (!search.init_input(variants[i])) {
            continue;
        }
        search.run();
        if (search.is_accepted()) {
            return true;
        }
    }
    return false;
}

CorrectionResult Speller::correct_variant(const std::string& word,
                                          const SpellerConfig& config,
                                          const CancellationToken* cancel,
                                          const SearchClock::time_point* deadline) const
{
    CorrectionResult result;
    Search search(*mutator_, *lexicon_, mutator_->get_encoder(),
                  alphabet_translator, output_keys, Search::Correct,
                  config, cancel, deadline);
    // if input initialization fails, return empty corrections
    if (!search.init_input(word)) {
        return result;
    }
    result.status = search.run();
    result.corrections = search.get_results();
    result.stats = search.get_stats();
    return result;
}

CorrectionResult Speller::correct(const std::string& word,
                                  const SpellerConfig& config,
                                  const CancellationToken* cancel) const
{
    if (!mutator_) {
        return CorrectionResult();
    }
    SearchClock::time_point deadline_at;
    const SearchClock::time_point* deadline = NULL;
    if (config.time_cutoff > 0.0) {
        deadline_at = SearchClock::now() +
            std::chrono::duration_cast<SearchClock::duration>(
                std::chrono::duration<double>(config.time_cutoff));
        deadline = &deadline_at;
    }
    if (!config.case_handling) {
        return correct_variant(word, config, cancel, deadline);
    }

    // suggestions for every case variant, cased like the word itself
    CorrectionResult result;
    SuggestionRanker merged(config.n_best);
    bool all_caps = is_all_caps(word);
    bool first_caps = !all_caps && is_first_caps(word);
    std::vector<std::string> variants = word_variants(word);
    for (size_t i = 0; i < variants.size(); ++i) {
        CorrectionResult r = correct_variant(variants[i], config, cancel,
                                             deadline);
        result.stats += r.stats;
        for (StringWeightVector::const_iterator it = r.corrections.begin();
             it != r.corrections.end(); ++it) {
            if (all_caps) {
                merged.add(upper_case(it->first), it->second);
            } else if (first_caps) {
                merged.add(upper_first(it->first), it->second);
            } else {
                merged.add(it->first, it->second);
            }
        }
        if (r.status != Complete) {
            result.status = r.status;
            break;
        }
    }
    result.corrections = merged.results();
    return result;
}

StringWeightVector Speller::analyse(const std::string& word,
                                    const SpellerConfig& config) const
{
    std::vector<std::string> variants;
    if (config.case_handling) {
        variants = word_variants(word);
    } else {
        variants.push_back(word);
    }
    // analyses are written as the lexicon has them, so they are not re-cased
    SuggestionRanker merged;
    for (size_t i = 0; i < variants.size(); ++i) {
        Search search(identity_, *lexicon_, lexicon_->get_encoder(),
                      identity_translator, output_keys, Search::Lookup,
                      config, NULL, NULL);
        if (!search.init_input(variants[i])) {
            continue;
        }
        search.run();
        merged.add(search.get_results());
    }
    return merged.results();
}

bool Speller::can_correct() const
{
    return mutator_.get() != NULL;
}

const HfstTransducer& Speller::get_lexicon() const
{
    return *lexicon_;
}

const HfstTransducer* Speller::get_mutator() const
{
    return mutator_.get();
}

SymbolNumber Speller::get_state_size() const
{
    return lexicon_->get_state_size();
}

const SymbolVector& Speller::get_alphabet_translator() const
{
    return alphabet_translator;
}

const KeyTable& Speller::get_output_keys() const
{
    return output_keys;
}

} // namespace olspell
