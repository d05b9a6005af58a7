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

#include <gtest/gtest.h>

#include <string>

#include "hfst-ol.h"
#include "transducer-builder.h"

using namespace olspell;

namespace {

HfstTransducerPtr load(const std::string& bytes)
{
    return HfstTransducerPtr(new HfstTransducer(
        ByteBufferPtr(new MemoryBuffer(bytes))));
}

void patch_u16(std::string& bytes, size_t offset, uint16_t v)
{
    bytes[offset] = static_cast<char>(v & 0xFF);
    bytes[offset + 1] = static_cast<char>(v >> 8);
}

void patch_u32(std::string& bytes, size_t offset, uint32_t v)
{
    for (int i = 0; i < 4; ++i) {
        bytes[offset + i] = static_cast<char>((v >> (8 * i)) & 0xFF);
    }
}

TransducerBuilder cat_builder()
{
    TransducerBuilder builder;
    builder.add_word("cat", 0.5);
    return builder;
}

} // anonymous namespace

TEST(HeaderTest, reads_counts_and_alphabet)
{
    HfstTransducerPtr t = cat_builder().transducer();
    EXPECT_EQ(4, t->get_header().symbol_count());
    EXPECT_EQ(4, t->get_header().input_symbol_count());
    EXPECT_EQ(5u, t->get_header().index_table_size());
    EXPECT_TRUE(t->is_weighted());

    const TransducerAlphabet& alphabet = t->get_alphabet();
    EXPECT_EQ("", alphabet.get_key_table()[0]);
    EXPECT_EQ(1, alphabet.id_for_text("c"));
    EXPECT_EQ(2, alphabet.id_for_text("a"));
    EXPECT_EQ(NO_SYMBOL, alphabet.id_for_text("x"));
    EXPECT_EQ("t", alphabet.symbol_for_id(3));
    EXPECT_EQ(NO_SYMBOL, alphabet.get_unknown());
    EXPECT_EQ(NO_SYMBOL, alphabet.get_identity());
}

TEST(HeaderTest, accepts_hfst3_envelope)
{
    TransducerBuilder builder = cat_builder();
    builder.set_hfst3_type("HFST_OLW");
    HfstTransducerPtr t = builder.transducer();
    EXPECT_EQ(4, t->get_header().symbol_count());
}

TEST(HeaderTest, rejects_other_transducer_types)
{
    TransducerBuilder builder = cat_builder();
    builder.set_hfst3_type("FOMA");
    EXPECT_THROW(builder.transducer(), TransducerTypeException);
}

TEST(HeaderTest, rejects_truncated_header)
{
    std::string bytes = cat_builder().build();
    EXPECT_THROW(load(bytes.substr(0, 20)), HeaderParsingException);
}

TEST(HeaderTest, rejects_missing_buffer)
{
    EXPECT_THROW(HfstTransducerPtr(new HfstTransducer(ByteBufferPtr())),
                 HeaderParsingException);
}

TEST(HeaderTest, rejects_more_input_symbols_than_symbols)
{
    TransducerBuilder::Layout layout;
    std::string bytes = cat_builder().build(&layout);
    patch_u16(bytes, layout.header, 9);
    EXPECT_THROW(load(bytes), HeaderParsingException);
}

TEST(TableTest, rejects_truncated_tables)
{
    TransducerBuilder::Layout layout;
    std::string bytes = cat_builder().build(&layout);
    EXPECT_THROW(load(bytes.substr(0, layout.index_table + 3)),
                 IndexTableReadingException);
    EXPECT_THROW(load(bytes.substr(0, bytes.size() - 1)),
                 TransitionTableReadingException);
}

TEST(TableTest, rejects_transition_target_out_of_range)
{
    TransducerBuilder::Layout layout;
    std::string bytes = cat_builder().build(&layout);
    // row 1 is the arc on c from the start state
    patch_u32(bytes, layout.transition_table + WEIGHTED_TRANSITION_ROW_SIZE + 4,
              TARGET_TABLE + 1000);
    EXPECT_THROW(load(bytes), FormatError);
}

TEST(TableTest, rejects_index_target_out_of_range)
{
    TransducerBuilder::Layout layout;
    std::string bytes = cat_builder().build(&layout);
    // row 2 is the start state's entry for c, symbol 1
    patch_u32(bytes, layout.index_table + 2 * INDEX_ROW_SIZE + 2,
              TARGET_TABLE + 1000);
    EXPECT_THROW(load(bytes), IndexTableReadingException);
}

TEST(TableTest, rejects_symbol_out_of_range)
{
    TransducerBuilder::Layout layout;
    std::string bytes = cat_builder().build(&layout);
    patch_u16(bytes, layout.transition_table + WEIGHTED_TRANSITION_ROW_SIZE + 2, 50);
    EXPECT_THROW(load(bytes), TransitionTableReadingException);
}

TEST(TableTest, unweighted_tables_weigh_nothing)
{
    TransducerBuilder builder(false);
    builder.add_word("at", 3.0);
    HfstTransducerPtr t = builder.transducer();
    EXPECT_FALSE(t->is_weighted());
    TransitionTableIndex s = t->next(0, t->get_alphabet().id_for_text("a"));
    STransition arc = t->take_non_epsilons(s, 1);
    ASSERT_NE(NO_SYMBOL, arc.symbol);
    EXPECT_FLOAT_EQ(0.0, arc.weight);
}

TEST(AlphabetTest, parses_flag_diacritics)
{
    TransducerBuilder builder;
    unsigned int s1 = builder.add_state();
    unsigned int s2 = builder.add_state();
    builder.add_arc(0, "@P.CASE.nom@", "@P.CASE.nom@", s1);
    builder.add_arc(s1, "@U.NUM@", "@U.NUM@", s2);
    builder.set_final(s2);
    HfstTransducerPtr t = builder.transducer();
    const TransducerAlphabet& alphabet = t->get_alphabet();

    EXPECT_EQ(2, alphabet.get_state_size());
    SymbolNumber p = alphabet.id_for_text("@P.CASE.nom@");
    EXPECT_EQ(NO_SYMBOL, p); // flags are not text
    EXPECT_TRUE(alphabet.is_flag(1));
    EXPECT_EQ("", alphabet.get_key_table()[1]);

    FlagDiacriticOperation op;
    ASSERT_TRUE(alphabet.flag_spec(1, op));
    EXPECT_EQ(P, op.Operation());
    EXPECT_EQ("CASE", alphabet.feature_name(op.Feature()));
    EXPECT_EQ("nom", alphabet.value_name(op.Value()));

    ASSERT_TRUE(alphabet.flag_spec(2, op));
    EXPECT_EQ(U, op.Operation());
    EXPECT_EQ("NUM", alphabet.feature_name(op.Feature()));
    EXPECT_EQ(0, op.Value());
}

TEST(AlphabetTest, rejects_malformed_flags)
{
    TransducerBuilder unknown_op;
    unknown_op.add_arc(0, "@Q.X.a@", "@Q.X.a@", 0);
    EXPECT_THROW(unknown_op.transducer(), AlphabetParsingException);

    TransducerBuilder no_feature;
    no_feature.add_arc(0, "@P..a@", "@P..a@", 0);
    EXPECT_THROW(no_feature.transducer(), AlphabetParsingException);

    TransducerBuilder unterminated;
    unterminated.add_arc(0, "@R.X.a", "@R.X.a", 0);
    EXPECT_THROW(unterminated.transducer(), AlphabetParsingException);
}

TEST(AlphabetTest, recognises_special_symbols)
{
    TransducerBuilder builder;
    builder.set_final(0);
    builder.add_arc(0, "@_IDENTITY_SYMBOL_@", "@_IDENTITY_SYMBOL_@", 0);
    builder.add_arc(0, "@_UNKNOWN_SYMBOL_@", "@_UNKNOWN_SYMBOL_@", 0);
    HfstTransducerPtr t = builder.transducer();
    EXPECT_EQ(1, t->get_identity());
    EXPECT_EQ(2, t->get_unknown());
    EXPECT_EQ("", t->get_alphabet().get_key_table()[1]);
    EXPECT_EQ("@_IDENTITY_SYMBOL_@", t->get_alphabet().symbol_for_id(1));
}

TEST(AlphabetTest, rejects_duplicate_symbols)
{
    TransducerBuilder builder;
    builder.add_word("ab");
    TransducerBuilder::Layout layout;
    std::string bytes = builder.build(&layout);
    std::string needle("\0b\0", 3);
    size_t at = bytes.find(needle, layout.header);
    ASSERT_NE(std::string::npos, at);
    bytes[at + 1] = 'a';
    EXPECT_THROW(load(bytes), AlphabetParsingException);
}

TEST(EncoderTest, prefers_longest_symbol)
{
    TransducerBuilder builder;
    unsigned int s1 = builder.add_state();
    builder.add_arc(0, "a", "a", s1);
    builder.add_arc(0, "ab", "ab", s1);
    builder.set_final(s1);
    HfstTransducerPtr t = builder.transducer();
    const Encoder& encoder = t->get_encoder();

    std::string input("abc");
    const char* p = input.c_str();
    EXPECT_EQ(t->get_alphabet().id_for_text("ab"), encoder.find_key(&p));
    EXPECT_EQ(input.c_str() + 2, p);

    // c is not in the alphabet
    EXPECT_EQ(NO_SYMBOL, encoder.find_key(&p));
    EXPECT_EQ(input.c_str() + 2, p);

    std::string single("a");
    p = single.c_str();
    EXPECT_EQ(t->get_alphabet().id_for_text("a"), encoder.find_key(&p));
    EXPECT_EQ('\0', *p);
    EXPECT_EQ(NO_SYMBOL, encoder.find_key(&p));
}

TEST(Utf8Test, counts_bytes_from_lead_byte)
{
    EXPECT_EQ(1, nByte_utf8('a'));
    EXPECT_EQ(2, nByte_utf8(0xC3));
    EXPECT_EQ(3, nByte_utf8(0xE2));
    EXPECT_EQ(4, nByte_utf8(0xF0));
    EXPECT_EQ(0, nByte_utf8(0x80));
}
