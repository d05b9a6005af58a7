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

#include "case-handling.h"

#include <algorithm>
#include <cwctype>

#include "hfst-ol.h"

namespace olspell {

namespace {

typedef std::vector<wint_t> CodePoints;

bool decode_utf8(const std::string& s, CodePoints& out)
{
    out.clear();
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        int n = nByte_utf8(c);
        if (n == 0 || i + n > s.size()) {
            return false;
        }
        wint_t cp = (n == 1) ? c : (c & (0xFF >> (n + 1)));
        for (int k = 1; k < n; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        out.push_back(cp);
        i += n;
    }
    return true;
}

void append_utf8(wint_t cp, std::string& out)
{
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string encode_utf8(const CodePoints& cps)
{
    std::string rv;
    for (size_t i = 0; i < cps.size(); ++i) {
        append_utf8(cps[i], rv);
    }
    return rv;
}

bool is_upper(wint_t c)
{
    return towlower(c) != c;
}

bool is_lower(wint_t c)
{
    return towupper(c) != c;
}

} // anonymous namespace

bool is_all_caps(const std::string& word)
{
    CodePoints cps;
    if (!decode_utf8(word, cps)) {
        return false;
    }
    bool seen_upper = false;
    for (size_t i = 0; i < cps.size(); ++i) {
        if (is_lower(cps[i])) {
            return false;
        }
        if (is_upper(cps[i])) {
            seen_upper = true;
        }
    }
    return seen_upper;
}

bool is_first_caps(const std::string& word)
{
    CodePoints cps;
    if (!decode_utf8(word, cps) || cps.empty()) {
        return false;
    }
    return is_upper(cps[0]);
}

std::string lower_case(const std::string& word)
{
    CodePoints cps;
    if (!decode_utf8(word, cps)) {
        return word;
    }
    for (size_t i = 0; i < cps.size(); ++i) {
        cps[i] = towlower(cps[i]);
    }
    return encode_utf8(cps);
}

std::string upper_case(const std::string& word)
{
    CodePoints cps;
    if (!decode_utf8(word, cps)) {
        return word;
    }
    for (size_t i = 0; i < cps.size(); ++i) {
        cps[i] = towupper(cps[i]);
    }
    return encode_utf8(cps);
}

std::string upper_first(const std::string& word)
{
    CodePoints cps;
    if (!decode_utf8(word, cps) || cps.empty()) {
        return word;
    }
    cps[0] = towupper(cps[0]);
    return encode_utf8(cps);
}

std::vector<std::string> word_variants(const std::string& word)
{
    std::vector<std::string> variants;
    variants.push_back(word);
    if (is_all_caps(word)) {
        std::string lower = lower_case(word);
        variants.push_back(upper_first(lower));
        variants.push_back(lower);
    } else if (is_first_caps(word)) {
        variants.push_back(lower_case(word));
    }
    std::vector<std::string> rv;
    for (size_t i = 0; i < variants.size(); ++i) {
        if (std::find(rv.begin(), rv.end(), variants[i]) == rv.end()) {
            rv.push_back(variants[i]);
        }
    }
    return rv;
}

} // namespace olspell
