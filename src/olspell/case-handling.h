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

//! @file case-handling.h
//! @brief Letter case of UTF-8 word forms.
//!
//! Characters are mapped with towlower and towupper, so the results follow
//! the LC_CTYPE of the process. Strings that are not valid UTF-8 are
//! treated as having no letters.

#ifndef OLSPELL_CASE_HANDLING_H_
#define OLSPELL_CASE_HANDLING_H_ 1

#include "olspell-stdafx.h"

#include <string>
#include <vector>

namespace olspell
{

    //! @brief whether @a word has capitals and no lower case letters
    OLSPELL_API bool is_all_caps(const std::string& word);
    //! @brief whether @a word starts with a capital
    OLSPELL_API bool is_first_caps(const std::string& word);

    OLSPELL_API std::string lower_case(const std::string& word);
    OLSPELL_API std::string upper_case(const std::string& word);
    //! @brief @a word with its first character in upper case
    OLSPELL_API std::string upper_first(const std::string& word);

    //! @brief forms of @a word worth looking up, @a word itself first
    //!
    //! "ABC" gives "ABC", "Abc" and "abc"; "Abc" gives "Abc" and "abc";
    //! anything else gives just itself.
    OLSPELL_API std::vector<std::string> word_variants(const std::string& word);

} // namespace olspell

#endif // OLSPELL_CASE_HANDLING_H_
