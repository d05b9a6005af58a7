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

#ifndef OLSPELL_FLAGS_H_
#define OLSPELL_FLAGS_H_ 1

#include "hfst-ol.h"

#include <vector>

namespace olspell
{

//! @brief Values of all flag diacritic features along one path.
//!
//! One slot per feature: 0 is unset, a positive value is set to that value
//! and a negative value is set to anything but its absolute value.
typedef std::vector<short> FlagDiacriticState;

//! @brief Apply flag diacritic @a op to @a current.
//!
//! On success @a updated holds the resulting state and true is returned.
//! On failure @a updated is left untouched and the branch is to be pruned.
OLSPELL_API bool try_apply(const FlagDiacriticOperation& op,
                           const FlagDiacriticState& current,
                           FlagDiacriticState& updated);

} // namespace olspell

#endif // OLSPELL_FLAGS_H_
