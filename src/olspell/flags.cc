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

#include "flags.h"

namespace olspell {

bool try_apply(const FlagDiacriticOperation& op,
               const FlagDiacriticState& current,
               FlagDiacriticState& updated)
{
    SymbolNumber feature = op.Feature();
    if (feature >= current.size()) {
        return false;
    }
    short value = current[feature];
    short result = value;

    switch (op.Operation()) {

    case P: // positive set
        result = op.Value();
        break;

    case N: // negative set (literally, in this implementation)
        result = static_cast<short>(-1 * op.Value());
        break;

    case R: // require
        if (op.Value() == 0) { // "plain" require, fail if unset
            if (value == 0) {
                return false;
            }
        } else if (value != op.Value()) {
            return false;
        }
        break;

    case D: // disallow
        if (op.Value() == 0) { // "plain" disallow, fail if set
            if (value != 0) {
                return false;
            }
        } else if (value == op.Value()) {
            return false;
        }
        break;

    case C: // clear
        result = 0;
        break;

    case U: // unification
        /* if the feature is unset OR the feature is to this value already OR
           the feature is negatively set to something else than this value */
        if (value == 0 ||
            value == op.Value() ||
            (value < 0 && (value * -1 != op.Value()))) {
            result = op.Value();
        } else {
            return false;
        }
        break;
    }

    updated = current;
    updated[feature] = result;
    return true;
}

} // namespace olspell
