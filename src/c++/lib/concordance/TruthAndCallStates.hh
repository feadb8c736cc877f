//
// GTConcord - Genotype Concordance Scheme Library
// Copyright (c) 2009-2018 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

/// \file
/// \brief Key addressing one cell of a genotype concordance scheme
///

#pragma once

#include "GenotypeConcordanceStates.hh"

#include "gtc_util/thirdparty_push.h"

#include "boost/functional/hash.hpp"

#include "gtc_util/thirdparty_pop.h"

#include <iosfwd>


/// an immutable (truth state, call state) tuple
struct TruthAndCallStates
{
    TruthAndCallStates(
        const TRUTH_STATE::index_t initTruthState,
        const CALL_STATE::index_t initCallState)
        : truthState(initTruthState),
          callState(initCallState)
    {}

    bool
    operator==(const TruthAndCallStates& rhs) const
    {
        return ((truthState == rhs.truthState) && (callState == rhs.callState));
    }

    bool
    operator!=(const TruthAndCallStates& rhs) const
    {
        return (! (*this == rhs));
    }

    /// truth state is the primary sort key
    bool
    operator<(const TruthAndCallStates& rhs) const
    {
        if (truthState < rhs.truthState) return true;
        if (truthState != rhs.truthState) return false;
        return (callState < rhs.callState);
    }

    const TRUTH_STATE::index_t truthState;
    const CALL_STATE::index_t callState;
};


inline
std::size_t
hash_value(const TruthAndCallStates& key)
{
    std::size_t seed(0);
    boost::hash_combine(seed, static_cast<int>(key.truthState));
    boost::hash_combine(seed, static_cast<int>(key.callState));
    return seed;
}


/// print as "[TRUTH_STATE, CALL_STATE]"
std::ostream&
operator<<(std::ostream& os, const TruthAndCallStates& key);
