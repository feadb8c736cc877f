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
/// \brief Mapping from each (truth,call) genotype state tuple to the contingency
/// table entries the tuple contributes to
///

#pragma once

#include "TruthAndCallStates.hh"

#include "gtc_util/thirdparty_push.h"

#include "boost/unordered_map.hpp"

#include "gtc_util/thirdparty_pop.h"

#include <cstddef>
#include <set>
#include <string>
#include <vector>


/// ordered contingency states for one scheme cell, a single comparison can
/// contribute to several contingency table entries
typedef std::vector<CONTINGENCY_STATE::index_t> ContingencyStateArray;


/// convenience values for defining a scheme row
///
/// NA means that such a tuple should never be observed.
namespace CONTINGENCY_ARRAY
{
extern const ContingencyStateArray NA;
extern const ContingencyStateArray EMPTY;
extern const ContingencyStateArray TP_ONLY;
extern const ContingencyStateArray FP_ONLY;
extern const ContingencyStateArray TN_ONLY;
extern const ContingencyStateArray FN_ONLY;
extern const ContingencyStateArray TP_FN;
extern const ContingencyStateArray TP_FP;
extern const ContingencyStateArray TP_TN;
extern const ContingencyStateArray FP_FN;
extern const ContingencyStateArray FP_TN;
extern const ContingencyStateArray FP_TN_FN;
extern const ContingencyStateArray TP_FP_FN;
extern const ContingencyStateArray TN_FN;
}


/// \brief Defines for each (truth,call) tuple the contingency table entries to which
/// the tuple should contribute
///
/// A scheme is populated one call state row at a time, validated once, and
/// afterwards only read. The const accessors are safe for concurrent readers
/// after the populated scheme has been handed off to them. The validation
/// flag is not a lock, concurrent validateScheme() calls may each rescan.
///
class GenotypeConcordanceScheme
{
public:
    typedef boost::unordered_map<TruthAndCallStates, ContingencyStateArray> scheme_t;

    /// add one row of the scheme
    ///
    /// \param callState the call state (row)
    /// \param concordanceStateArrays contingency states for each truth state, in TRUTH_STATE order
    ///
    /// Throws SchemeDefinitionException if the number of arrays is not TRUTH_STATE::SIZE.
    void
    addRow(
        const CALL_STATE::index_t callState,
        const std::vector<ContingencyStateArray>& concordanceStateArrays);

    /// \return the contingency states of the tuple, or nullptr if the tuple has not been added
    const ContingencyStateArray*
    getConcordanceStateArray(
        const TRUTH_STATE::index_t truthState,
        const CALL_STATE::index_t callState) const
    {
        return getConcordanceStateArray(TruthAndCallStates(truthState, callState));
    }

    const ContingencyStateArray*
    getConcordanceStateArray(
        const TruthAndCallStates& truthAndCallStates) const;

    /// get the contingency states of the tuple as a parse-able string, eg. "TP,FN"
    ///
    /// The empty case is always written as "EMPTY".
    std::string
    getContingencyStateString(
        const TRUTH_STATE::index_t truthState,
        const CALL_STATE::index_t callState) const;

    /// distinct contingency states, input order and duplicates are not significant
    static
    std::set<CONTINGENCY_STATE::index_t>
    getContingencyStateSet(
        const ContingencyStateArray& contingencyStateArray);

    /// check that all (truth,call) tuples exist in the scheme
    ///
    /// Throws SchemeValidationException naming the first missing tuple. After
    /// one successful check repeated calls return immediately.
    void
    validateScheme();

    bool
    isValidated() const
    {
        return _isValidated;
    }

    std::size_t
    size() const
    {
        return _scheme.size();
    }

private:
    scheme_t _scheme;
    bool _isValidated = false;
};
