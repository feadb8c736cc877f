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

#include "GenotypeConcordanceScheme.hh"

#include "common/Exceptions.hh"

#include <sstream>



namespace CONTINGENCY_ARRAY
{
using namespace CONTINGENCY_STATE;

const ContingencyStateArray NA       = {CONTINGENCY_STATE::NA};
const ContingencyStateArray EMPTY    = {CONTINGENCY_STATE::EMPTY};
const ContingencyStateArray TP_ONLY  = {TP};
const ContingencyStateArray FP_ONLY  = {FP};
const ContingencyStateArray TN_ONLY  = {TN};
const ContingencyStateArray FN_ONLY  = {FN};
const ContingencyStateArray TP_FN    = {TP, FN};
const ContingencyStateArray TP_FP    = {TP, FP};
const ContingencyStateArray TP_TN    = {TP, TN};
const ContingencyStateArray FP_FN    = {FP, FN};
const ContingencyStateArray FP_TN    = {FP, TN};
const ContingencyStateArray FP_TN_FN = {FP, TN, FN};
const ContingencyStateArray TP_FP_FN = {TP, FP, FN};
const ContingencyStateArray TN_FN    = {TN, FN};
}



void
GenotypeConcordanceScheme::
addRow(
    const CALL_STATE::index_t callState,
    const std::vector<ContingencyStateArray>& concordanceStateArrays)
{
    using namespace gtconcord::common;

    if (concordanceStateArrays.size() != static_cast<unsigned>(TRUTH_STATE::SIZE))
    {
        std::ostringstream oss;
        oss << "Length mismatch between concordance state arrays and truth states for call state row '"
            << CALL_STATE::get_label(callState) << "'. Found: " << concordanceStateArrays.size()
            << " expected: " << TRUTH_STATE::SIZE;
        BOOST_THROW_EXCEPTION(SchemeDefinitionException(oss.str()));
    }

    for (unsigned truthIndex(0); truthIndex<TRUTH_STATE::SIZE; ++truthIndex)
    {
        const TruthAndCallStates key(static_cast<TRUTH_STATE::index_t>(truthIndex), callState);

        // replace any earlier definition of this tuple
        _scheme.erase(key);
        _scheme.insert(std::make_pair(key, concordanceStateArrays[truthIndex]));
    }

    _isValidated = false;
}



const ContingencyStateArray*
GenotypeConcordanceScheme::
getConcordanceStateArray(
    const TruthAndCallStates& truthAndCallStates) const
{
    const auto iter(_scheme.find(truthAndCallStates));
    if (iter == _scheme.end()) return nullptr;
    return &(iter->second);
}



std::string
GenotypeConcordanceScheme::
getContingencyStateString(
    const TRUTH_STATE::index_t truthState,
    const CALL_STATE::index_t callState) const
{
    using namespace gtconcord::common;

    const TruthAndCallStates key(truthState, callState);
    const ContingencyStateArray* contingencyStateArrayPtr(getConcordanceStateArray(key));
    if (contingencyStateArrayPtr == nullptr)
    {
        std::ostringstream oss;
        oss << "Missing scheme tuple: " << key;
        BOOST_THROW_EXCEPTION(SchemeValidationException(oss.str()));
    }

    const ContingencyStateArray& contingencyStateArray(*contingencyStateArrayPtr);
    if (contingencyStateArray.empty() || (contingencyStateArray == CONTINGENCY_ARRAY::EMPTY))
    {
        return "EMPTY";
    }

    std::string result;
    bool isFirst(true);
    for (const CONTINGENCY_STATE::index_t contingencyState : contingencyStateArray)
    {
        if (! isFirst) result += ',';
        result += CONTINGENCY_STATE::get_label(contingencyState);
        isFirst = false;
    }
    return result;
}



std::set<CONTINGENCY_STATE::index_t>
GenotypeConcordanceScheme::
getContingencyStateSet(
    const ContingencyStateArray& contingencyStateArray)
{
    return std::set<CONTINGENCY_STATE::index_t>(contingencyStateArray.begin(), contingencyStateArray.end());
}



void
GenotypeConcordanceScheme::
validateScheme()
{
    using namespace gtconcord::common;

    if (_isValidated) return;

    for (unsigned truthIndex(0); truthIndex<TRUTH_STATE::SIZE; ++truthIndex)
    {
        for (unsigned callIndex(0); callIndex<CALL_STATE::SIZE; ++callIndex)
        {
            const TruthAndCallStates key(static_cast<TRUTH_STATE::index_t>(truthIndex),
                                         static_cast<CALL_STATE::index_t>(callIndex));
            if (_scheme.find(key) == _scheme.end())
            {
                std::ostringstream oss;
                oss << "Missing scheme tuple: " << key;
                BOOST_THROW_EXCEPTION(SchemeValidationException(oss.str()));
            }
        }
    }

    _isValidated = true;
}
