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

#include "GenotypeConcordanceStates.hh"

#include "common/Exceptions.hh"

#include <sstream>



/// shared handling for an enum value outside of its declared range
template <typename index_t>
static
void
throwInvalidState(
    const char* enumName,
    const index_t i)
{
    std::ostringstream oss;
    oss << "Invalid " << enumName << " value: " << static_cast<int>(i);
    BOOST_THROW_EXCEPTION(gtconcord::common::GeneralException(oss.str()));
}



/// linear search over the labels of an enumeration with a SIZE terminator
template <typename index_t>
static
bool
parseEnumLabel(
    const std::string& label,
    const char* (*labelFunc)(const index_t),
    const index_t size,
    index_t& i)
{
    for (int stateIndex(0); stateIndex<static_cast<int>(size); ++stateIndex)
    {
        const index_t state(static_cast<index_t>(stateIndex));
        if (label == labelFunc(state))
        {
            i = state;
            return true;
        }
    }
    return false;
}



namespace TRUTH_STATE
{

const char*
get_label(const index_t i)
{
    switch (i)
    {
    case MISSING:
        return "MISSING";
    case HOM_REF:
        return "HOM_REF";
    case HET_REF_VAR1:
        return "HET_REF_VAR1";
    case HET_VAR1_VAR2:
        return "HET_VAR1_VAR2";
    case HOM_VAR1:
        return "HOM_VAR1";
    case NO_CALL:
        return "NO_CALL";
    case LOW_GQ:
        return "LOW_GQ";
    case LOW_DP:
        return "LOW_DP";
    case VC_FILTERED:
        return "VC_FILTERED";
    case GT_FILTERED:
        return "GT_FILTERED";
    case IS_MIXED:
        return "IS_MIXED";
    case SIZE:
        break;
    }
    throwInvalidState("TRUTH_STATE", i);
    return nullptr;
}

bool
parse_label(const std::string& label, index_t& i)
{
    return parseEnumLabel(label, &get_label, SIZE, i);
}

}



namespace CALL_STATE
{

const char*
get_label(const index_t i)
{
    switch (i)
    {
    case MISSING:
        return "MISSING";
    case HOM_REF:
        return "HOM_REF";
    case HET_REF_VAR1:
        return "HET_REF_VAR1";
    case HET_REF_VAR2:
        return "HET_REF_VAR2";
    case HET_REF_VAR3:
        return "HET_REF_VAR3";
    case HET_VAR1_VAR2:
        return "HET_VAR1_VAR2";
    case HET_VAR1_VAR3:
        return "HET_VAR1_VAR3";
    case HET_VAR3_VAR4:
        return "HET_VAR3_VAR4";
    case HOM_VAR1:
        return "HOM_VAR1";
    case HOM_VAR2:
        return "HOM_VAR2";
    case HOM_VAR3:
        return "HOM_VAR3";
    case NO_CALL:
        return "NO_CALL";
    case LOW_GQ:
        return "LOW_GQ";
    case LOW_DP:
        return "LOW_DP";
    case VC_FILTERED:
        return "VC_FILTERED";
    case GT_FILTERED:
        return "GT_FILTERED";
    case IS_MIXED:
        return "IS_MIXED";
    case SIZE:
        break;
    }
    throwInvalidState("CALL_STATE", i);
    return nullptr;
}

bool
parse_label(const std::string& label, index_t& i)
{
    return parseEnumLabel(label, &get_label, SIZE, i);
}

}



namespace CONTINGENCY_STATE
{

const char*
get_label(const index_t i)
{
    switch (i)
    {
    case TP:
        return "TP";
    case FP:
        return "FP";
    case TN:
        return "TN";
    case FN:
        return "FN";
    case EMPTY:
        return "EMPTY";
    case NA:
        return "NA";
    case SIZE:
        break;
    }
    throwInvalidState("CONTINGENCY_STATE", i);
    return nullptr;
}

bool
parse_label(const std::string& label, index_t& i)
{
    return parseEnumLabel(label, &get_label, SIZE, i);
}

}



CALL_STATE::index_t
getCallStateForTruthState(const TRUTH_STATE::index_t truthState)
{
    switch (truthState)
    {
    case TRUTH_STATE::MISSING:
        return CALL_STATE::MISSING;
    case TRUTH_STATE::HOM_REF:
        return CALL_STATE::HOM_REF;
    case TRUTH_STATE::HET_REF_VAR1:
        return CALL_STATE::HET_REF_VAR1;
    case TRUTH_STATE::HET_VAR1_VAR2:
        return CALL_STATE::HET_VAR1_VAR2;
    case TRUTH_STATE::HOM_VAR1:
        return CALL_STATE::HOM_VAR1;
    case TRUTH_STATE::NO_CALL:
        return CALL_STATE::NO_CALL;
    case TRUTH_STATE::LOW_GQ:
        return CALL_STATE::LOW_GQ;
    case TRUTH_STATE::LOW_DP:
        return CALL_STATE::LOW_DP;
    case TRUTH_STATE::VC_FILTERED:
        return CALL_STATE::VC_FILTERED;
    case TRUTH_STATE::GT_FILTERED:
        return CALL_STATE::GT_FILTERED;
    case TRUTH_STATE::IS_MIXED:
        return CALL_STATE::IS_MIXED;
    case TRUTH_STATE::SIZE:
        break;
    }
    throwInvalidState("TRUTH_STATE", truthState);
    return CALL_STATE::SIZE;
}
