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
/// \brief Categories used to classify a (truth,call) genotype comparison
///
/// The ordinal position of each TRUTH_STATE value is the column order used
/// when a concordance scheme row is populated, so the enumeration order below
/// must not change.
///

#pragma once

#include <string>


namespace TRUTH_STATE
{
/// Truth genotypes are normalized to at most two distinct alleles, so there
/// is no third/fourth allele category here.
enum index_t
{
    MISSING,        ///< truth genotype absent at this site
    HOM_REF,
    HET_REF_VAR1,
    HET_VAR1_VAR2,
    HOM_VAR1,
    NO_CALL,
    LOW_GQ,
    LOW_DP,
    VC_FILTERED,    ///< site filtered
    GT_FILTERED,    ///< sample genotype filtered
    IS_MIXED,
    SIZE
};

const char*
get_label(const index_t i);

/// set \p i to the state named by \p label
///
/// \return false if no state matches
bool
parse_label(const std::string& label, index_t& i);
}


namespace CALL_STATE
{
/// Superset in shape of TRUTH_STATE, the call set may report additional alternate
/// alleles at a site.
enum index_t
{
    MISSING,
    HOM_REF,
    HET_REF_VAR1,
    HET_REF_VAR2,
    HET_REF_VAR3,
    HET_VAR1_VAR2,
    HET_VAR1_VAR3,
    HET_VAR3_VAR4,
    HOM_VAR1,
    HOM_VAR2,
    HOM_VAR3,
    NO_CALL,
    LOW_GQ,
    LOW_DP,
    VC_FILTERED,
    GT_FILTERED,
    IS_MIXED,
    SIZE
};

const char*
get_label(const index_t i);

bool
parse_label(const std::string& label, index_t& i);
}


namespace CONTINGENCY_STATE
{
enum index_t
{
    TP,
    FP,
    TN,
    FN,
    EMPTY, ///< the tuple contributes nothing to any contingency count
    NA,    ///< the tuple should never be observed given upstream normalization
    SIZE
};

const char*
get_label(const index_t i);

bool
parse_label(const std::string& label, index_t& i);
}


/// every truth state has a call state of identical meaning
CALL_STATE::index_t
getCallStateForTruthState(const TRUTH_STATE::index_t truthState);
